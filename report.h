#ifndef REPORT_H
#define REPORT_H

#include <string>
#include <vector>

#include "handshake_coordinator.h"
#include "race_condition_detector.h"

namespace hsguard
{

[[nodiscard]] std::string dump_pattern_summary(const pattern_summary& summary);
[[nodiscard]] std::string dump_patterns(const std::vector<race_condition_pattern>& patterns);
[[nodiscard]] std::string dump_coordination_summary(const coordination_summary& summary);

}    // namespace hsguard

#endif
