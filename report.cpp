#include <chrono>
#include <string>
#include <vector>
#include <cstdint>
#include <variant>
#include <optional>
#include <string_view>
#include <type_traits>

#include "report.h"
#include "reflect.h"
#include "log_context.h"

namespace hsguard::reflect
{

inline void reflect(JsonWriter& vis, std::chrono::milliseconds& v) { vis.int64(static_cast<std::int64_t>(v.count())); }

inline void reflect(JsonWriter& vis, pattern_value& v)
{
    std::visit(
        [&vis](auto& value)
        {
            using value_type = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<value_type, std::string>)
            {
                vis.string(value);
            }
            else if constexpr (std::is_same_v<value_type, bool>)
            {
                vis.boolean(value);
            }
            else if constexpr (std::is_same_v<value_type, double>)
            {
                vis.double_(value);
            }
            else
            {
                vis.int64(value);
            }
        },
        v);
}

void reflect(JsonWriter& vis, timing_profile& v)
{
    vis.startObject();
    reflectMember(vis, "environment", v.environment);
    reflectMember(vis, "handshake_delay_ms", v.handshake_delay);
    reflectMember(vis, "stabilization_delay_ms", v.stabilization_delay);
    reflectMember(vis, "message_delay_ms", v.message_delay);
    reflectMember(vis, "handshake_timeout_ms", v.handshake_timeout);
    vis.endObject();
}

void reflect(JsonWriter& vis, pattern_summary& v)
{
    vis.startObject();
    reflectMember(vis, "total_patterns", v.total_patterns);
    reflectMember(vis, "counts_by_type", v.counts_by_type);
    reflectMember(vis, "counts_by_severity", v.counts_by_severity);
    reflectMember(vis, "recent_count", v.recent_count);
    reflectMember(vis, "environment", v.environment);
    reflectMember(vis, "timing_thresholds", v.timing_thresholds);
    vis.endObject();
}

void reflect(JsonWriter& vis, race_condition_pattern& v)
{
    auto severity = to_string(v.severity);
    auto detected_at_ms = std::chrono::duration_cast<std::chrono::milliseconds>(v.detected_at.time_since_epoch()).count();
    vis.startObject();
    reflectMember(vis, "type", v.type);
    reflectMember(vis, "severity", severity);
    reflectMember(vis, "environment", v.environment);
    reflectMember(vis, "details", v.details);
    reflectMember(vis, "detected_at_ms", detected_at_ms);
    vis.endObject();
}

void reflect(JsonWriter& vis, coordination_summary& v)
{
    auto state = to_string(v.current_state);
    std::optional<double> duration_ms;
    if (v.handshake_duration.has_value())
    {
        duration_ms = to_milliseconds(*v.handshake_duration);
    }
    vis.startObject();
    reflectMember(vis, "connection", v.connection);
    reflectMember(vis, "environment", v.environment);
    reflectMember(vis, "current_state", state);
    reflectMember(vis, "ready", v.ready);
    reflectMember(vis, "transition_count", v.transition_count);
    reflectMember(vis, "handshake_duration_ms", duration_ms);
    reflectMember(vis, "sequence_valid", v.sequence_valid);
    reflectMember(vis, "timing", v.timing);
    vis.endObject();
}

}    // namespace hsguard::reflect

namespace hsguard
{

std::string dump_pattern_summary(const pattern_summary& summary) { return reflect::serialize_struct(summary); }

std::string dump_patterns(const std::vector<race_condition_pattern>& patterns) { return reflect::serialize_struct(patterns); }

std::string dump_coordination_summary(const coordination_summary& summary) { return reflect::serialize_struct(summary); }

}    // namespace hsguard
