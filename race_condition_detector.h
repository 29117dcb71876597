#ifndef RACE_CONDITION_DETECTOR_H
#define RACE_CONDITION_DETECTOR_H

#include <map>
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <variant>
#include <optional>
#include <string_view>

#include "timing_profile.h"
#include "connection_state.h"

namespace hsguard
{

enum class pattern_severity : std::uint8_t
{
    kWarning,
    kCritical,
};

[[nodiscard]] std::string_view to_string(pattern_severity severity);

namespace pattern_type
{
constexpr const char* TIMING_VIOLATION = "timing_violation";
constexpr const char* PREMATURE_MESSAGE_HANDLING = "premature_message_handling";
constexpr const char* HANDSHAKE_FAILURE = "handshake_failure";
constexpr const char* HANDSHAKE_TIMEOUT = "handshake_timeout";
constexpr const char* CONNECTION_VALIDATION_FAILED = "connection_validation_failed";
}    // namespace pattern_type

using pattern_value = std::variant<std::string, std::int64_t, double, bool>;
using pattern_details = std::map<std::string, pattern_value>;

struct race_condition_pattern
{
    std::string type;
    pattern_severity severity = pattern_severity::kWarning;
    std::string environment;
    pattern_details details;
    std::chrono::system_clock::time_point detected_at;
};

// Unset fields match everything; set fields are combined with AND.
struct pattern_filter
{
    std::optional<std::chrono::system_clock::time_point> since;
    std::optional<std::string> type;
    std::optional<pattern_severity> severity;
};

struct pattern_summary
{
    std::size_t total_patterns = 0;
    std::map<std::string, std::size_t> counts_by_type;
    std::map<std::string, std::size_t> counts_by_severity;
    std::size_t recent_count = 0;
    std::string environment;
    timing_profile timing_thresholds;
};

/**
 * Diagnostic engine for handshake timing, usually one instance per
 * environment shared by every connection of that environment.
 *
 * All operations are synchronous and never throw on bad input: anything that
 * cannot be interpreted is logged and treated as "no violation". The pattern
 * collection only shrinks through clear_old_patterns() and reset_patterns().
 */
class race_condition_detector
{
   public:
    static constexpr auto kRecentWindow = std::chrono::minutes(5);
    static constexpr auto kDefaultMaxPatternAge = std::chrono::hours(24);

    explicit race_condition_detector(std::string_view environment);

    race_condition_detector(const race_condition_detector&) = delete;
    race_condition_detector& operator=(const race_condition_detector&) = delete;

    [[nodiscard]] const std::string& environment() const { return environment_; }
    [[nodiscard]] const timing_profile& profile() const { return *profile_; }

    [[nodiscard]] std::chrono::milliseconds calculate_progressive_delay(int attempt) const;

    bool detect_timing_violation(std::chrono::steady_clock::time_point start,
                                 std::chrono::steady_clock::time_point end,
                                 std::chrono::steady_clock::duration expected_max);

    bool validate_connection_readiness(connection_state state);

    void add_detected_pattern(std::string type, pattern_severity severity = pattern_severity::kWarning, pattern_details details = {});

    [[nodiscard]] std::vector<race_condition_pattern> detected_patterns(const pattern_filter& filter = {}) const;

    [[nodiscard]] pattern_summary summary() const;
    // recent_count covers patterns detected within kRecentWindow before `now`.
    [[nodiscard]] pattern_summary summary(std::chrono::system_clock::time_point now) const;

    [[nodiscard]] std::size_t pattern_count() const;

    // Returns the number of evicted patterns.
    std::size_t clear_old_patterns(std::chrono::system_clock::duration max_age = kDefaultMaxPatternAge);

    void reset_patterns();

   private:
    std::string environment_;
    const timing_profile* profile_;
    mutable std::mutex mutex_;
    std::deque<race_condition_pattern> patterns_;
};

[[nodiscard]] std::string format_pattern_details(const pattern_details& details);

}    // namespace hsguard

#endif
