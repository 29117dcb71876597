#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include <cstdio>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <variant>
#include <charconv>
#include <type_traits>
#include <string_view>
#include <system_error>

#include "log.h"
#include "log_context.h"
#include "race_condition_detector.h"

namespace hsguard
{

namespace
{

void append_value(std::string& out, const pattern_value& value)
{
    std::visit(
        [&out](const auto& v)
        {
            using value_type = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<value_type, std::string>)
            {
                out += v;
            }
            else if constexpr (std::is_same_v<value_type, bool>)
            {
                out += v ? "true" : "false";
            }
            else if constexpr (std::is_same_v<value_type, double>)
            {
                char buf[48];
                std::snprintf(buf, sizeof(buf), "%.2f", v);
                out += buf;
            }
            else
            {
                char buf[32];
                const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
                if (ec == std::errc())
                {
                    out.append(buf, ptr);
                }
            }
        },
        value);
}

[[nodiscard]] bool matches(const race_condition_pattern& pattern, const pattern_filter& filter)
{
    if (filter.since.has_value() && pattern.detected_at < *filter.since)
    {
        return false;
    }
    if (filter.type.has_value() && pattern.type != *filter.type)
    {
        return false;
    }
    if (filter.severity.has_value() && pattern.severity != *filter.severity)
    {
        return false;
    }
    return true;
}

}    // namespace

std::string_view to_string(const pattern_severity severity)
{
    switch (severity)
    {
        case pattern_severity::kWarning:
            return "warning";
        case pattern_severity::kCritical:
            return "critical";
    }
    return "warning";
}

std::string format_pattern_details(const pattern_details& details)
{
    std::string out;
    for (const auto& [key, value] : details)
    {
        if (!out.empty())
        {
            out.push_back(' ');
        }
        out += key;
        out.push_back('=');
        append_value(out, value);
    }
    return out;
}

race_condition_detector::race_condition_detector(const std::string_view environment)
    : environment_(normalize_environment(environment)), profile_(&get_timing_profile(environment))
{
    if (environment_.empty())
    {
        environment_ = std::string(to_string(environment_kind::kDevelopment));
    }
    LOG_INFO("{} detector created environment {} profile {}", log_event::PATTERN, environment_, profile_->environment);
}

std::chrono::milliseconds race_condition_detector::calculate_progressive_delay(const int attempt) const
{
    return progressive_delay(profile_->kind, attempt);
}

bool race_condition_detector::detect_timing_violation(const std::chrono::steady_clock::time_point start,
                                                      const std::chrono::steady_clock::time_point end,
                                                      const std::chrono::steady_clock::duration expected_max)
{
    if (end < start)
    {
        LOG_WARN("{} timing check ignored end precedes start by {}", log_event::PATTERN, format_latency_ms(start - end));
        return false;
    }
    if (expected_max < std::chrono::steady_clock::duration::zero())
    {
        LOG_WARN("{} timing check ignored negative expected max {}", log_event::PATTERN, format_latency_ms(expected_max));
        return false;
    }

    const auto actual = end - start;
    if (actual <= expected_max)
    {
        return false;
    }

    const double actual_ms = to_milliseconds(actual);
    const double expected_ms = to_milliseconds(expected_max);
    add_detected_pattern(pattern_type::TIMING_VIOLATION,
                         pattern_severity::kWarning,
                         {{"actual_duration_ms", actual_ms}, {"expected_max_ms", expected_ms}, {"overshoot_ms", actual_ms - expected_ms}});
    return true;
}

bool race_condition_detector::validate_connection_readiness(const connection_state state)
{
    switch (state)
    {
        case connection_state::kReadyForMessages:
            return true;
        case connection_state::kInitializing:
        case connection_state::kHandshakePending:
            add_detected_pattern(pattern_type::PREMATURE_MESSAGE_HANDLING, pattern_severity::kCritical, {{"state", std::string(to_string(state))}});
            return false;
        case connection_state::kConnected:
        case connection_state::kError:
        case connection_state::kClosed:
            LOG_DEBUG("{} connection not ready state {}", log_event::READINESS, to_string(state));
            return false;
    }
    return false;
}

void race_condition_detector::add_detected_pattern(std::string type, const pattern_severity severity, pattern_details details)
{
    race_condition_pattern pattern{
        .type = std::move(type),
        .severity = severity,
        .environment = environment_,
        .details = std::move(details),
        .detected_at = std::chrono::system_clock::now(),
    };

    if (severity == pattern_severity::kCritical)
    {
        LOG_ERROR("{} {} {} environment {} {}",
                  log_event::PATTERN,
                  to_string(severity),
                  pattern.type,
                  pattern.environment,
                  format_pattern_details(pattern.details));
    }
    else
    {
        LOG_INFO("{} {} {} environment {} {}",
                 log_event::PATTERN,
                 to_string(severity),
                 pattern.type,
                 pattern.environment,
                 format_pattern_details(pattern.details));
    }

    const std::scoped_lock lock(mutex_);
    patterns_.push_back(std::move(pattern));
}

std::vector<race_condition_pattern> race_condition_detector::detected_patterns(const pattern_filter& filter) const
{
    std::vector<race_condition_pattern> result;
    const std::scoped_lock lock(mutex_);
    for (const auto& pattern : patterns_)
    {
        if (matches(pattern, filter))
        {
            result.push_back(pattern);
        }
    }
    return result;
}

pattern_summary race_condition_detector::summary() const { return summary(std::chrono::system_clock::now()); }

pattern_summary race_condition_detector::summary(const std::chrono::system_clock::time_point now) const
{
    pattern_summary result;
    result.environment = environment_;
    result.timing_thresholds = *profile_;

    const auto recent_cutoff = now - kRecentWindow;
    const std::scoped_lock lock(mutex_);
    result.total_patterns = patterns_.size();
    for (const auto& pattern : patterns_)
    {
        ++result.counts_by_type[pattern.type];
        ++result.counts_by_severity[std::string(to_string(pattern.severity))];
        if (pattern.detected_at >= recent_cutoff)
        {
            ++result.recent_count;
        }
    }
    return result;
}

std::size_t race_condition_detector::pattern_count() const
{
    const std::scoped_lock lock(mutex_);
    return patterns_.size();
}

std::size_t race_condition_detector::clear_old_patterns(const std::chrono::system_clock::duration max_age)
{
    const auto cutoff = std::chrono::system_clock::now() - max_age;
    std::size_t removed = 0;
    {
        const std::scoped_lock lock(mutex_);
        removed = std::erase_if(patterns_, [cutoff](const race_condition_pattern& pattern) { return pattern.detected_at < cutoff; });
    }
    if (removed > 0)
    {
        LOG_INFO("{} cleared {} patterns older than {}s", log_event::PATTERN, removed, std::chrono::duration_cast<std::chrono::seconds>(max_age).count());
    }
    return removed;
}

void race_condition_detector::reset_patterns()
{
    const std::scoped_lock lock(mutex_);
    patterns_.clear();
}

}    // namespace hsguard
