#ifndef TIMING_PROFILE_H
#define TIMING_PROFILE_H

#include <chrono>
#include <string>
#include <cstdint>
#include <string_view>

namespace hsguard
{

enum class environment_kind : std::uint8_t
{
    kTesting,
    kDevelopment,
    kStaging,
    kProduction,
};

struct timing_profile
{
    environment_kind kind = environment_kind::kDevelopment;
    std::string environment = "development";
    // Suspension between HANDSHAKE_PENDING and CONNECTED.
    std::chrono::milliseconds handshake_delay{0};
    // Extra suspension before READY_FOR_MESSAGES, cloud environments only.
    std::chrono::milliseconds stabilization_delay{0};
    // Minimum gap a dispatcher leaves after the gate opens before the first delivery.
    std::chrono::milliseconds message_delay{0};
    std::chrono::milliseconds handshake_timeout{0};
};

[[nodiscard]] std::string_view to_string(environment_kind kind);

[[nodiscard]] std::string normalize_environment(std::string_view environment);

// Unknown names classify as development.
[[nodiscard]] environment_kind classify_environment(std::string_view environment);

[[nodiscard]] const timing_profile& get_timing_profile(environment_kind kind);
[[nodiscard]] const timing_profile& get_timing_profile(std::string_view environment);

[[nodiscard]] bool is_cloud_environment(environment_kind kind);
[[nodiscard]] bool is_cloud_environment(std::string_view environment);

// Configured name first, then the ENVIRONMENT variable, then development.
[[nodiscard]] std::string resolve_environment(std::string_view configured);

/**
 * Backoff a caller waits before retrying attempt `attempt` (0-based).
 * staging/production grow linearly by 25ms per attempt, testing is a flat
 * 5ms and every other environment a flat 10ms. Negative attempts count as 0.
 */
[[nodiscard]] std::chrono::milliseconds progressive_delay(environment_kind kind, int attempt);
[[nodiscard]] std::chrono::milliseconds progressive_delay(std::string_view environment, int attempt);

}    // namespace hsguard

#endif
