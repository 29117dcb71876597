#include <array>
#include <cctype>
#include <chrono>
#include <string>
#include <cstdint>
#include <cstdlib>
#include <string_view>

#include "timing_profile.h"

namespace hsguard
{

namespace
{

using std::chrono::milliseconds;

const std::array<timing_profile, 4> kProfiles = {{
    {.kind = environment_kind::kTesting,
     .environment = "testing",
     .handshake_delay = milliseconds(5),
     .stabilization_delay = milliseconds(0),
     .message_delay = milliseconds(1),
     .handshake_timeout = milliseconds(100)},
    {.kind = environment_kind::kDevelopment,
     .environment = "development",
     .handshake_delay = milliseconds(10),
     .stabilization_delay = milliseconds(0),
     .message_delay = milliseconds(5),
     .handshake_timeout = milliseconds(200)},
    {.kind = environment_kind::kStaging,
     .environment = "staging",
     .handshake_delay = milliseconds(100),
     .stabilization_delay = milliseconds(25),
     .message_delay = milliseconds(50),
     .handshake_timeout = milliseconds(500)},
    {.kind = environment_kind::kProduction,
     .environment = "production",
     .handshake_delay = milliseconds(100),
     .stabilization_delay = milliseconds(25),
     .message_delay = milliseconds(50),
     .handshake_timeout = milliseconds(1000)},
}};

constexpr milliseconds kCloudBackoffStep = milliseconds(25);
constexpr milliseconds kTestingBackoff = milliseconds(5);
constexpr milliseconds kDefaultBackoff = milliseconds(10);

constexpr std::string_view kWhitespace = " \t\r\n";

}    // namespace

std::string_view to_string(const environment_kind kind)
{
    switch (kind)
    {
        case environment_kind::kTesting:
            return "testing";
        case environment_kind::kDevelopment:
            return "development";
        case environment_kind::kStaging:
            return "staging";
        case environment_kind::kProduction:
            return "production";
    }
    return "development";
}

std::string normalize_environment(std::string_view environment)
{
    const auto first = environment.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = environment.find_last_not_of(kWhitespace);
    environment = environment.substr(first, last - first + 1);

    std::string normalized;
    normalized.reserve(environment.size());
    for (const char ch : environment)
    {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return normalized;
}

environment_kind classify_environment(const std::string_view environment)
{
    const auto normalized = normalize_environment(environment);
    for (const auto& profile : kProfiles)
    {
        if (normalized == profile.environment)
        {
            return profile.kind;
        }
    }
    return environment_kind::kDevelopment;
}

const timing_profile& get_timing_profile(const environment_kind kind)
{
    for (const auto& profile : kProfiles)
    {
        if (profile.kind == kind)
        {
            return profile;
        }
    }
    return kProfiles[1];
}

const timing_profile& get_timing_profile(const std::string_view environment) { return get_timing_profile(classify_environment(environment)); }

bool is_cloud_environment(const environment_kind kind) { return kind == environment_kind::kStaging || kind == environment_kind::kProduction; }

bool is_cloud_environment(const std::string_view environment) { return is_cloud_environment(classify_environment(environment)); }

std::string resolve_environment(const std::string_view configured)
{
    auto environment = normalize_environment(configured);
    if (!environment.empty())
    {
        return environment;
    }
    const char* from_env = std::getenv("ENVIRONMENT");
    if (from_env != nullptr)
    {
        environment = normalize_environment(from_env);
        if (!environment.empty())
        {
            return environment;
        }
    }
    return std::string(to_string(environment_kind::kDevelopment));
}

std::chrono::milliseconds progressive_delay(const environment_kind kind, const int attempt)
{
    const int index = attempt < 0 ? 0 : attempt;
    switch (kind)
    {
        case environment_kind::kStaging:
        case environment_kind::kProduction:
            return kCloudBackoffStep * (static_cast<std::int64_t>(index) + 1);
        case environment_kind::kTesting:
            return kTestingBackoff;
        case environment_kind::kDevelopment:
            return kDefaultBackoff;
    }
    return kDefaultBackoff;
}

std::chrono::milliseconds progressive_delay(const std::string_view environment, const int attempt)
{
    return progressive_delay(classify_environment(environment), attempt);
}

}    // namespace hsguard
