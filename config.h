#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <cstdint>
#include <optional>
#include <expected>

namespace hsguard
{

struct config
{
    // Empty means: ENVIRONMENT variable, then development.
    std::string environment;

    struct log_t
    {
        std::string level = "info";
        std::string file = "hsguard.log";
    } log;

    struct detector_t
    {
        std::uint32_t pattern_max_age_hours = 24;
        std::uint32_t sweep_interval_sec = 60;
    } detector;

    struct probe_t
    {
        std::uint32_t connections = 16;
        std::uint32_t workers = 2;
        std::uint32_t max_attempts = 3;
    } probe;
};

struct config_error
{
    std::string path = "/";
    std::string reason;
};

[[nodiscard]] constexpr std::uint32_t normalize_workers(const std::uint32_t workers) { return (workers == 0) ? 1U : workers; }

[[nodiscard]] std::expected<config, config_error> parse_config_with_error(const std::string& filename);
[[nodiscard]] std::expected<config, config_error> deserialize_config_with_error(const std::string& text);
[[nodiscard]] std::optional<config> parse_config(const std::string& filename);
[[nodiscard]] std::string dump_config(const config& cfg);
[[nodiscard]] std::string dump_default_config();

}    // namespace hsguard

#endif
