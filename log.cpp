#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>
#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "log.h"

namespace hsguard
{

namespace
{

struct level_alias
{
    const char* name;
    spdlog::level::level_enum value;
};

constexpr level_alias kLevels[] = {
    {.name = "trace", .value = spdlog::level::trace},
    {.name = "debug", .value = spdlog::level::debug},
    {.name = "info", .value = spdlog::level::info},
    {.name = "warn", .value = spdlog::level::warn},
    {.name = "warning", .value = spdlog::level::warn},
    {.name = "err", .value = spdlog::level::err},
    {.name = "error", .value = spdlog::level::err},
};

constexpr std::uint32_t kDefaultLogFileSize = 50 * 1024 * 1024;
constexpr std::uint32_t kDefaultLogFileCount = 5;

std::optional<spdlog::level::level_enum> find_level(const std::string_view level)
{
    for (const auto& entry : kLevels)
    {
        if (level == entry.name)
        {
            return entry.value;
        }
    }
    return std::nullopt;
}

std::uint32_t env_uint(const char* name, const std::uint32_t fallback)
{
    const char* text = std::getenv(name);
    if (text == nullptr)
    {
        return fallback;
    }
    const std::string_view view(text);
    std::uint32_t value = 0;
    const auto [end, ec] = std::from_chars(view.data(), view.data() + view.size(), value);
    if (ec != std::errc() || end != view.data() + view.size() || value == 0)
    {
        return fallback;
    }
    return value;
}

void init_default_log(const std::string& filename)
{
    const std::uint32_t file_size = env_uint("HSGUARD_LOG_FILE_SIZE", kDefaultLogFileSize);
    const std::uint32_t file_count = env_uint("HSGUARD_LOG_FILE_COUNT", kDefaultLogFileCount);
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filename, file_size, file_count));
    auto logger = std::make_shared<spdlog::logger>("", begin(sinks), end(sinks));
    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(3));
    spdlog::set_pattern("%Y%m%d %T.%f %t %L %v %s:%#");
}

void set_level_from_env()
{
    spdlog::set_level(spdlog::level::info);
    if (std::getenv("TRACE") != nullptr)
    {
        spdlog::set_level(spdlog::level::trace);
    }
    else if (std::getenv("DEBUG") != nullptr)
    {
        spdlog::set_level(spdlog::level::debug);
    }
}

}    // namespace

void init_log(const std::string& filename)
{
    init_default_log(filename);

    set_level_from_env();
}

void set_level(const std::string& level) { spdlog::set_level(find_level(level).value_or(spdlog::level::info)); }

void shutdown_log()
{
    spdlog::default_logger()->flush();
    spdlog::shutdown();
}

bool is_known_log_level(const std::string_view level) { return find_level(level).has_value(); }

}    // namespace hsguard
