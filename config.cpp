#include <cerrno>
#include <cstdio>
#include <string>
#include <cstdint>
#include <cstring>
#include <utility>
#include <expected>
#include <optional>

#include "log.h"
#include "config.h"
#include "reflect.h"
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/error/error.h"

namespace hsguard::reflect
{

template <typename Vis>
void reflect(Vis& vis, config::log_t& v)
{
    reflectMemberStart(vis);
    reflectMember(vis, "level", v.level);
    reflectMember(vis, "file", v.file);
    reflectMemberEnd(vis);
}

template <typename Vis>
void reflect(Vis& vis, config::detector_t& v)
{
    reflectMemberStart(vis);
    reflectMember(vis, "pattern_max_age_hours", v.pattern_max_age_hours);
    reflectMember(vis, "sweep_interval_sec", v.sweep_interval_sec);
    reflectMemberEnd(vis);
}

template <typename Vis>
void reflect(Vis& vis, config::probe_t& v)
{
    reflectMemberStart(vis);
    reflectMember(vis, "connections", v.connections);
    reflectMember(vis, "workers", v.workers);
    reflectMember(vis, "max_attempts", v.max_attempts);
    reflectMemberEnd(vis);
}

template <typename Vis>
void reflect(Vis& vis, config& v)
{
    reflectMemberStart(vis);
    reflectMember(vis, "environment", v.environment);
    reflectMember(vis, "log", v.log);
    reflectMember(vis, "detector", v.detector);
    reflectMember(vis, "probe", v.probe);
    reflectMemberEnd(vis);
}

}    // namespace hsguard::reflect

namespace hsguard
{

namespace
{

[[nodiscard]] config_error make_config_error(std::string path, std::string reason)
{
    config_error error;
    error.path = std::move(path);
    error.reason = std::move(reason);
    return error;
}

[[nodiscard]] std::expected<void, config_error> validate_log_config(const config::log_t& log)
{
    if (!is_known_log_level(log.level))
    {
        return std::unexpected(make_config_error("/log/level", "must be one of trace debug info warn warning err error"));
    }
    if (log.file.empty())
    {
        return std::unexpected(make_config_error("/log/file", "must be non-empty"));
    }
    return {};
}

[[nodiscard]] std::expected<void, config_error> validate_detector_config(const config::detector_t& detector)
{
    if (detector.pattern_max_age_hours == 0)
    {
        return std::unexpected(make_config_error("/detector/pattern_max_age_hours", "must be greater than 0"));
    }
    if (detector.sweep_interval_sec == 0)
    {
        return std::unexpected(make_config_error("/detector/sweep_interval_sec", "must be greater than 0"));
    }
    return {};
}

[[nodiscard]] std::expected<void, config_error> validate_probe_config(const config::probe_t& probe)
{
    if (probe.connections == 0)
    {
        return std::unexpected(make_config_error("/probe/connections", "must be greater than 0"));
    }
    if (probe.max_attempts == 0)
    {
        return std::unexpected(make_config_error("/probe/max_attempts", "must be greater than 0"));
    }
    return {};
}

[[nodiscard]] std::expected<void, config_error> validate_config(const config& cfg)
{
    if (const auto log_result = validate_log_config(cfg.log); !log_result)
    {
        return std::unexpected(log_result.error());
    }
    if (const auto detector_result = validate_detector_config(cfg.detector); !detector_result)
    {
        return std::unexpected(detector_result.error());
    }
    if (const auto probe_result = validate_probe_config(cfg.probe); !probe_result)
    {
        return std::unexpected(probe_result.error());
    }
    return {};
}

[[nodiscard]] std::expected<std::string, config_error> read_file(const std::string& filename)
{
    char buf[64 * 1024] = {0};
    std::string result;
    FILE* f = fopen(filename.c_str(), "rb");
    if (f == nullptr)
    {
        return std::unexpected(make_config_error("/", std::string("open file failed: ") + std::strerror(errno)));
    }
    for (;;)
    {
        const std::size_t n = fread(buf, 1, sizeof buf, f);
        if (n > 0)
        {
            result.append(buf, n);
        }
        if (n < sizeof buf)
        {
            if (ferror(f) != 0)
            {
                fclose(f);
                return std::unexpected(make_config_error("/", std::string("read file failed: ") + std::strerror(errno)));
            }
            break;
        }
    }
    fclose(f);
    return result;
}

}    // namespace

std::expected<config, config_error> deserialize_config_with_error(const std::string& text)
{
    if (const auto nul_pos = text.find('\0'); nul_pos != std::string::npos)
    {
        return std::unexpected(make_config_error("/", "json parse error at offset " + std::to_string(nul_pos) + ": embedded nul byte"));
    }
    rapidjson::Document reader;
    const rapidjson::ParseResult parse_result = reader.Parse(text.data(), text.size());
    if (parse_result.IsError())
    {
        return std::unexpected(make_config_error(
            "/", "json parse error at offset " + std::to_string(parse_result.Offset()) + ": " + rapidjson::GetParseError_En(parse_result.Code())));
    }

    config cfg;
    reflect::JsonReader json_reader{&reader};
    reflect::reflect(json_reader, cfg);
    if (!json_reader.ok())
    {
        return std::unexpected(make_config_error(json_reader.getPath(), "invalid type or value"));
    }

    cfg.probe.workers = normalize_workers(cfg.probe.workers);
    if (const auto validate_result = validate_config(cfg); !validate_result)
    {
        return std::unexpected(validate_result.error());
    }
    return cfg;
}

std::expected<config, config_error> parse_config_with_error(const std::string& filename)
{
    const auto file_content = read_file(filename);
    if (!file_content)
    {
        return std::unexpected(file_content.error());
    }
    return deserialize_config_with_error(*file_content);
}

std::optional<config> parse_config(const std::string& filename)
{
    const auto parsed = parse_config_with_error(filename);
    if (!parsed)
    {
        LOG_ERROR("parse config {} failed path {} reason {}", filename, parsed.error().path, parsed.error().reason);
        return std::nullopt;
    }
    return *parsed;
}

std::string dump_config(const config& cfg) { return reflect::serialize_struct(cfg); }

std::string dump_default_config() { return dump_config(config{}); }

}    // namespace hsguard
