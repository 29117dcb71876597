#include <chrono>
#include <random>
#include <string>
#include <cstdint>
#include <cstdio>
#include <charconv>
#include <system_error>

#include "log_context.h"

namespace hsguard
{
namespace
{

template <typename IntT>
void append_int(std::string& out, const IntT value)
{
    char buf[32];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec == std::errc())
    {
        out.append(buf, ptr);
    }
}

std::string fixed_hex_16(std::uint64_t value)
{
    char buf[16];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, 16);
    if (ec != std::errc())
    {
        return "0000000000000000";
    }

    const auto len = static_cast<std::size_t>(ptr - buf);
    std::string out;
    out.reserve(16);
    out.append(16 - len, '0');
    out.append(buf, len);
    return out;
}

}    // namespace

std::string generate_trace_id()
{
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;
    return fixed_hex_16(dist(gen));
}

std::string connection_context::prefix() const
{
    std::string out;
    out.reserve(trace_id_.size() + remote_addr_.size() + 32);
    if (!trace_id_.empty())
    {
        out.push_back('t');
        out += trace_id_;
        out.push_back(' ');
    }
    out.push_back('c');
    append_int(out, conn_id_);
    if (!remote_addr_.empty())
    {
        out.push_back('@');
        out += remote_addr_;
    }
    return out;
}

double connection_context::duration_seconds() const
{
    const auto now = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_);
    return static_cast<double>(duration.count()) / 1000.0;
}

void connection_context::new_trace_id() { trace_id_ = generate_trace_id(); }

double to_milliseconds(const std::chrono::steady_clock::duration duration)
{
    return std::chrono::duration<double, std::milli>(duration).count();
}

std::string format_latency_ms(const std::chrono::steady_clock::duration duration)
{
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%.2fms", to_milliseconds(duration));
    return std::string(buf);
}

}    // namespace hsguard
