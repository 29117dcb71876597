#ifndef LOG_CONTEXT_H
#define LOG_CONTEXT_H

#include <chrono>
#include <string>
#include <cstdint>
#include <utility>

namespace hsguard
{

namespace log_event
{
constexpr const char* HANDSHAKE = "handshake";
constexpr const char* TRANSITION = "transition";
constexpr const char* READINESS = "readiness";
constexpr const char* PATTERN = "pattern";
constexpr const char* TIMEOUT = "timeout";
}    // namespace log_event

[[nodiscard]] std::string generate_trace_id();

class connection_context
{
   public:
    [[nodiscard]] std::string prefix() const;

    [[nodiscard]] double duration_seconds() const;

    void new_trace_id();

    [[nodiscard]] const std::string& trace_id() const { return trace_id_; }
    void trace_id(std::string value) { trace_id_ = std::move(value); }

    [[nodiscard]] std::uint32_t conn_id() const { return conn_id_; }
    void conn_id(const std::uint32_t value) { conn_id_ = value; }

    [[nodiscard]] const std::string& remote_addr() const { return remote_addr_; }
    void remote_addr(std::string value) { remote_addr_ = std::move(value); }

   private:
    std::string trace_id_;
    std::uint32_t conn_id_ = 0;
    std::string remote_addr_;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

[[nodiscard]] double to_milliseconds(std::chrono::steady_clock::duration duration);

[[nodiscard]] std::string format_latency_ms(std::chrono::steady_clock::duration duration);

}    // namespace hsguard

#endif
