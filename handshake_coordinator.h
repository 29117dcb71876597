#ifndef HANDSHAKE_COORDINATOR_H
#define HANDSHAKE_COORDINATOR_H

#include <chrono>
#include <string>
#include <vector>
#include <cstddef>
#include <exception>
#include <optional>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/system/error_code.hpp>

#include "log_context.h"
#include "timing_profile.h"
#include "connection_state.h"

namespace hsguard
{

class race_condition_detector;

struct coordination_summary
{
    std::string connection;
    std::string environment;
    connection_state current_state = connection_state::kInitializing;
    bool ready = false;
    std::size_t transition_count = 0;
    std::optional<std::chrono::steady_clock::duration> handshake_duration;
    bool sequence_valid = true;
    timing_profile timing;
};

/**
 * Drives one accepted connection from INITIALIZING to READY_FOR_MESSAGES.
 *
 * The dispatcher must not deliver anything until is_ready_for_messages()
 * returns true. Failures, cancellation included, always end in ERROR and are
 * reported as `false`; retrying is the caller's job, with a fresh coordinator
 * after progressive_delay().
 *
 * One coordination routine per instance, and the instance must outlive it.
 * The detector, when given, is owned elsewhere and shared between coordinators.
 */
class handshake_coordinator
{
   public:
    explicit handshake_coordinator(std::string_view environment, connection_context ctx = {}, race_condition_detector* detector = nullptr);

    // Custom calibration, e.g. measured latencies of a new deployment target.
    explicit handshake_coordinator(const timing_profile& profile, connection_context ctx = {}, race_condition_detector* detector = nullptr);

    handshake_coordinator(const handshake_coordinator&) = delete;
    handshake_coordinator& operator=(const handshake_coordinator&) = delete;

    boost::asio::awaitable<bool> coordinate_handshake();

    // Same as coordinate_handshake(), bounded by the profile's handshake timeout.
    boost::asio::awaitable<bool> coordinate_handshake_with_timeout();

    [[nodiscard]] bool is_ready_for_messages() const { return machine_.is_ready_for_messages(); }

    [[nodiscard]] connection_state current_state() const { return machine_.current(); }

    [[nodiscard]] const std::vector<state_transition>& state_history() const { return machine_.history(); }

    [[nodiscard]] std::optional<std::chrono::steady_clock::duration> handshake_duration() const;

    [[nodiscard]] bool validate_state_sequence() const;

    // Administrative escape hatch, skips edge rules.
    void force_error_state(std::string_view reason);

    void reset();

    [[nodiscard]] coordination_summary summary() const;

    [[nodiscard]] const std::string& environment() const { return environment_; }
    [[nodiscard]] const timing_profile& profile() const { return profile_; }
    [[nodiscard]] const connection_context& context() const { return ctx_; }

   private:
    boost::asio::awaitable<boost::system::error_code> suspend(std::chrono::milliseconds delay);
    void record_transition(connection_state to);
    void fail_handshake(std::string_view reason);

   private:
    std::string environment_;
    timing_profile profile_;
    connection_context ctx_;
    race_condition_detector* detector_ = nullptr;
    state_machine machine_;
    std::optional<std::chrono::steady_clock::time_point> started_at_;
    std::optional<std::chrono::steady_clock::time_point> finished_at_;
};

// Failure reason recorded when coordination throws; non-std exceptions map to "unknown exception".
[[nodiscard]] std::string exception_reason(const std::exception_ptr& error);

// Readiness gate for dispatch paths, recording a pattern whenever it is closed.
bool validate_connection_with_race_detection(const handshake_coordinator& coordinator, race_condition_detector& detector);

}    // namespace hsguard

#endif
