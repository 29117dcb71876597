#ifndef CONNECTION_STATE_H
#define CONNECTION_STATE_H

#include <chrono>
#include <vector>
#include <cstdint>
#include <string_view>

namespace hsguard
{

enum class connection_state : std::uint8_t
{
    kInitializing,
    kHandshakePending,
    kConnected,
    kReadyForMessages,
    kError,
    kClosed,
};

[[nodiscard]] std::string_view to_string(connection_state state);

// ERROR and CLOSED.
[[nodiscard]] bool is_terminal_state(connection_state state);

[[nodiscard]] bool is_transition_allowed(connection_state from, connection_state to);

struct state_transition
{
    connection_state from = connection_state::kInitializing;
    connection_state to = connection_state::kInitializing;
    std::chrono::steady_clock::time_point at;
};

/**
 * Append-only readiness state log for a single connection.
 *
 * transition() records whatever it is given; edge rules are only checked by
 * the out-of-band validate_state_sequence() audit. Single writer.
 */
class state_machine
{
   public:
    state_machine();

    const state_transition& transition(connection_state to);

    [[nodiscard]] connection_state current() const { return current_; }

    [[nodiscard]] bool is_ready_for_messages() const { return current_ == connection_state::kReadyForMessages; }

    [[nodiscard]] const std::vector<state_transition>& history() const { return history_; }

    [[nodiscard]] bool validate_state_sequence() const;

    // Same check as validate_state_sequence(), without logging.
    [[nodiscard]] bool is_sequence_valid() const;

    void reset();

   private:
    connection_state current_ = connection_state::kInitializing;
    std::vector<state_transition> history_;
};

}    // namespace hsguard

#endif
