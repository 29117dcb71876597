#include <chrono>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "log.h"
#include "connection_state.h"

namespace hsguard
{

namespace
{

// A full successful handshake plus one failure/close edge.
constexpr std::size_t kExpectedTransitions = 5;

enum class sequence_fault : std::uint8_t
{
    kNone,
    kBroken,
    kNotAllowed,
    kOutOfOrder,
};

struct sequence_check
{
    sequence_fault fault = sequence_fault::kNone;
    std::size_t index = 0;
    connection_state expected_from = connection_state::kInitializing;
};

sequence_check check_sequence(const std::vector<state_transition>& history)
{
    auto expected_from = connection_state::kInitializing;
    for (std::size_t i = 0; i < history.size(); ++i)
    {
        const auto& entry = history[i];
        if (entry.from != expected_from)
        {
            return {.fault = sequence_fault::kBroken, .index = i, .expected_from = expected_from};
        }
        if (!is_transition_allowed(entry.from, entry.to))
        {
            return {.fault = sequence_fault::kNotAllowed, .index = i, .expected_from = expected_from};
        }
        if (i > 0 && entry.at < history[i - 1].at)
        {
            return {.fault = sequence_fault::kOutOfOrder, .index = i, .expected_from = expected_from};
        }
        expected_from = entry.to;
    }
    return {};
}

}    // namespace

std::string_view to_string(const connection_state state)
{
    switch (state)
    {
        case connection_state::kInitializing:
            return "INITIALIZING";
        case connection_state::kHandshakePending:
            return "HANDSHAKE_PENDING";
        case connection_state::kConnected:
            return "CONNECTED";
        case connection_state::kReadyForMessages:
            return "READY_FOR_MESSAGES";
        case connection_state::kError:
            return "ERROR";
        case connection_state::kClosed:
            return "CLOSED";
    }
    return "UNKNOWN";
}

bool is_terminal_state(const connection_state state) { return state == connection_state::kError || state == connection_state::kClosed; }

bool is_transition_allowed(const connection_state from, const connection_state to)
{
    switch (from)
    {
        case connection_state::kInitializing:
            return to == connection_state::kHandshakePending || to == connection_state::kError || to == connection_state::kClosed;
        case connection_state::kHandshakePending:
            return to == connection_state::kConnected || to == connection_state::kError || to == connection_state::kClosed;
        case connection_state::kConnected:
            return to == connection_state::kReadyForMessages || to == connection_state::kError || to == connection_state::kClosed;
        case connection_state::kReadyForMessages:
            return to == connection_state::kError || to == connection_state::kClosed;
        case connection_state::kError:
            return to == connection_state::kClosed;
        case connection_state::kClosed:
            return false;
    }
    return false;
}

state_machine::state_machine() { history_.reserve(kExpectedTransitions); }

const state_transition& state_machine::transition(const connection_state to)
{
    history_.push_back({.from = current_, .to = to, .at = std::chrono::steady_clock::now()});
    current_ = to;
    return history_.back();
}

bool state_machine::validate_state_sequence() const
{
    const auto check = check_sequence(history_);
    switch (check.fault)
    {
        case sequence_fault::kNone:
            return true;
        case sequence_fault::kBroken:
            LOG_WARN("state sequence broken at {} expected from {} got {}",
                     check.index,
                     to_string(check.expected_from),
                     to_string(history_[check.index].from));
            break;
        case sequence_fault::kNotAllowed:
            LOG_WARN("state sequence invalid at {} transition {} -> {} not allowed",
                     check.index,
                     to_string(history_[check.index].from),
                     to_string(history_[check.index].to));
            break;
        case sequence_fault::kOutOfOrder:
            LOG_WARN("state sequence out of order at {}", check.index);
            break;
    }
    return false;
}

bool state_machine::is_sequence_valid() const { return check_sequence(history_).fault == sequence_fault::kNone; }

void state_machine::reset()
{
    history_.clear();
    current_ = connection_state::kInitializing;
}

}    // namespace hsguard
