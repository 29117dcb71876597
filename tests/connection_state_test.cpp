#include <cstddef>

#include <gtest/gtest.h>

#include "connection_state.h"

namespace hsguard
{

TEST(ConnectionStateTest, StartsInitializingWithEmptyHistory)
{
    state_machine machine;
    EXPECT_EQ(machine.current(), connection_state::kInitializing);
    EXPECT_TRUE(machine.history().empty());
    EXPECT_FALSE(machine.is_ready_for_messages());
    EXPECT_TRUE(machine.validate_state_sequence());
}

TEST(ConnectionStateTest, TransitionAppendsAndTracksCurrent)
{
    state_machine machine;
    const auto& first = machine.transition(connection_state::kHandshakePending);
    EXPECT_EQ(first.from, connection_state::kInitializing);
    EXPECT_EQ(first.to, connection_state::kHandshakePending);

    machine.transition(connection_state::kConnected);
    machine.transition(connection_state::kReadyForMessages);

    ASSERT_EQ(machine.history().size(), 3U);
    EXPECT_EQ(machine.current(), machine.history().back().to);
    for (std::size_t i = 1; i < machine.history().size(); ++i)
    {
        EXPECT_EQ(machine.history()[i].from, machine.history()[i - 1].to);
        EXPECT_LE(machine.history()[i - 1].at, machine.history()[i].at);
    }
    EXPECT_TRUE(machine.is_ready_for_messages());
    EXPECT_TRUE(machine.validate_state_sequence());
}

TEST(ConnectionStateTest, ReadyOnlyInReadyForMessages)
{
    for (const auto state : {connection_state::kInitializing,
                             connection_state::kHandshakePending,
                             connection_state::kConnected,
                             connection_state::kError,
                             connection_state::kClosed})
    {
        state_machine machine;
        machine.transition(state);
        EXPECT_FALSE(machine.is_ready_for_messages()) << to_string(state);
    }
}

TEST(ConnectionStateTest, TransitionDoesNotEnforceEdges)
{
    state_machine machine;
    machine.transition(connection_state::kReadyForMessages);
    EXPECT_EQ(machine.current(), connection_state::kReadyForMessages);
    EXPECT_TRUE(machine.is_ready_for_messages());
    EXPECT_FALSE(machine.validate_state_sequence());
}

TEST(ConnectionStateTest, AuditRejectsLeavingClosed)
{
    state_machine machine;
    machine.transition(connection_state::kClosed);
    EXPECT_TRUE(machine.validate_state_sequence());
    machine.transition(connection_state::kError);
    EXPECT_FALSE(machine.validate_state_sequence());
}

TEST(ConnectionStateTest, ErrorThenClosedIsValid)
{
    state_machine machine;
    machine.transition(connection_state::kHandshakePending);
    machine.transition(connection_state::kError);
    machine.transition(connection_state::kClosed);
    EXPECT_TRUE(machine.validate_state_sequence());
    EXPECT_TRUE(is_terminal_state(machine.current()));
}

TEST(ConnectionStateTest, SilentCheckAgreesWithAudit)
{
    state_machine machine;
    EXPECT_TRUE(machine.is_sequence_valid());
    machine.transition(connection_state::kHandshakePending);
    machine.transition(connection_state::kConnected);
    EXPECT_TRUE(machine.is_sequence_valid());
    EXPECT_TRUE(machine.validate_state_sequence());

    machine.transition(connection_state::kInitializing);
    EXPECT_FALSE(machine.is_sequence_valid());
    EXPECT_FALSE(machine.validate_state_sequence());

    machine.reset();
    EXPECT_TRUE(machine.is_sequence_valid());
}

TEST(ConnectionStateTest, AllowedEdges)
{
    EXPECT_TRUE(is_transition_allowed(connection_state::kInitializing, connection_state::kHandshakePending));
    EXPECT_TRUE(is_transition_allowed(connection_state::kInitializing, connection_state::kError));
    EXPECT_TRUE(is_transition_allowed(connection_state::kInitializing, connection_state::kClosed));
    EXPECT_FALSE(is_transition_allowed(connection_state::kInitializing, connection_state::kConnected));
    EXPECT_FALSE(is_transition_allowed(connection_state::kInitializing, connection_state::kReadyForMessages));

    EXPECT_TRUE(is_transition_allowed(connection_state::kHandshakePending, connection_state::kConnected));
    EXPECT_FALSE(is_transition_allowed(connection_state::kHandshakePending, connection_state::kReadyForMessages));

    EXPECT_TRUE(is_transition_allowed(connection_state::kConnected, connection_state::kReadyForMessages));
    EXPECT_FALSE(is_transition_allowed(connection_state::kConnected, connection_state::kHandshakePending));

    EXPECT_TRUE(is_transition_allowed(connection_state::kReadyForMessages, connection_state::kError));
    EXPECT_TRUE(is_transition_allowed(connection_state::kReadyForMessages, connection_state::kClosed));
    EXPECT_FALSE(is_transition_allowed(connection_state::kReadyForMessages, connection_state::kConnected));

    EXPECT_TRUE(is_transition_allowed(connection_state::kError, connection_state::kClosed));
    EXPECT_FALSE(is_transition_allowed(connection_state::kError, connection_state::kError));
    EXPECT_FALSE(is_transition_allowed(connection_state::kError, connection_state::kReadyForMessages));

    for (const auto to : {connection_state::kInitializing,
                          connection_state::kHandshakePending,
                          connection_state::kConnected,
                          connection_state::kReadyForMessages,
                          connection_state::kError,
                          connection_state::kClosed})
    {
        EXPECT_FALSE(is_transition_allowed(connection_state::kClosed, to));
    }
}

TEST(ConnectionStateTest, ResetClearsHistory)
{
    state_machine machine;
    machine.transition(connection_state::kHandshakePending);
    machine.transition(connection_state::kError);
    machine.reset();
    EXPECT_EQ(machine.current(), connection_state::kInitializing);
    EXPECT_TRUE(machine.history().empty());
    EXPECT_TRUE(machine.validate_state_sequence());
}

TEST(ConnectionStateTest, StateNames)
{
    EXPECT_EQ(to_string(connection_state::kInitializing), "INITIALIZING");
    EXPECT_EQ(to_string(connection_state::kHandshakePending), "HANDSHAKE_PENDING");
    EXPECT_EQ(to_string(connection_state::kConnected), "CONNECTED");
    EXPECT_EQ(to_string(connection_state::kReadyForMessages), "READY_FOR_MESSAGES");
    EXPECT_EQ(to_string(connection_state::kError), "ERROR");
    EXPECT_EQ(to_string(connection_state::kClosed), "CLOSED");
}

}    // namespace hsguard
