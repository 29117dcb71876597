#include <chrono>
#include <string>
#include <cstdint>
#include <utility>
#include <variant>
#include <exception>
#include <optional>
#include <string_view>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>

#include "log.h"
#include "log_context.h"
#include "handshake_coordinator.h"
#include "race_condition_detector.h"

namespace hsguard
{

handshake_coordinator::handshake_coordinator(const std::string_view environment, connection_context ctx, race_condition_detector* detector)
    : environment_(normalize_environment(environment)), profile_(get_timing_profile(environment)), ctx_(std::move(ctx)), detector_(detector)
{
    if (environment_.empty())
    {
        environment_ = profile_.environment;
    }
}

handshake_coordinator::handshake_coordinator(const timing_profile& profile, connection_context ctx, race_condition_detector* detector)
    : environment_(profile.environment), profile_(profile), ctx_(std::move(ctx)), detector_(detector)
{
}

boost::asio::awaitable<bool> handshake_coordinator::coordinate_handshake()
{
    if (machine_.current() != connection_state::kInitializing)
    {
        LOG_CTX_WARN(ctx_, "{} coordinate rejected state {} environment {}", log_event::HANDSHAKE, to_string(machine_.current()), environment_);
        co_return false;
    }

    started_at_ = std::chrono::steady_clock::now();
    finished_at_.reset();
    LOG_CTX_DEBUG(ctx_,
                  "{} start environment {} delay {}ms stabilization {}ms",
                  log_event::HANDSHAKE,
                  environment_,
                  profile_.handshake_delay.count(),
                  profile_.stabilization_delay.count());

    try
    {
        record_transition(connection_state::kHandshakePending);

        if (const auto ec = co_await suspend(profile_.handshake_delay); ec)
        {
            fail_handshake(ec.message());
            co_return false;
        }
        record_transition(connection_state::kConnected);

        if (is_cloud_environment(profile_.kind))
        {
            if (const auto ec = co_await suspend(profile_.stabilization_delay); ec)
            {
                fail_handshake(ec.message());
                co_return false;
            }
        }
        record_transition(connection_state::kReadyForMessages);
    }
    catch (...)
    {
        fail_handshake(exception_reason(std::current_exception()));
        co_return false;
    }

    finished_at_ = machine_.history().back().at;
    const auto elapsed = *finished_at_ - *started_at_;
    LOG_CTX_INFO(ctx_, "{} ready environment {} duration {}", log_event::HANDSHAKE, environment_, format_latency_ms(elapsed));
    if (detector_ != nullptr)
    {
        (void)detector_->detect_timing_violation(*started_at_, *finished_at_, profile_.handshake_timeout);
    }
    co_return true;
}

boost::asio::awaitable<bool> handshake_coordinator::coordinate_handshake_with_timeout()
{
    using boost::asio::experimental::awaitable_operators::operator||;

    auto handshake_or_timeout = co_await (coordinate_handshake() || suspend(profile_.handshake_timeout));
    if (handshake_or_timeout.index() == 0)
    {
        co_return std::get<0>(handshake_or_timeout);
    }

    const auto wait_ec = std::get<1>(handshake_or_timeout);
    if (wait_ec)
    {
        LOG_CTX_WARN(ctx_, "{} timeout wait failed {} state {}", log_event::TIMEOUT, wait_ec.message(), to_string(machine_.current()));
        co_return false;
    }

    LOG_CTX_WARN(ctx_,
                 "{} handshake exceeded {}ms environment {} state {}",
                 log_event::TIMEOUT,
                 profile_.handshake_timeout.count(),
                 environment_,
                 to_string(machine_.current()));
    if (detector_ != nullptr)
    {
        detector_->add_detected_pattern(pattern_type::HANDSHAKE_TIMEOUT,
                                        pattern_severity::kWarning,
                                        {{"connection", ctx_.prefix()},
                                         {"timeout_ms", static_cast<std::int64_t>(profile_.handshake_timeout.count())},
                                         {"state", std::string(to_string(machine_.current()))}});
    }
    co_return false;
}

std::optional<std::chrono::steady_clock::duration> handshake_coordinator::handshake_duration() const
{
    if (!started_at_.has_value())
    {
        return std::nullopt;
    }
    if (finished_at_.has_value())
    {
        return *finished_at_ - *started_at_;
    }
    return std::chrono::steady_clock::now() - *started_at_;
}

bool handshake_coordinator::validate_state_sequence() const
{
    const bool valid = machine_.validate_state_sequence();
    if (!valid)
    {
        LOG_CTX_ERROR(ctx_, "{} state sequence invalid environment {} transitions {}", log_event::TRANSITION, environment_, machine_.history().size());
    }
    return valid;
}

void handshake_coordinator::force_error_state(const std::string_view reason)
{
    LOG_CTX_WARN(ctx_, "{} forced error from {} reason {}", log_event::TRANSITION, to_string(machine_.current()), reason);
    record_transition(connection_state::kError);
    if (started_at_.has_value() && !finished_at_.has_value())
    {
        finished_at_ = machine_.history().back().at;
    }
}

void handshake_coordinator::reset()
{
    LOG_CTX_DEBUG(ctx_, "{} reset from {}", log_event::TRANSITION, to_string(machine_.current()));
    machine_.reset();
    started_at_.reset();
    finished_at_.reset();
}

coordination_summary handshake_coordinator::summary() const
{
    return coordination_summary{
        .connection = ctx_.prefix(),
        .environment = environment_,
        .current_state = machine_.current(),
        .ready = machine_.is_ready_for_messages(),
        .transition_count = machine_.history().size(),
        .handshake_duration = handshake_duration(),
        .sequence_valid = machine_.is_sequence_valid(),
        .timing = profile_,
    };
}

boost::asio::awaitable<boost::system::error_code> handshake_coordinator::suspend(const std::chrono::milliseconds delay)
{
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor);
    timer.expires_after(delay);
    const auto [wait_ec] = co_await timer.async_wait(boost::asio::as_tuple(boost::asio::use_awaitable));
    co_return wait_ec;
}

void handshake_coordinator::record_transition(const connection_state to)
{
    const auto& entry = machine_.transition(to);
    const auto elapsed = started_at_.has_value() ? entry.at - *started_at_ : std::chrono::steady_clock::duration::zero();
    LOG_CTX_INFO(ctx_,
                 "{} {} -> {} environment {} elapsed {}",
                 log_event::TRANSITION,
                 to_string(entry.from),
                 to_string(entry.to),
                 environment_,
                 format_latency_ms(elapsed));
}

void handshake_coordinator::fail_handshake(const std::string_view reason)
{
    const auto failed_in = machine_.current();
    record_transition(connection_state::kError);
    finished_at_ = machine_.history().back().at;
    LOG_CTX_ERROR(ctx_, "{} failed in {} environment {} reason {}", log_event::HANDSHAKE, to_string(failed_in), environment_, reason);
    if (detector_ != nullptr)
    {
        detector_->add_detected_pattern(pattern_type::HANDSHAKE_FAILURE,
                                        pattern_severity::kWarning,
                                        {{"connection", ctx_.prefix()}, {"failed_in", std::string(to_string(failed_in))}, {"reason", std::string(reason)}});
    }
}

std::string exception_reason(const std::exception_ptr& error)
{
    if (!error)
    {
        return "no exception";
    }
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception& e)
    {
        return e.what();
    }
    catch (...)
    {
        return "unknown exception";
    }
}

bool validate_connection_with_race_detection(const handshake_coordinator& coordinator, race_condition_detector& detector)
{
    if (coordinator.is_ready_for_messages())
    {
        return true;
    }
    detector.add_detected_pattern(pattern_type::CONNECTION_VALIDATION_FAILED,
                                  pattern_severity::kWarning,
                                  {{"connection", coordinator.context().prefix()}, {"state", std::string(to_string(coordinator.current_state()))}});
    return false;
}

}    // namespace hsguard
