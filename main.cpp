#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <cstdio>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <utility>
#include <exception>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>

#include "log.h"
#include "config.h"
#include "report.h"
#include "log_context.h"
#include "timing_profile.h"
#include "handshake_coordinator.h"
#include "race_condition_detector.h"

namespace
{

using strand_type = boost::asio::strand<boost::asio::io_context::executor_type>;

struct probe_slot
{
    explicit probe_slot(boost::asio::io_context& io_context) : strand(boost::asio::make_strand(io_context)) {}

    strand_type strand;
    boost::asio::cancellation_signal stop_signal;
};

struct probe_state
{
    std::atomic<std::uint32_t> ready = {0};
    std::atomic<std::uint32_t> failed = {0};
    std::atomic<std::uint32_t> outstanding = {0};
    std::atomic<bool> stop_requested = {false};
};

void print_usage(const char* prog)
{
    std::fputs("Usage:\n", stdout);
    std::fprintf(stdout, "%s -c <config>  Probe handshake readiness with configuration file\n", prog);
    std::fprintf(stdout, "%s config       Dump default configuration\n", prog);
}

boost::asio::awaitable<bool> wait_for(const std::chrono::milliseconds delay)
{
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor);
    timer.expires_after(delay);
    const auto [wait_ec] = co_await timer.async_wait(boost::asio::as_tuple(boost::asio::use_awaitable));
    co_return !wait_ec;
}

boost::asio::awaitable<void> probe_connection(const std::uint32_t conn_id,
                                              const std::string& environment,
                                              const std::uint32_t max_attempts,
                                              hsguard::race_condition_detector& detector,
                                              probe_state& state)
{
    for (std::uint32_t attempt = 0; attempt < max_attempts; ++attempt)
    {
        hsguard::connection_context ctx;
        ctx.conn_id(conn_id);
        ctx.new_trace_id();
        hsguard::handshake_coordinator coordinator(environment, std::move(ctx), &detector);

        if (co_await coordinator.coordinate_handshake_with_timeout())
        {
            (void)detector.validate_connection_readiness(coordinator.current_state());
            LOG_CTX_INFO(coordinator.context(), "probe ready attempt {} after {:.3f}s", attempt + 1, coordinator.context().duration_seconds());
            if (spdlog::should_log(spdlog::level::debug))
            {
                LOG_DEBUG("probe {} summary {}", conn_id, hsguard::dump_coordination_summary(coordinator.summary()));
            }
            state.ready.fetch_add(1, std::memory_order_relaxed);
            co_return;
        }

        if (state.stop_requested.load(std::memory_order_acquire))
        {
            break;
        }
        const auto delay = detector.calculate_progressive_delay(static_cast<int>(attempt));
        LOG_CTX_WARN(coordinator.context(),
                     "probe attempt {} failed after {:.3f}s retry in {}ms",
                     attempt + 1,
                     coordinator.context().duration_seconds(),
                     delay.count());
        if (!co_await wait_for(delay))
        {
            break;
        }
    }
    state.failed.fetch_add(1, std::memory_order_relaxed);
}

boost::asio::awaitable<void> sweep_patterns(hsguard::race_condition_detector& detector, const hsguard::config::detector_t& cfg)
{
    const auto max_age = std::chrono::hours(cfg.pattern_max_age_hours);
    const auto interval = std::chrono::milliseconds(static_cast<std::int64_t>(cfg.sweep_interval_sec) * 1000);
    while (co_await wait_for(interval))
    {
        (void)detector.clear_old_patterns(max_age);
    }
}

void request_stop(std::vector<std::unique_ptr<probe_slot>>& slots, probe_slot& sweeper, probe_state& state)
{
    state.stop_requested.store(true, std::memory_order_release);
    for (auto& slot : slots)
    {
        boost::asio::post(slot->strand, [raw = slot.get()]() { raw->stop_signal.emit(boost::asio::cancellation_type::terminal); });
    }
    boost::asio::post(sweeper.strand, [&sweeper]() { sweeper.stop_signal.emit(boost::asio::cancellation_type::terminal); });
}

// Last probe done: stop the sweeper and release the signal wait so run() returns.
void finish_probe(probe_slot& sweeper, boost::asio::signal_set& signals)
{
    boost::asio::post(sweeper.strand,
                      [&sweeper, &signals]()
                      {
                          sweeper.stop_signal.emit(boost::asio::cancellation_type::terminal);
                          boost::system::error_code cancel_ec;
                          signals.cancel(cancel_ec);
                          if (cancel_ec)
                          {
                              LOG_WARN("signal set cancel failed {}", cancel_ec.message());
                          }
                      });
}

int run_with_config(const char* prog, const char* config_path)
{
    const auto parsed = hsguard::parse_config_with_error(config_path);
    if (!parsed)
    {
        std::fprintf(stderr, "parse config failed path %s reason %s\n", parsed.error().path.c_str(), parsed.error().reason.c_str());
        print_usage(prog);
        return -1;
    }
    const auto& cfg = *parsed;

    hsguard::init_log(cfg.log.file);
    hsguard::set_level(cfg.log.level);

    const auto environment = hsguard::resolve_environment(cfg.environment);
    hsguard::race_condition_detector detector(environment);
    LOG_INFO("{} probing {} connections environment {} workers {}", prog, cfg.probe.connections, environment, cfg.probe.workers);

    boost::asio::io_context io_context;
    probe_state state;
    probe_slot sweeper(io_context);
    std::vector<std::unique_ptr<probe_slot>> slots;
    slots.reserve(cfg.probe.connections);
    for (std::uint32_t i = 0; i < cfg.probe.connections; ++i)
    {
        slots.push_back(std::make_unique<probe_slot>(io_context));
    }

    boost::asio::co_spawn(sweeper.strand,
                          sweep_patterns(detector, cfg.detector),
                          boost::asio::bind_cancellation_slot(sweeper.stop_signal.slot(),
                                                              [](const std::exception_ptr& e)
                                                              {
                                                                  if (e)
                                                                  {
                                                                      LOG_ERROR("pattern sweeper stopped abnormally");
                                                                  }
                                                              }));

    boost::asio::signal_set signals(sweeper.strand, SIGINT, SIGTERM);
    signals.async_wait(
        [&slots, &sweeper, &state](const boost::system::error_code& ec, int)
        {
            if (ec)
            {
                return;
            }
            LOG_WARN("received shutdown signal cancelling handshakes");
            request_stop(slots, sweeper, state);
        });

    state.outstanding.store(cfg.probe.connections, std::memory_order_release);
    for (std::uint32_t i = 0; i < cfg.probe.connections; ++i)
    {
        auto& slot = *slots[i];
        boost::asio::co_spawn(slot.strand,
                              probe_connection(i + 1, environment, cfg.probe.max_attempts, detector, state),
                              boost::asio::bind_cancellation_slot(slot.stop_signal.slot(),
                                                                  [&sweeper, &signals, &state](const std::exception_ptr& e)
                                                                  {
                                                                      if (e)
                                                                      {
                                                                          LOG_ERROR("probe connection stopped abnormally");
                                                                          state.failed.fetch_add(1, std::memory_order_relaxed);
                                                                      }
                                                                      if (state.outstanding.fetch_sub(1, std::memory_order_acq_rel) == 1)
                                                                      {
                                                                          finish_probe(sweeper, signals);
                                                                      }
                                                                  }));
    }

    std::vector<std::thread> threads;
    threads.reserve(cfg.probe.workers);
    for (std::uint32_t i = 0; i < cfg.probe.workers; ++i)
    {
        threads.emplace_back([&io_context]() { io_context.run(); });
    }
    for (auto& t : threads)
    {
        if (t.joinable())
        {
            t.join();
        }
    }

    const auto ready = state.ready.load(std::memory_order_acquire);
    const auto failed = state.failed.load(std::memory_order_acquire);
    LOG_INFO("{} finished ready {} failed {}", prog, ready, failed);
    std::fprintf(stdout, "%s\n", hsguard::dump_pattern_summary(detector.summary()).c_str());
    hsguard::shutdown_log();
    return failed == 0 ? 0 : 1;
}

}    // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return 1;
    }

    const char* mode = argv[1];
    if (std::strcmp(mode, "config") == 0)
    {
        std::fprintf(stdout, "%s\n", hsguard::dump_default_config().c_str());
        return 0;
    }

    if (std::strcmp(mode, "-c") == 0 && argc >= 3)
    {
        return run_with_config(argv[0], argv[2]);
    }

    print_usage(argv[0]);
    return 1;
}
