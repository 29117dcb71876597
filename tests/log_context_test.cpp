#include <chrono>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "log_context.h"

namespace hsguard
{

TEST(LogContextTest, PrefixWithConnectionOnly)
{
    connection_context ctx;
    ctx.conn_id(7);
    EXPECT_EQ(ctx.prefix(), "c7");
}

TEST(LogContextTest, PrefixWithTraceAndRemote)
{
    connection_context ctx;
    ctx.trace_id("abc");
    ctx.conn_id(12);
    ctx.remote_addr("10.0.0.1:443");
    EXPECT_EQ(ctx.prefix(), "tabc c12@10.0.0.1:443");
}

TEST(LogContextTest, DurationSeconds)
{
    connection_context ctx;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    double duration = ctx.duration_seconds();
    EXPECT_GE(duration, 0.1);
    EXPECT_LT(duration, 1.0);
}

TEST(LogContextTest, TraceIdFormat)
{
    connection_context ctx;
    ctx.new_trace_id();
    const auto first = ctx.trace_id();
    EXPECT_EQ(first.size(), 16U);
    EXPECT_EQ(first.find_first_not_of("0123456789abcdef"), std::string::npos);

    ctx.new_trace_id();
    EXPECT_EQ(ctx.trace_id().size(), 16U);
}

TEST(LogContextTest, FormatLatency)
{
    EXPECT_EQ(format_latency_ms(std::chrono::milliseconds(123)), "123.00ms");
    EXPECT_EQ(format_latency_ms(std::chrono::microseconds(1500)), "1.50ms");
    EXPECT_DOUBLE_EQ(to_milliseconds(std::chrono::seconds(2)), 2000.0);
}

}    // namespace hsguard
