#include <chrono>
#include <string>
#include <cstdlib>

#include <gtest/gtest.h>

#include "timing_profile.h"

namespace hsguard
{

using std::chrono::milliseconds;

TEST(TimingProfileTest, KnownEnvironments)
{
    const auto& testing = get_timing_profile("testing");
    EXPECT_EQ(testing.kind, environment_kind::kTesting);
    EXPECT_EQ(testing.handshake_delay, milliseconds(5));
    EXPECT_EQ(testing.stabilization_delay, milliseconds(0));
    EXPECT_EQ(testing.handshake_timeout, milliseconds(100));

    const auto& development = get_timing_profile("development");
    EXPECT_EQ(development.handshake_delay, milliseconds(10));
    EXPECT_EQ(development.handshake_timeout, milliseconds(200));

    const auto& staging = get_timing_profile("staging");
    EXPECT_EQ(staging.handshake_delay, milliseconds(100));
    EXPECT_EQ(staging.stabilization_delay, milliseconds(25));
    EXPECT_EQ(staging.handshake_timeout, milliseconds(500));

    const auto& production = get_timing_profile("production");
    EXPECT_EQ(production.handshake_delay, milliseconds(100));
    EXPECT_EQ(production.stabilization_delay, milliseconds(25));
    EXPECT_EQ(production.handshake_timeout, milliseconds(1000));
}

TEST(TimingProfileTest, UnknownFallsBackToDevelopment)
{
    const auto& profile = get_timing_profile("qa-cluster");
    EXPECT_EQ(profile.kind, environment_kind::kDevelopment);
    EXPECT_EQ(&profile, &get_timing_profile(environment_kind::kDevelopment));
    EXPECT_EQ(&get_timing_profile(""), &get_timing_profile("development"));
}

TEST(TimingProfileTest, LookupIsNormalized)
{
    EXPECT_EQ(classify_environment("  Staging\n"), environment_kind::kStaging);
    EXPECT_EQ(classify_environment("PRODUCTION"), environment_kind::kProduction);
    EXPECT_EQ(normalize_environment(" TeSting "), "testing");
    EXPECT_EQ(normalize_environment("   "), "");
}

TEST(TimingProfileTest, CloudEnvironments)
{
    EXPECT_TRUE(is_cloud_environment("staging"));
    EXPECT_TRUE(is_cloud_environment("production"));
    EXPECT_FALSE(is_cloud_environment("testing"));
    EXPECT_FALSE(is_cloud_environment("development"));
    EXPECT_FALSE(is_cloud_environment("anything"));
}

TEST(TimingProfileTest, ProgressiveDelayLinearInCloud)
{
    for (const auto* env : {"staging", "production"})
    {
        EXPECT_EQ(progressive_delay(env, 0), milliseconds(25));
        EXPECT_EQ(progressive_delay(env, 1), milliseconds(50));
        EXPECT_EQ(progressive_delay(env, 2), milliseconds(75));
        for (int i = 0; i < 50; ++i)
        {
            EXPECT_EQ(progressive_delay(env, i + 1) - progressive_delay(env, i), milliseconds(25));
        }
    }
}

TEST(TimingProfileTest, ProgressiveDelayFlatElsewhere)
{
    for (int i = 0; i < 10; ++i)
    {
        EXPECT_EQ(progressive_delay("testing", i), milliseconds(5));
        EXPECT_EQ(progressive_delay("development", i), milliseconds(10));
        EXPECT_EQ(progressive_delay("unknown", i), milliseconds(10));
    }
}

TEST(TimingProfileTest, ProgressiveDelayNeverNegative)
{
    for (const auto* env : {"testing", "development", "staging", "production", "other"})
    {
        EXPECT_GE(progressive_delay(env, -5), milliseconds(0));
        EXPECT_GE(progressive_delay(env, 0), milliseconds(0));
        EXPECT_GE(progressive_delay(env, 1000000), milliseconds(0));
    }
    EXPECT_EQ(progressive_delay("staging", -3), milliseconds(25));
}

TEST(TimingProfileTest, ResolveEnvironmentPrecedence)
{
    unsetenv("ENVIRONMENT");
    EXPECT_EQ(resolve_environment(""), "development");

    setenv("ENVIRONMENT", "Staging", 1);
    EXPECT_EQ(resolve_environment(""), "staging");
    EXPECT_EQ(resolve_environment("testing"), "testing");

    setenv("ENVIRONMENT", "  ", 1);
    EXPECT_EQ(resolve_environment(""), "development");
    unsetenv("ENVIRONMENT");
}

}    // namespace hsguard
