#include <cstdio>
#include <string>
#include <fstream>
#include <unistd.h>

#include <gtest/gtest.h>

#include "config.h"

namespace
{

class config_test : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmp_file_ = std::string("test_config_") + info->test_suite_name() + "_" + info->name() + "_" + std::to_string(::getpid()) + ".json";
    }

    void TearDown() override { std::remove(tmp_file_.c_str()); }

    void write_config_file(const std::string& content)
    {
        std::ofstream out(tmp_file_);
        out << content;
        out.close();
    }

    const std::string& tmp_file() const { return tmp_file_; }

   private:
    std::string tmp_file_;
};

}    // namespace

TEST_F(config_test, DefaultConfigValid)
{
    const auto json = hsguard::dump_default_config();
    ASSERT_FALSE(json.empty());

    EXPECT_NE(json.find("\"environment\""), std::string::npos);
    EXPECT_NE(json.find("\"detector\""), std::string::npos);
    EXPECT_NE(json.find("\"probe\""), std::string::npos);

    write_config_file(json);
    const auto cfg = hsguard::parse_config(tmp_file());
    ASSERT_TRUE(cfg.has_value());
    EXPECT_TRUE(cfg->environment.empty());
    EXPECT_EQ(cfg->log.level, "info");
    EXPECT_EQ(cfg->detector.pattern_max_age_hours, 24U);
    EXPECT_EQ(cfg->probe.connections, 16U);
}

TEST_F(config_test, ParseValues)
{
    const std::string content = R"({
        "environment": "staging",
        "log": {
            "level": "debug",
            "file": "probe.log"
        },
        "detector": {
            "pattern_max_age_hours": 6,
            "sweep_interval_sec": 15
        },
        "probe": {
            "connections": 64,
            "workers": 4,
            "max_attempts": 5
        }
    })";
    write_config_file(content);

    const auto cfg_opt = hsguard::parse_config(tmp_file());
    ASSERT_TRUE(cfg_opt.has_value());
    if (cfg_opt.has_value())
    {
        const auto& cfg = *cfg_opt;

        EXPECT_EQ(cfg.environment, "staging");
        EXPECT_EQ(cfg.log.level, "debug");
        EXPECT_EQ(cfg.log.file, "probe.log");
        EXPECT_EQ(cfg.detector.pattern_max_age_hours, 6U);
        EXPECT_EQ(cfg.detector.sweep_interval_sec, 15U);
        EXPECT_EQ(cfg.probe.connections, 64U);
        EXPECT_EQ(cfg.probe.workers, 4U);
        EXPECT_EQ(cfg.probe.max_attempts, 5U);
    }
}

TEST_F(config_test, MissingMembersKeepDefaults)
{
    write_config_file(R"({"environment": "production"})");

    const auto cfg = hsguard::parse_config(tmp_file());
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->environment, "production");
    EXPECT_EQ(cfg->log.file, "hsguard.log");
    EXPECT_EQ(cfg->detector.sweep_interval_sec, 60U);
    EXPECT_EQ(cfg->probe.workers, 2U);
    EXPECT_EQ(cfg->probe.max_attempts, 3U);
}

TEST_F(config_test, ZeroWorkersNormalized)
{
    write_config_file(R"({"probe": {"workers": 0}})");

    const auto cfg = hsguard::parse_config(tmp_file());
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->probe.workers, 1U);
}

TEST_F(config_test, MissingFile)
{
    const auto cfg = hsguard::parse_config("non_existent_file.json");
    EXPECT_FALSE(cfg.has_value());

    const auto parsed = hsguard::parse_config_with_error("non_existent_file.json");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().path, "/");
    EXPECT_NE(parsed.error().reason.find("open file failed"), std::string::npos);
}

TEST_F(config_test, MalformedJsonReportsOffset)
{
    const auto parsed = hsguard::deserialize_config_with_error(R"({"environment": )");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().path, "/");
    EXPECT_NE(parsed.error().reason.find("json parse error at offset"), std::string::npos);
}

TEST_F(config_test, EmbeddedNulRejected)
{
    std::string text = R"({"environment": "testing"})";
    text.push_back('\0');
    text += "{}";

    const auto parsed = hsguard::deserialize_config_with_error(text);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_NE(parsed.error().reason.find("embedded nul byte"), std::string::npos);
}

TEST_F(config_test, RootMustBeObject)
{
    const auto parsed = hsguard::deserialize_config_with_error("[1, 2, 3]");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().path, "/");
    EXPECT_EQ(parsed.error().reason, "invalid type or value");
}

TEST_F(config_test, WrongTypeReportsPath)
{
    const auto parsed = hsguard::deserialize_config_with_error(R"({"probe": {"connections": "many"}})");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().path, "/probe/connections");
    EXPECT_EQ(parsed.error().reason, "invalid type or value");
}

TEST_F(config_test, NegativeCountRejected)
{
    const auto parsed = hsguard::deserialize_config_with_error(R"({"detector": {"sweep_interval_sec": -5}})");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().path, "/detector/sweep_interval_sec");
}

TEST_F(config_test, OutOfRangeCountRejected)
{
    const auto parsed = hsguard::deserialize_config_with_error(R"({"probe": {"connections": 4294967296}})");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().path, "/probe/connections");
}

TEST_F(config_test, UnknownLogLevelRejected)
{
    const auto parsed = hsguard::deserialize_config_with_error(R"({"log": {"level": "verbose"}})");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().path, "/log/level");
}

TEST_F(config_test, EmptyLogFileRejected)
{
    const auto parsed = hsguard::deserialize_config_with_error(R"({"log": {"file": ""}})");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().path, "/log/file");
    EXPECT_EQ(parsed.error().reason, "must be non-empty");
}

TEST_F(config_test, ZeroValuesRejected)
{
    auto parsed = hsguard::deserialize_config_with_error(R"({"detector": {"pattern_max_age_hours": 0}})");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().path, "/detector/pattern_max_age_hours");

    parsed = hsguard::deserialize_config_with_error(R"({"probe": {"connections": 0}})");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().path, "/probe/connections");

    parsed = hsguard::deserialize_config_with_error(R"({"probe": {"max_attempts": 0}})");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().path, "/probe/max_attempts");
}

TEST_F(config_test, DumpRoundTripPreservesValues)
{
    hsguard::config cfg;
    cfg.environment = "testing";
    cfg.probe.connections = 3;
    cfg.log.level = "warn";

    const auto parsed = hsguard::deserialize_config_with_error(hsguard::dump_config(cfg));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->environment, "testing");
    EXPECT_EQ(parsed->probe.connections, 3U);
    EXPECT_EQ(parsed->log.level, "warn");
}
