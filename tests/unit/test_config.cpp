#include <cadence/animate.hpp>
#include <cadence/config.hpp>
#include <cadence/logger.hpp>
#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cadence;

namespace
{

const char* const kEnvVars[] = {
    "CADENCE_LOG_LEVEL",
    "CADENCE_LOG_CATEGORIES",
    "CADENCE_LOG_FILE",
    "CADENCE_TARGET_FPS",
    "CADENCE_FIXED_DT",
};

// Captures log entries and restores the logger on teardown.
class LoggerCapture
{
   public:
    LoggerCapture()
    {
        saved_level_ = Logger::instance().get_level();
        Logger::instance().clear_sinks();
        Logger::instance().add_sink([this](const Logger::LogEntry& e) { entries.push_back(e); });
    }

    ~LoggerCapture()
    {
        Logger::instance().clear_sinks();
        Logger::instance().clear_category_levels();
        Logger::instance().set_level(saved_level_);
    }

    std::vector<Logger::LogEntry> entries;

   private:
    LogLevel saved_level_;
};

}   // anonymous namespace

class EngineConfigTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        for (const char* name : kEnvVars)
            unsetenv(name);
    }

    void TearDown() override
    {
        for (const char* name : kEnvVars)
            unsetenv(name);
    }
};

// ─── EngineConfig ───────────────────────────────────────────────────────────

TEST_F(EngineConfigTest, DefaultsWithoutEnvironment)
{
    auto config = EngineConfig::from_env();
    EXPECT_EQ(config.log_level, LogLevel::Info);
    EXPECT_TRUE(config.log_to_console);
    EXPECT_TRUE(config.log_file.empty());
    EXPECT_FLOAT_EQ(config.target_fps, 60.0f);
    EXPECT_FLOAT_EQ(config.max_frame_dt, 0.25f);
    EXPECT_FLOAT_EQ(config.fixed_timestep, 0.0f);
}

TEST_F(EngineConfigTest, ReadsEnvironment)
{
    setenv("CADENCE_LOG_LEVEL", "Debug", 1);
    setenv("CADENCE_LOG_FILE", "/tmp/cadence.log", 1);
    setenv("CADENCE_TARGET_FPS", "30", 1);
    setenv("CADENCE_FIXED_DT", "0.125", 1);

    auto config = EngineConfig::from_env();
    EXPECT_EQ(config.log_level, LogLevel::Debug);
    EXPECT_EQ(config.log_file, "/tmp/cadence.log");
    EXPECT_FLOAT_EQ(config.target_fps, 30.0f);
    EXPECT_FLOAT_EQ(config.fixed_timestep, 0.125f);
}

TEST_F(EngineConfigTest, ZeroFpsMeansUncapped)
{
    setenv("CADENCE_TARGET_FPS", "0", 1);
    EXPECT_FLOAT_EQ(EngineConfig::from_env().target_fps, 0.0f);
}

TEST_F(EngineConfigTest, InvalidValuesKeepBaseAndWarn)
{
    LoggerCapture capture;
    Logger::instance().set_level(LogLevel::Warning);

    setenv("CADENCE_LOG_LEVEL", "loud", 1);
    setenv("CADENCE_TARGET_FPS", "fast", 1);
    setenv("CADENCE_FIXED_DT", "-0.5", 1);

    EngineConfig base;
    base.log_level      = LogLevel::Error;
    base.target_fps     = 120.0f;
    base.fixed_timestep = 0.25f;

    auto config = EngineConfig::from_env(base);
    EXPECT_EQ(config.log_level, LogLevel::Error);
    EXPECT_FLOAT_EQ(config.target_fps, 120.0f);
    EXPECT_FLOAT_EQ(config.fixed_timestep, 0.25f);

    ASSERT_EQ(capture.entries.size(), 3u);
    for (const auto& e : capture.entries)
    {
        EXPECT_EQ(e.level, LogLevel::Warning);
        EXPECT_EQ(e.category, "config");
    }
}

TEST_F(EngineConfigTest, TrailingGarbageIsRejected)
{
    setenv("CADENCE_TARGET_FPS", "24fps", 1);
    EXPECT_FLOAT_EQ(EngineConfig::from_env().target_fps, 60.0f);
}

TEST_F(EngineConfigTest, EmptyVariableIsUnset)
{
    setenv("CADENCE_LOG_LEVEL", "", 1);
    EXPECT_EQ(EngineConfig::from_env().log_level, LogLevel::Info);
}

TEST_F(EngineConfigTest, ReadsCategoryLevels)
{
    setenv("CADENCE_LOG_CATEGORIES", "animate=trace,stage=WARN", 1);

    auto config = EngineConfig::from_env();
    ASSERT_EQ(config.category_levels.size(), 2u);
    EXPECT_EQ(config.category_levels[0].first, "animate");
    EXPECT_EQ(config.category_levels[0].second, LogLevel::Trace);
    EXPECT_EQ(config.category_levels[1].first, "stage");
    EXPECT_EQ(config.category_levels[1].second, LogLevel::Warning);
}

TEST_F(EngineConfigTest, MalformedCategoryEntriesAreSkipped)
{
    LoggerCapture capture;
    Logger::instance().set_level(LogLevel::Warning);

    setenv("CADENCE_LOG_CATEGORIES", "animate,=debug,,layer=loud,views=debug", 1);

    auto config = EngineConfig::from_env();
    ASSERT_EQ(config.category_levels.size(), 1u);
    EXPECT_EQ(config.category_levels[0].first, "views");
    EXPECT_EQ(config.category_levels[0].second, LogLevel::Debug);
    EXPECT_EQ(capture.entries.size(), 3u);
}

TEST_F(EngineConfigTest, ApplyLoggingSetsLevel)
{
    LogLevel saved = Logger::instance().get_level();

    EngineConfig config;
    config.log_level      = LogLevel::Error;
    config.log_to_console = false;
    apply_logging(config);

    EXPECT_EQ(Logger::instance().get_level(), LogLevel::Error);
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Warning));
    EXPECT_TRUE(Logger::instance().is_enabled(LogLevel::Error));

    config.category_levels = {{"animate", LogLevel::Debug}};
    apply_logging(config);
    EXPECT_TRUE(Logger::instance().is_enabled(LogLevel::Debug, "animate"));
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Debug, "stage"));

    Logger::instance().clear_sinks();
    Logger::instance().clear_category_levels();
    Logger::instance().set_level(saved);
}

// ─── Logger ─────────────────────────────────────────────────────────────────

TEST(Logger, ParseLevelIsCaseInsensitive)
{
    EXPECT_EQ(Logger::parse_level("TRACE"), LogLevel::Trace);
    EXPECT_EQ(Logger::parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level("Info"), LogLevel::Info);
    EXPECT_EQ(Logger::parse_level("warn"), LogLevel::Warning);
    EXPECT_EQ(Logger::parse_level("warning"), LogLevel::Warning);
    EXPECT_EQ(Logger::parse_level("error"), LogLevel::Error);
    EXPECT_EQ(Logger::parse_level("critical"), LogLevel::Critical);
    EXPECT_EQ(Logger::parse_level("off"), LogLevel::Off);
    EXPECT_FALSE(Logger::parse_level("verbose").has_value());
    EXPECT_FALSE(Logger::parse_level("").has_value());
}

TEST(Logger, FormatsPlaceholdersInOrder)
{
    LoggerCapture capture;
    Logger::instance().set_level(LogLevel::Trace);

    CADENCE_LOG_INFO("test", "step {} of {} ({})", 2, 5, "animation");

    ASSERT_EQ(capture.entries.size(), 1u);
    EXPECT_EQ(capture.entries[0].message, "step 2 of 5 (animation)");
    EXPECT_EQ(capture.entries[0].category, "test");
    EXPECT_EQ(capture.entries[0].level, LogLevel::Info);
}

TEST(Logger, ExtraPlaceholdersAreLeftAlone)
{
    LoggerCapture capture;
    Logger::instance().set_level(LogLevel::Trace);

    CADENCE_LOG_DEBUG("test", "{} and {}", true);

    ASSERT_EQ(capture.entries.size(), 1u);
    EXPECT_EQ(capture.entries[0].message, "true and {}");
}

TEST(Logger, LevelFilters)
{
    LoggerCapture capture;
    Logger::instance().set_level(LogLevel::Warning);

    CADENCE_LOG_DEBUG("test", "hidden");
    CADENCE_LOG_INFO("test", "hidden");
    CADENCE_LOG_WARN("test", "shown");
    CADENCE_LOG_ERROR("test", "shown");

    EXPECT_EQ(capture.entries.size(), 2u);
}

TEST(Logger, OffSilencesEverything)
{
    LoggerCapture capture;
    Logger::instance().set_level(LogLevel::Off);

    CADENCE_LOG_CRITICAL("test", "hidden");
    EXPECT_TRUE(capture.entries.empty());
}

TEST(Logger, CategoryLevelOverridesGlobal)
{
    LoggerCapture capture;
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().set_category_level("animate", LogLevel::Trace);
    Logger::instance().set_category_level("stage", LogLevel::Error);

    CADENCE_LOG_TRACE("animate", "shown");
    CADENCE_LOG_WARN("stage", "hidden");
    CADENCE_LOG_DEBUG("layer", "hidden");
    CADENCE_LOG_INFO("layer", "shown");

    ASSERT_EQ(capture.entries.size(), 2u);
    EXPECT_EQ(capture.entries[0].category, "animate");
    EXPECT_EQ(capture.entries[1].category, "layer");

    EXPECT_EQ(Logger::instance().level_for("stage"), LogLevel::Error);
    EXPECT_EQ(Logger::instance().level_for("views"), LogLevel::Info);
}

TEST(Logger, SettingCategoryTwiceReplaces)
{
    LoggerCapture capture;
    Logger::instance().set_category_level("animate", LogLevel::Trace);
    Logger::instance().set_category_level("animate", LogLevel::Critical);
    EXPECT_EQ(Logger::instance().level_for("animate"), LogLevel::Critical);

    Logger::instance().clear_category_levels();
    EXPECT_EQ(Logger::instance().level_for("animate"), Logger::instance().get_level());
}

TEST(Logger, FormatEntryContainsLevelAndCategory)
{
    Logger::LogEntry entry{std::chrono::system_clock::now(), LogLevel::Error, "animate", "boom"};
    std::string      line = Logger::format_entry(entry);
    EXPECT_NE(line.find("ERROR"), std::string::npos);
    EXPECT_NE(line.find("[animate]"), std::string::npos);
    EXPECT_NE(line.find("boom"), std::string::npos);
}

TEST(Logger, RejectedStepIsLoggedAsError)
{
    LoggerCapture capture;
    Logger::instance().set_level(LogLevel::Error);

    Animate chain;
    EXPECT_THROW(chain.animate(-1.0f, [] {}), std::invalid_argument);

    ASSERT_EQ(capture.entries.size(), 1u);
    EXPECT_EQ(capture.entries[0].category, "animate");
}

TEST(Logger, UnopenableFileSinkWarns)
{
    LoggerCapture capture;
    Logger::instance().set_level(LogLevel::Warning);

    auto sink = sinks::file_sink("/nonexistent-cadence-dir/run.log");
    ASSERT_EQ(capture.entries.size(), 1u);
    EXPECT_EQ(capture.entries[0].level, LogLevel::Warning);
    EXPECT_NE(capture.entries[0].message.find("/nonexistent-cadence-dir/run.log"), std::string::npos);

    // Writing through the dead sink is harmless.
    sink(capture.entries[0]);
}
