#include <gtest/gtest.h>
#include <Utils/Config.hpp>

using namespace Simdraw;

TEST(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_TRUE(config.getValidationErrors().empty());
    EXPECT_EQ(config.renderer().window_width, Defaults::WINDOW_WIDTH);
    EXPECT_FLOAT_EQ(config.tessellation().chord_length, Defaults::CHORD_LENGTH);
    EXPECT_EQ(config.logging().log_level, "info");
}

TEST(ConfigTest, ParsesValueOptions) {
    Config config;
    ASSERT_TRUE(config.parseArguments({"--width", "800", "--height", "600", "--fps", "60",
                                       "--grid-spacing", "25.5", "--chord-length", "16",
                                       "--stats-interval", "250", "--title", "Demo"}));

    EXPECT_EQ(config.renderer().window_width, 800u);
    EXPECT_EQ(config.renderer().window_height, 600u);
    EXPECT_EQ(config.renderer().target_fps, 60u);
    EXPECT_EQ(config.renderer().window_title, "Demo");
    EXPECT_FLOAT_EQ(config.tessellation().grid_spacing, 25.5f);
    EXPECT_FLOAT_EQ(config.tessellation().chord_length, 16.0f);
    EXPECT_EQ(config.worker().stats_interval_ms, 250u);
}

TEST(ConfigTest, ParsesFlags) {
    Config config;
    ASSERT_TRUE(config.parseArguments({"--hidden", "--no-vsync", "--no-antialiasing",
                                       "--no-log-file", "--no-stats", "--debug"}));

    EXPECT_TRUE(config.renderer().hidden);
    EXPECT_FALSE(config.renderer().enable_vsync);
    EXPECT_FALSE(config.renderer().enable_antialiasing);
    EXPECT_FALSE(config.logging().log_to_file);
    EXPECT_FALSE(config.worker().enable_stats_worker);
    EXPECT_EQ(config.logging().log_level, "debug");
}

TEST(ConfigTest, UnknownOptionIsReported) {
    Config config;
    EXPECT_FALSE(config.parseArguments({"--bogus"}));
    ASSERT_EQ(config.getParseErrors().size(), 1u);
    EXPECT_NE(config.getParseErrors()[0].find("--bogus"), std::string::npos);
}

TEST(ConfigTest, MissingValueIsReported) {
    Config config;
    EXPECT_FALSE(config.parseArguments({"--width"}));
    ASSERT_EQ(config.getParseErrors().size(), 1u);
    EXPECT_NE(config.getParseErrors()[0].find("Missing value"), std::string::npos);
}

TEST(ConfigTest, NonNumericValueIsReported) {
    Config config;
    EXPECT_FALSE(config.parseArguments({"--fps", "fast", "--width", "-100", "--grid-spacing", "1x"}));
    EXPECT_EQ(config.getParseErrors().size(), 3u);
    EXPECT_EQ(config.renderer().target_fps, Defaults::TARGET_FPS);
}

TEST(ConfigTest, ParseCommandLineSkipsProgramName) {
    Config config;
    char program[] = "simdraw_viewer";
    char option[] = "--fps";
    char value[] = "120";
    char* argv[] = {program, option, value};

    EXPECT_TRUE(config.parseCommandLine(3, argv));
    EXPECT_EQ(config.renderer().target_fps, 120u);
}

TEST(ConfigTest, ValidationCatchesOutOfRangeValues) {
    Config config = ConfigBuilder()
        .withWindowSize(100, 100)
        .withTargetFPS(1000)
        .withGridSpacing(0.0f)
        .withChordLength(-1.0f)
        .withLogLevel("verbose")
        .build();

    EXPECT_FALSE(config.validate());
    EXPECT_EQ(config.getValidationErrors().size(), 5u);
}

TEST(ConfigTest, ParsedValuesAreValidated) {
    Config config;
    EXPECT_FALSE(config.parseArguments({"--grid-spacing", "0"}));
    EXPECT_TRUE(config.getParseErrors().empty());
}

TEST(ConfigTest, TinyGridSpacingIsRejected) {
    Config config;
    EXPECT_FALSE(config.parseArguments({"--grid-spacing", "0.0001"}));
    ASSERT_EQ(config.getValidationErrors().size(), 1u);
    EXPECT_NE(config.getValidationErrors()[0].find("Grid spacing"), std::string::npos);

    EXPECT_TRUE(config.parseArguments({"--grid-spacing", "1"}));
}

TEST(ConfigTest, BuilderSetsEverySection) {
    Config config = ConfigBuilder()
        .withWindowSize(640, 480)
        .withWindowTitle("Builder")
        .enableHiddenWindow()
        .withMaxAngleStep(0.5f)
        .withStatsInterval(50)
        .enableStatsWorker(false)
        .withLogFile("/tmp/builder.log")
        .enableConsoleLogging(false)
        .build();

    EXPECT_EQ(config.renderer().window_width, 640u);
    EXPECT_EQ(config.renderer().window_title, "Builder");
    EXPECT_TRUE(config.renderer().hidden);
    EXPECT_FLOAT_EQ(config.tessellation().max_angle_step, 0.5f);
    EXPECT_EQ(config.worker().stats_interval_ms, 50u);
    EXPECT_FALSE(config.worker().enable_stats_worker);
    EXPECT_EQ(config.logging().log_file, "/tmp/builder.log");
    EXPECT_FALSE(config.logging().log_to_console);
    EXPECT_TRUE(config.validate());
}

TEST(ConfigTest, TessellationSettingsFollowConfig) {
    Config config = ConfigBuilder().withChordLength(8.0f).withGridSpacing(10.0f).build();
    TessellationSettings settings = config.toTessellationSettings();

    EXPECT_FLOAT_EQ(settings.chord_length, 8.0f);
    EXPECT_FLOAT_EQ(settings.grid_spacing, 10.0f);
    EXPECT_EQ(settings.max_segments, Limits::MAX_CURVE_SEGMENTS);
}

TEST(ConfigTest, LoggerConfigFollowsConfig) {
    Config config = ConfigBuilder().withLogLevel("warning").enableFileLogging(false).build();
    Logger::Config logger_config = config.toLoggerConfig();

    EXPECT_EQ(logger_config.log_level, Logger::Level::Warning);
    EXPECT_FALSE(logger_config.log_to_file);
}

TEST(ConfigTest, JsonAndSummaryMentionValues) {
    Config config = ConfigBuilder().withWindowSize(1024, 768).withGridSpacing(40.0f).build();

    std::string json = config.saveToJson();
    EXPECT_NE(json.find("\"window_width\": 1024"), std::string::npos);
    EXPECT_NE(json.find("\"grid_spacing\": 40"), std::string::npos);
    EXPECT_EQ(json.front(), '{');

    std::string summary = config.getConfigSummary();
    EXPECT_NE(summary.find("1024x768"), std::string::npos);
}
