/**
 * @file tracker_config_tests.cpp
 * @brief Unit tests for YAML configuration parsing and validation.
 */

#include <arctrack/config/tracker_config.hpp>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <variant>

using namespace arctrack::config;
using arctrack::tracking::PidCorrection;
using arctrack::tracking::SCurveCorrection;
namespace fs = std::filesystem;
namespace logging = arctrack::core::log;

/// @brief An empty document yields all defaults.
TEST (TrackerConfigTests, EmptyDocumentDefaults)
{
    const auto cfg = parseString ("");
    ASSERT_TRUE (cfg.has_value ()) << cfg.error ().message;
    EXPECT_EQ (*cfg, TrackerConfig{});
    EXPECT_TRUE (std::holds_alternative<SCurveCorrection> (cfg->path.correction));
    EXPECT_EQ (cfg->logging.level, logging::Level::Info);
    EXPECT_TRUE (cfg->logging.file.empty ());
}

/// @brief A complete s-curve document.
TEST (TrackerConfigTests, SCurveDocument)
{
    const auto cfg = parseString (R"(
path:
  velocity: 0.75
  correction:
    strategy: s_curve
    offset_p: 0.05
mixer:
  angular_gain: 40
logging:
  level: debug
  file: run.log
)");
    ASSERT_TRUE (cfg.has_value ()) << cfg.error ().message;
    EXPECT_FLOAT_EQ (cfg->path.velocity, 0.75f);
    ASSERT_TRUE (std::holds_alternative<SCurveCorrection> (cfg->path.correction));
    EXPECT_FLOAT_EQ (std::get<SCurveCorrection> (cfg->path.correction).offsetP, 0.05f);
    EXPECT_FLOAT_EQ (cfg->mixer.angularGain, 40.0f);
    EXPECT_EQ (cfg->logging.level, logging::Level::Debug);
    EXPECT_EQ (cfg->logging.file, "run.log");
}

/// @brief strategy: pid selects the feedback alternative; missing gains are 0.
TEST (TrackerConfigTests, PidDocument)
{
    const auto cfg = parseString (R"(
path:
  correction:
    strategy: pid
    kp: 0.0004
    kd: 0.08
    integral_limit: 500
)");
    ASSERT_TRUE (cfg.has_value ()) << cfg.error ().message;
    ASSERT_TRUE (std::holds_alternative<PidCorrection> (cfg->path.correction));
    const auto &pid = std::get<PidCorrection> (cfg->path.correction);
    EXPECT_FLOAT_EQ (pid.kp, 0.0004f);
    EXPECT_EQ (pid.ki, 0.0f);
    EXPECT_FLOAT_EQ (pid.kd, 0.08f);
    EXPECT_FLOAT_EQ (pid.integralLimit, 500.0f);
}

/// @brief Out-of-range values and unknown names are InvalidValue.
TEST (TrackerConfigTests, ValidationErrors)
{
    const char *documents[] = {
        "path: {velocity: -1}",
        "path: {velocity: .nan}",
        "path: {correction: {offset_p: -0.1}}",
        "path: {correction: {strategy: lqr}}",
        "path: {correction: {strategy: pid, kp: .inf}}",
        "path: {correction: {strategy: pid, kp: 1, integral_limit: -2}}",
        "logging: {level: loud}",
        "mixer: [1, 2]",
        "path: 5",
        "- a\n- b\n",
    };

    for (const char *doc : documents)
    {
        const auto cfg = parseString (doc);
        ASSERT_FALSE (cfg.has_value ()) << doc;
        EXPECT_EQ (cfg.error ().code, ConfigErrorCode::InvalidValue) << doc;
        EXPECT_FALSE (cfg.error ().message.empty ());
    }
}

/// @brief Malformed YAML and wrongly typed scalars are ParseError.
TEST (TrackerConfigTests, ParseErrors)
{
    for (const char *doc : {"path: [", "path: {velocity: fast}", "mixer: {angular_gain: [1]}"})
    {
        const auto cfg = parseString (doc);
        ASSERT_FALSE (cfg.has_value ()) << doc;
        EXPECT_EQ (cfg.error ().code, ConfigErrorCode::ParseError) << doc;
    }
}

/// @brief Files load like strings; missing files are FileNotFound.
TEST (TrackerConfigTests, LoadFile)
{
    const fs::path path = fs::temp_directory_path () / "arctrack_tracker_config_tests.yaml";
    {
        std::ofstream out (path);
        out << "path:\n  velocity: 0.25\n";
    }

    const auto cfg = loadFile (path);
    ASSERT_TRUE (cfg.has_value ()) << cfg.error ().message;
    EXPECT_FLOAT_EQ (cfg->path.velocity, 0.25f);

    std::error_code ec;
    fs::remove (path, ec);

    const auto missing = loadFile (path);
    ASSERT_FALSE (missing.has_value ());
    EXPECT_EQ (missing.error ().code, ConfigErrorCode::FileNotFound);
}

/// @brief Applying logging settings updates the global logger.
TEST (TrackerConfigTests, ApplyLogging)
{
    const auto saved = logging::level ();

    EXPECT_TRUE (apply (LoggingConfig{logging::Level::Error, ""}));
    EXPECT_EQ (logging::level (), logging::Level::Error);

    EXPECT_FALSE (apply (LoggingConfig{logging::Level::Warn, "/nonexistent-dir/arctrack.log"}));
    EXPECT_EQ (logging::level (), logging::Level::Warn);

    logging::setLevel (saved);
}
