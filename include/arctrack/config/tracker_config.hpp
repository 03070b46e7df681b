#pragma once
/**
 * @file    tracker_config.hpp
 * @brief   YAML configuration of the controller, the mixer and logging.
 *
 * Layout (every key optional):
 * @code
 *   path:
 *     velocity: 0.5
 *     correction:
 *       strategy: s_curve      # s_curve | pid
 *       offset_p: 0.05
 *       kp: 0.0
 *       ki: 0.0
 *       kd: 0.0
 *       integral_limit: 0.0
 *   mixer:
 *     angular_gain: 40.0
 *   logging:
 *     level: info
 *     file: ""
 * @endcode
 *
 * yaml-cpp exceptions never escape: they become a @ref ConfigError.
 */

#include <arctrack/core/log.hpp>
#include <arctrack/tracking/path_config.hpp>
#include <arctrack/vehicle/differential_drive.hpp>

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace arctrack::config
{
    /**
     * @brief Error categories of configuration loading.
     */
    enum class ConfigErrorCode
    {
        FileNotFound, ///< Path does not exist or is unreadable
        ParseError,   ///< Not valid YAML, or a value of the wrong type
        InvalidValue  ///< Well-formed but out of range / unknown name
    };

    /**
     * @struct ConfigError
     * @brief  Error code plus a human-readable reason.
     */
    struct ConfigError
    {
        ConfigErrorCode code{ConfigErrorCode::ParseError};
        std::string message;
    };

    /**
     * @struct LoggingConfig
     * @brief  Logger threshold and optional file sink.
     */
    struct LoggingConfig
    {
        core::log::Level level{core::log::Level::Info};
        std::string file; ///< Empty ⇒ stderr only

        [[nodiscard]] bool operator== (const LoggingConfig &) const = default;
    };

    /**
     * @struct TrackerConfig
     * @brief  Complete configuration document.
     */
    struct TrackerConfig
    {
        tracking::PathConfig path{};
        vehicle::MixerConfig mixer{};
        LoggingConfig logging{};

        [[nodiscard]] bool operator== (const TrackerConfig &) const = default;
    };

    namespace detail
    {
        [[nodiscard]] inline std::unexpected<ConfigError> invalid (std::string message)
        {
            return std::unexpected (ConfigError{ConfigErrorCode::InvalidValue, std::move (message)});
        }

        /// Absent and null sections mean "all defaults".
        [[nodiscard]] inline bool isMapOrAbsent (const YAML::Node &node) { return !node || node.IsNull () || node.IsMap (); }

        /// Child of a map, or an undefined node. Never indexes into an undefined node.
        [[nodiscard]] inline YAML::Node child (const YAML::Node &map, const char *key)
        {
            if (!map || !map.IsMap ())
                return YAML::Node{YAML::NodeType::Undefined};
            return map[key];
        }

        /// Scalar under @p key converted to T, or @p fallback when missing / null.
        template <class T> [[nodiscard]] T valueOr (const YAML::Node &map, const char *key, T fallback)
        {
            const YAML::Node value = child (map, key);
            if (!value || value.IsNull ())
                return fallback;
            return value.as<T> ();
        }

        [[nodiscard]] inline std::expected<tracking::CorrectionConfig, ConfigError> parseCorrection (const YAML::Node &node)
        {
            if (!isMapOrAbsent (node))
                return invalid ("path.correction must be a map");

            const auto strategy = valueOr<std::string> (node, "strategy", "s_curve");
            if (strategy == "s_curve")
            {
                tracking::SCurveCorrection gains{valueOr (node, "offset_p", 0.0f)};
                if (!std::isfinite (gains.offsetP) || gains.offsetP < 0.0f)
                    return invalid ("path.correction.offset_p must be finite and >= 0");
                return gains;
            }
            if (strategy == "pid")
            {
                tracking::PidCorrection gains{};
                gains.kp = valueOr (node, "kp", 0.0f);
                gains.ki = valueOr (node, "ki", 0.0f);
                gains.kd = valueOr (node, "kd", 0.0f);
                gains.integralLimit = valueOr (node, "integral_limit", 0.0f);
                if (!std::isfinite (gains.kp) || !std::isfinite (gains.ki) || !std::isfinite (gains.kd))
                    return invalid ("path.correction pid gains must be finite");
                if (!std::isfinite (gains.integralLimit) || gains.integralLimit < 0.0f)
                    return invalid ("path.correction.integral_limit must be finite and >= 0");
                return gains;
            }
            return invalid ("unknown path.correction.strategy '" + strategy + "'");
        }

        [[nodiscard]] inline std::expected<TrackerConfig, ConfigError> parseDocument (const YAML::Node &root)
        {
            if (!isMapOrAbsent (root))
                return invalid ("configuration root must be a map");

            TrackerConfig cfg{};

            const YAML::Node path = child (root, "path");
            if (!isMapOrAbsent (path))
                return invalid ("path must be a map");
            cfg.path.velocity = valueOr (path, "velocity", cfg.path.velocity);
            if (!std::isfinite (cfg.path.velocity) || cfg.path.velocity < 0.0f)
                return invalid ("path.velocity must be finite and >= 0");

            auto correction = parseCorrection (child (path, "correction"));
            if (!correction)
                return std::unexpected (std::move (correction.error ()));
            cfg.path.correction = *correction;

            const YAML::Node mixer = child (root, "mixer");
            if (!isMapOrAbsent (mixer))
                return invalid ("mixer must be a map");
            cfg.mixer.angularGain = valueOr (mixer, "angular_gain", cfg.mixer.angularGain);
            if (!std::isfinite (cfg.mixer.angularGain))
                return invalid ("mixer.angular_gain must be finite");

            const YAML::Node logging = child (root, "logging");
            if (!isMapOrAbsent (logging))
                return invalid ("logging must be a map");
            const auto levelName = valueOr<std::string> (logging, "level", "info");
            const auto level = core::log::parseLevel (levelName);
            if (!level)
                return invalid ("unknown logging.level '" + levelName + "'");
            cfg.logging.level = *level;
            cfg.logging.file = valueOr<std::string> (logging, "file", "");

            return cfg;
        }
    } // namespace detail

    /**
     * @brief Build a configuration from an already-parsed YAML node.
     * @param root  Document root (a map, or null for all defaults).
     * @return The configuration, or a ParseError / InvalidValue.
     */
    [[nodiscard]] inline std::expected<TrackerConfig, ConfigError> parse (const YAML::Node &root)
    {
        try
        {
            return detail::parseDocument (root);
        }
        catch (const YAML::Exception &e)
        {
            return std::unexpected (ConfigError{ConfigErrorCode::ParseError, e.what ()});
        }
    }

    /**
     * @brief Parse a YAML document held in memory.
     */
    [[nodiscard]] inline std::expected<TrackerConfig, ConfigError> parseString (std::string_view text)
    {
        try
        {
            return parse (YAML::Load (std::string (text)));
        }
        catch (const YAML::Exception &e)
        {
            return std::unexpected (ConfigError{ConfigErrorCode::ParseError, e.what ()});
        }
    }

    /**
     * @brief Load and validate a YAML file.
     * @param path  File to read.
     * @return The configuration, or FileNotFound / ParseError / InvalidValue.
     */
    [[nodiscard]] inline std::expected<TrackerConfig, ConfigError> loadFile (const std::filesystem::path &path)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file (path, ec))
            return std::unexpected (ConfigError{ConfigErrorCode::FileNotFound, "no such file: " + path.string ()});

        try
        {
            return parse (YAML::LoadFile (path.string ()));
        }
        catch (const YAML::BadFile &e)
        {
            return std::unexpected (ConfigError{ConfigErrorCode::FileNotFound, e.what ()});
        }
        catch (const YAML::Exception &e)
        {
            return std::unexpected (ConfigError{ConfigErrorCode::ParseError, e.what ()});
        }
    }

    /**
     * @brief Apply logging settings to the global logger.
     * @return False if the log file could not be opened (stderr logging stays active).
     */
    inline bool apply (const LoggingConfig &logging)
    {
        core::log::setLevel (logging.level);
        if (logging.file.empty ())
        {
            core::log::closeFile ();
            return true;
        }
        return core::log::openFile (logging.file);
    }

} // namespace arctrack::config
