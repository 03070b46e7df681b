#pragma once
/**
 * @file    config_watcher.hpp
 * @brief   Reload a configuration file when it changes on disk.
 *
 * Intended to be polled from the control loop between ticks; the controller
 * then receives the current config on its next update. A file that fails to
 * load leaves the last valid configuration in place.
 */

#include <arctrack/config/tracker_config.hpp>
#include <arctrack/core/log.hpp>

#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>

namespace arctrack::config
{
    /**
     * @class ConfigWatcher
     * @brief Tracks one YAML file by modification time.
     */
    class ConfigWatcher
    {
      public:
        /**
         * @brief Watch @p path; @p initial is active until a load succeeds.
         */
        explicit ConfigWatcher (std::filesystem::path path, TrackerConfig initial = {}) : path_ (std::move (path)), current_ (std::move (initial)) {}

        /**
         * @brief Reload if the file changed since the last poll.
         * @return True if a new configuration was adopted.
         */
        bool poll ()
        {
            std::error_code ec;
            const auto stamp = std::filesystem::last_write_time (path_, ec);
            if (ec)
            {
                if (!lastError_ || lastError_->code != ConfigErrorCode::FileNotFound)
                    ARCTRACK_LOG_WARN ("config %s unavailable: %s", path_.c_str (), ec.message ().c_str ());
                lastError_ = ConfigError{ConfigErrorCode::FileNotFound, ec.message ()};
                stamp_.reset ();
                return false;
            }

            if (stamp_ && *stamp_ == stamp)
                return false;
            stamp_ = stamp;

            auto loaded = loadFile (path_);
            if (!loaded)
            {
                ARCTRACK_LOG_WARN ("config %s rejected, keeping previous: %s", path_.c_str (), loaded.error ().message.c_str ());
                lastError_ = std::move (loaded.error ());
                return false;
            }

            current_ = std::move (*loaded);
            lastError_.reset ();
            ARCTRACK_LOG_INFO ("config %s loaded", path_.c_str ());
            return true;
        }

        /// @brief Active configuration.
        [[nodiscard]] const TrackerConfig &current () const noexcept { return current_; }

        /// @brief Error of the last failed load; cleared by the next successful one.
        [[nodiscard]] const std::optional<ConfigError> &lastError () const noexcept { return lastError_; }

        [[nodiscard]] const std::filesystem::path &path () const noexcept { return path_; }

      private:
        std::filesystem::path path_;
        TrackerConfig current_;
        std::optional<std::filesystem::file_time_type> stamp_;
        std::optional<ConfigError> lastError_;
    };

} // namespace arctrack::config
