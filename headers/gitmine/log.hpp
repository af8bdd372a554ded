//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_LOG_HPP
#define GITMINE_LOG_HPP

/**
 * @file log.hpp
 * @brief Process-wide leveled logger.
 *
 * All levels go to stderr so that report output on stdout stays clean, one
 * line per message prefixed with the level: "[warn ] No commits found on 'main'".
 *
 * The initial level comes from the GITMINE_LOG environment variable
 * ("error", "warn", "info", "debug"); the config [logging] table and the
 * CLI verbosity flags override it.
 */

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace gitmine::log {

    enum class Level {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3
    };

    const char* to_string(Level level) noexcept;

    /**
     * Parses "error", "warn"/"warning", "info" or "debug" (any case).
     */
    std::optional<Level> level_from_string(std::string_view str);

    class Logger {
    public:
        static Logger& instance();

        void set_level(Level level);
        [[nodiscard]] Level level() const;
        [[nodiscard]] bool enabled(Level level) const;

        void error(std::string_view msg) const;
        void warn(std::string_view msg) const;
        void info(std::string_view msg) const;
        void debug(std::string_view msg) const;

    private:
        Logger();

        void write(Level level, std::string_view msg) const;

        std::atomic<Level> level_;
        mutable std::mutex mutex_;
    };

    inline void error(const std::string_view msg) { Logger::instance().error(msg); }
    inline void warn(const std::string_view msg) { Logger::instance().warn(msg); }
    inline void info(const std::string_view msg) { Logger::instance().info(msg); }
    inline void debug(const std::string_view msg) { Logger::instance().debug(msg); }

}  // namespace gitmine::log

#endif //GITMINE_LOG_HPP
