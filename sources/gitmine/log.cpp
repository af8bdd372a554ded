//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/log.hpp"
#include "gitmine/utils/string_utils.hpp"

#include <cstdlib>
#include <iostream>

namespace gitmine::log
{
    namespace {

        Level level_from_environment() {
            const char* env = std::getenv("GITMINE_LOG");
            if (env == nullptr) {
                return Level::Warn;
            }
            return level_from_string(env).value_or(Level::Warn);
        }

    }  // namespace

    const char* to_string(const Level level) noexcept {
        switch (level) {
            case Level::Error: return "error";
            case Level::Warn:  return "warn";
            case Level::Info:  return "info";
            case Level::Debug: return "debug";
        }
        return "warn";
    }

    std::optional<Level> level_from_string(const std::string_view str) {
        const auto lower = string_utils::to_lower(string_utils::trim(str));
        if (lower == "error" || lower == "0") return Level::Error;
        if (lower == "warn" || lower == "warning" || lower == "1") return Level::Warn;
        if (lower == "info" || lower == "2") return Level::Info;
        if (lower == "debug" || lower == "3") return Level::Debug;
        return std::nullopt;
    }

    Logger& Logger::instance() {
        static Logger logger;
        return logger;
    }

    Logger::Logger() : level_(level_from_environment()) {}

    void Logger::set_level(const Level level) {
        level_.store(level);
    }

    Level Logger::level() const {
        return level_.load();
    }

    bool Logger::enabled(const Level level) const {
        return static_cast<int>(level) <= static_cast<int>(level_.load());
    }

    void Logger::error(const std::string_view msg) const { write(Level::Error, msg); }
    void Logger::warn(const std::string_view msg) const { write(Level::Warn, msg); }
    void Logger::info(const std::string_view msg) const { write(Level::Info, msg); }
    void Logger::debug(const std::string_view msg) const { write(Level::Debug, msg); }

    void Logger::write(const Level level, const std::string_view msg) const {
        if (!enabled(level)) {
            return;
        }

        // Messages may come from diff extraction workers.
        std::lock_guard lock(mutex_);
        auto& out = std::cerr;
        switch (level) {
            case Level::Error: out << "[error] "; break;
            case Level::Warn:  out << "[warn ] "; break;
            case Level::Info:  out << "[info ] "; break;
            case Level::Debug: out << "[debug] "; break;
        }
        out << msg << "\n";
    }

}  // namespace gitmine::log
