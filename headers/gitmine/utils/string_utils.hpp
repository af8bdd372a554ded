//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_STRING_UTILS_HPP
#define GITMINE_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers shared by the git plumbing, the parsers and the CLI.
 */

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "gitmine/types.hpp"

namespace gitmine::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits on a single delimiter. Empty fields are kept, so "a,,b" yields
     * three parts and "" yields one empty part.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> parts;
        std::size_t start = 0;
        while (true) {
            const auto pos = s.find(delimiter, start);
            if (pos == std::string_view::npos) {
                parts.push_back(s.substr(start));
                break;
            }
            parts.push_back(s.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }

    /**
     * Splits text into physical lines on '\n'. A trailing newline does not
     * produce an extra empty line.
     */
    inline std::vector<std::string_view> split_lines(std::string_view s) {
        std::vector<std::string_view> lines;
        std::size_t start = 0;
        while (start < s.size()) {
            auto pos = s.find('\n', start);
            if (pos == std::string_view::npos) {
                pos = s.size();
            }
            lines.push_back(s.substr(start, pos - start));
            start = pos + 1;
        }
        return lines;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::string result;
        bool first = true;
        for (const auto& part : parts) {
            if (!first) {
                result += delimiter;
            }
            result += part;
            first = false;
        }
        return result;
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /**
     * Formats a timestamp in local time with a strftime pattern.
     */
    inline std::string format_timestamp(const Timestamp ts, const char* pattern = "%Y-%m-%d %H:%M:%S") {
        const auto time_t_val = std::chrono::system_clock::to_time_t(ts);
        std::tm time_info{};
        localtime_r(&time_t_val, &time_info);
        std::ostringstream ss;
        ss << std::put_time(&time_info, pattern);
        return ss.str();
    }

}  // namespace gitmine::string_utils

#endif //GITMINE_STRING_UTILS_HPP
