//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_JSON_UTILS_HPP
#define GITMINE_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief JSON file and string helpers.
 *
 * Thin wrappers over nlohmann/json that report failures through
 * Result<T, Error> instead of exceptions.
 */

#include "gitmine/error.hpp"
#include "gitmine/result.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace gitmine::json_utils {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    inline Result<json, Error> parse(std::string_view content) {
        try {
            return Result<json, Error>::success(json::parse(content));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", e.what())
            );
        }
    }

    inline Result<json, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<json, Error>::failure(
                Error::not_found("JSON file not found", path.string())
            );
        }

        std::ifstream file(path);
        if (!file) {
            return Result<json, Error>::failure(
                Error::io_error("Failed to open JSON file", path.string())
            );
        }

        try {
            json data;
            file >> data;
            return Result<json, Error>::success(std::move(data));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", path.string() + ": " + e.what())
            );
        }
    }

    /**
     * Serializes data, replacing invalid UTF-8 so that diff bodies of
     * files in legacy encodings cannot abort the dump.
     *
     * @param indent Indentation level (-1 for compact output).
     */
    inline std::string dump(const json& data, const int indent = -1) {
        return data.dump(indent, ' ', false, json::error_handler_t::replace);
    }

    /**
     * Writes data to path, creating missing parent directories.
     */
    inline Result<void, Error> write_file(
        const fs::path& path,
        const json& data,
        const int indent = 2
    ) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        try {
            file << dump(data, indent);
        } catch (const json::type_error& e) {
            return Result<void, Error>::failure(
                Error::internal_error("JSON serialization error", e.what())
            );
        }

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write JSON file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

}  // namespace gitmine::json_utils

#endif //GITMINE_JSON_UTILS_HPP
