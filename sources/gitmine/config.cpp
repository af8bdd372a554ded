//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/config.hpp"
#include "gitmine/log.hpp"
#include "gitmine/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <fstream>
#include <limits>
#include <sstream>

namespace gitmine {

    namespace {

        std::string qualified(const std::string_view section, const std::string_view key) {
            return std::string(section) + "." + std::string(key);
        }

        const toml::table* section_table(
            const toml::table& root,
            const std::string_view name,
            std::vector<std::string>& errors
        ) {
            const auto node = root[name];
            if (!node) {
                return nullptr;
            }
            const auto* table = node.as_table();
            if (!table) {
                errors.push_back("[" + std::string(name) + "] must be a table");
            }
            return table;
        }

        void read_integer(
            const toml::table& table,
            const std::string_view section,
            const std::string_view key,
            std::int64_t& target,
            std::vector<std::string>& errors
        ) {
            const auto node = table[key];
            if (!node) {
                return;
            }
            if (const auto value = node.value_exact<std::int64_t>()) {
                target = *value;
            } else {
                errors.push_back(qualified(section, key) + " must be an integer");
            }
        }

        void read_string(
            const toml::table& table,
            const std::string_view section,
            const std::string_view key,
            std::string& target,
            std::vector<std::string>& errors
        ) {
            const auto node = table[key];
            if (!node) {
                return;
            }
            if (auto value = node.value_exact<std::string>()) {
                target = std::move(*value);
            } else {
                errors.push_back(qualified(section, key) + " must be a string");
            }
        }

        void read_string_array(
            const toml::table& table,
            const std::string_view section,
            const std::string_view key,
            std::vector<std::string>& target,
            std::vector<std::string>& errors
        ) {
            const auto node = table[key];
            if (!node) {
                return;
            }
            const auto* array = node.as_array();
            if (!array) {
                errors.push_back(qualified(section, key) + " must be an array of strings");
                return;
            }

            std::vector<std::string> values;
            values.reserve(array->size());
            for (const auto& element : *array) {
                auto value = element.value_exact<std::string>();
                if (!value) {
                    errors.push_back(qualified(section, key) + " must be an array of strings");
                    return;
                }
                values.push_back(std::move(*value));
            }
            target = std::move(values);
        }

        toml::array to_toml_array(const std::vector<std::string>& values) {
            toml::array array;
            for (const auto& value : values) {
                array.push_back(value);
            }
            return array;
        }

    }  // namespace

    Result<Config, Error> Config::load_from_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<Config, Error>::failure(
                Error::not_found("Configuration file not found", path.string())
            );
        }

        std::ifstream file(path);
        if (!file) {
            return Result<Config, Error>::failure(
                Error::io_error("Failed to open configuration file", path.string())
            );
        }

        std::ostringstream content;
        content << file.rdbuf();

        auto config = load_from_string(content.str());
        if (config.is_err()) {
            return Result<Config, Error>::failure(config.error().with_context(path.string()));
        }
        log::debug("Loaded configuration from " + path.string());
        return config;
    }

    Result<Config, Error> Config::load_from_string(const std::string_view content) {
        toml::table root;
        try {
            root = toml::parse(content);
        } catch (const toml::parse_error& err) {
            return Result<Config, Error>::failure(
                Error::config_error("Failed to parse TOML configuration", std::string(err.description()))
            );
        }

        Config config;
        std::vector<std::string> errors;

        if (const auto* mining = section_table(root, "mining", errors)) {
            read_integer(*mining, "mining", "days_back", config.mining.days_back, errors);
            read_string(*mining, "mining", "branch", config.mining.branch, errors);
            read_string_array(*mining, "mining", "fallback_branches", config.mining.fallback_branches, errors);
            read_string_array(*mining, "mining", "contributors", config.mining.contributors, errors);
            read_integer(*mining, "mining", "parallel_jobs", config.mining.parallel_jobs, errors);
        }

        if (const auto* structure = section_table(root, "structure", errors)) {
            read_integer(*structure, "structure", "max_depth", config.structure.max_depth, errors);
            read_integer(*structure, "structure", "max_entries", config.structure.max_entries, errors);
        }

        if (const auto* logging = section_table(root, "logging", errors)) {
            read_string(*logging, "logging", "level", config.logging.level, errors);
        }

        if (!errors.empty()) {
            return Result<Config, Error>::failure(
                Error::config_error("Invalid configuration", string_utils::join(errors, "; "))
            );
        }

        if (auto validation = config.validate(); validation.is_err()) {
            return Result<Config, Error>::failure(validation.error());
        }

        return Result<Config, Error>::success(std::move(config));
    }

    Config Config::default_config() {
        return Config{};
    }

    Result<void, Error> Config::validate() const {
        std::vector<std::string> errors;

        constexpr std::int64_t int_max = std::numeric_limits<int>::max();
        if (mining.days_back < 0 || mining.days_back > int_max) {
            errors.emplace_back("mining.days_back must be between 0 and " + std::to_string(int_max));
        }
        if (mining.parallel_jobs < 1 || mining.parallel_jobs > int_max) {
            errors.emplace_back("mining.parallel_jobs must be between 1 and " + std::to_string(int_max));
        }
        for (const auto& branch : mining.fallback_branches) {
            if (branch.empty()) {
                errors.emplace_back("mining.fallback_branches must not contain empty names");
                break;
            }
        }
        if (structure.max_depth < 0) {
            errors.emplace_back("structure.max_depth must be non-negative");
        }
        if (structure.max_entries < 0) {
            errors.emplace_back("structure.max_entries must be non-negative");
        }
        if (!log::level_from_string(logging.level)) {
            errors.emplace_back("logging.level must be one of error, warn, info, debug");
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Configuration validation failed", string_utils::join(errors, "; "))
            );
        }

        return Result<void, Error>::success();
    }

    mining::MiningOptions Config::to_options() const {
        mining::MiningOptions options;
        options.days_back = static_cast<int>(mining.days_back);
        if (!mining.branch.empty()) {
            options.branch = mining.branch;
        }
        options.fallback_branches = mining.fallback_branches;
        if (!mining.contributors.empty()) {
            options.contributor_filter.emplace(mining.contributors.begin(), mining.contributors.end());
        }
        options.parallel_jobs = static_cast<unsigned int>(mining.parallel_jobs);
        options.structure_limits.max_depth = static_cast<std::size_t>(structure.max_depth);
        options.structure_limits.max_entries = static_cast<std::size_t>(structure.max_entries);
        return options;
    }

    std::string Config::to_string() const {
        toml::table root{
            {"mining", toml::table{
                {"days_back", mining.days_back},
                {"branch", mining.branch},
                {"fallback_branches", to_toml_array(mining.fallback_branches)},
                {"contributors", to_toml_array(mining.contributors)},
                {"parallel_jobs", mining.parallel_jobs},
            }},
            {"structure", toml::table{
                {"max_depth", structure.max_depth},
                {"max_entries", structure.max_entries},
            }},
            {"logging", toml::table{
                {"level", logging.level},
            }},
        };

        std::ostringstream ss;
        ss << root << "\n";
        return ss.str();
    }

}  // namespace gitmine
