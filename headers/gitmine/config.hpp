//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_CONFIG_HPP
#define GITMINE_CONFIG_HPP

/**
 * @file config.hpp
 * @brief TOML configuration of a mining run.
 *
 * @code
 * [mining]
 * days_back = 30
 * branch = ""                     # empty: main -> master -> HEAD
 * fallback_branches = ["main", "master"]
 * contributors = []               # empty: everyone
 * parallel_jobs = 1
 *
 * [structure]
 * max_depth = 2
 * max_entries = 10
 *
 * [logging]
 * level = "warn"
 * @endcode
 *
 * Missing tables and keys keep their defaults; unknown keys are ignored.
 */

#include "gitmine/error.hpp"
#include "gitmine/mining/history_miner.hpp"
#include "gitmine/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gitmine {

    /**
     * File looked up in the repository root when no --config is given.
     */
    inline constexpr std::string_view DEFAULT_CONFIG_FILE = ".gitmine.toml";

    struct MiningConfig {
        std::int64_t days_back = 30;
        std::string branch;
        std::vector<std::string> fallback_branches = {"main", "master"};
        std::vector<std::string> contributors;
        std::int64_t parallel_jobs = 1;
    };

    struct StructureConfig {
        std::int64_t max_depth = 2;
        std::int64_t max_entries = 10;
    };

    struct LoggingConfig {
        std::string level = "warn";
    };

    class Config {
    public:
        MiningConfig mining;
        StructureConfig structure;
        LoggingConfig logging;

        /**
         * Loads configuration from a TOML file.
         *
         * @return The configuration, NotFound if the file is missing, or
         *         ConfigError if it is malformed or fails validation.
         */
        static Result<Config, Error> load_from_file(const fs::path& path);

        static Result<Config, Error> load_from_string(std::string_view content);

        static Config default_config();

        /**
         * Checks value ranges; every violation is listed in the message.
         */
        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Builds mining options. An empty branch selects the fallback
         * policy, an empty contributor list disables the filter.
         */
        [[nodiscard]] mining::MiningOptions to_options() const;

        /**
         * Serializes back to TOML.
         */
        [[nodiscard]] std::string to_string() const;
    };

}  // namespace gitmine

#endif //GITMINE_CONFIG_HPP
