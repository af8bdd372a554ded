//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_JSON_EXPORT_HPP
#define GITMINE_JSON_EXPORT_HPP

/**
 * @file json_export.hpp
 * @brief Serializes a MiningResult for a process boundary.
 *
 * Layout:
 * @code
 * {
 *   "repo_name": "gitmine",
 *   "period": "Last 30 days",
 *   "filtered_by": "All contributors",      // or ["alice", "bob"]
 *   "branch": "main",
 *   "total_commits": 1,
 *   "commits": [{"hash", "author", "email", "date", "message", "category",
 *                "diffs", "lines_added", "lines_deleted", "files_changed"}],
 *   "contributors": {"alice": {"email", "commits", "lines_added",
 *                              "lines_deleted", "files_changed"}},
 *   "repository_structure": [{"path": ".", "files": 4}],
 *   "warnings": [],
 *   "summary": {...}                         // only with include_summary
 * }
 * @endcode
 */

#include "gitmine/error.hpp"
#include "gitmine/result.hpp"
#include "gitmine/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace gitmine::json
{
    /**
     * Text of "filtered_by" when no contributor filter is set.
     */
    inline constexpr std::string_view ALL_CONTRIBUTORS = "All contributors";

    struct ExportOptions {
        bool pretty_print = true;
        bool include_diffs = true;          // Per-file diff bodies of each commit
        bool include_summary = false;       // Derived views under "summary"
    };

    [[nodiscard]] nlohmann::json to_json(
        const MiningResult& result,
        const ExportOptions& options = {}
    );

    [[nodiscard]] std::string to_string(
        const MiningResult& result,
        const ExportOptions& options = {}
    );

    [[nodiscard]] Result<void, Error> write_file(
        const fs::path& path,
        const MiningResult& result,
        const ExportOptions& options = {}
    );

}  // namespace gitmine::json

#endif //GITMINE_JSON_EXPORT_HPP
