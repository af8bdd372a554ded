//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_TYPES_HPP
#define GITMINE_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures produced by a mining pass.
 *
 * - Basic Types: Duration, Timestamp
 * - Commit data: CommitCategory, FileDiffs, LineCounts, CommitRecord
 * - Aggregates: ContributorRollup, StructureEntry, MiningResult
 *
 * Everything here is owned by one mining invocation and is never shared
 * between invocations.
 */

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace gitmine {

    namespace fs = std::filesystem;

    // ============================================================================
    // Basic Types
    // ============================================================================

    using Duration = std::chrono::nanoseconds;

    using Timestamp = std::chrono::system_clock::time_point;

    // ============================================================================
    // Commit Data
    // ============================================================================

    /**
     * Category assigned to a commit from its message.
     */
    enum class CommitCategory {
        Fix,
        Feature,
        Refactor,
        Docs,
        Other
    };

    inline const char* to_string(CommitCategory category) noexcept {
        switch (category) {
            case CommitCategory::Fix:      return "fix";
            case CommitCategory::Feature:  return "feature";
            case CommitCategory::Refactor: return "refactor";
            case CommitCategory::Docs:     return "docs";
            case CommitCategory::Other:    return "other";
        }
        return "other";
    }

    std::optional<CommitCategory> category_from_string(std::string_view str);

    /**
     * File path -> unified-diff body of that file. Paths are unique within a
     * commit; ordering carries no meaning.
     */
    using FileDiffs = std::map<std::string, std::string>;

    /**
     * Body substituted when a file has no textual patch (binary, mode change).
     */
    inline constexpr std::string_view NO_DIFF_CONTENT = "No diff content available";

    struct LineCounts {
        std::size_t added = 0;
        std::size_t deleted = 0;

        bool operator==(const LineCounts&) const = default;
    };

    /**
     * Immutable per-commit fact extracted by the miner.
     *
     * The derived fields (line counts, files changed, category) are computed
     * once by create() from the diffs and the message, so they always agree
     * with the data they were derived from.
     */
    class CommitRecord {
    public:
        /**
         * Builds a record, trimming the message and deriving all counts.
         */
        static CommitRecord create(
            std::string hash,
            std::string author_name,
            std::string author_email,
            Timestamp timestamp,
            std::string_view message,
            FileDiffs diffs
        );

        [[nodiscard]] const std::string& hash() const noexcept { return hash_; }
        [[nodiscard]] const std::string& author_name() const noexcept { return author_name_; }
        [[nodiscard]] const std::string& author_email() const noexcept { return author_email_; }
        [[nodiscard]] Timestamp timestamp() const noexcept { return timestamp_; }
        [[nodiscard]] const std::string& message() const noexcept { return message_; }
        [[nodiscard]] const FileDiffs& diffs() const noexcept { return diffs_; }
        [[nodiscard]] std::size_t lines_added() const noexcept { return lines_added_; }
        [[nodiscard]] std::size_t lines_deleted() const noexcept { return lines_deleted_; }
        [[nodiscard]] std::size_t files_changed() const noexcept { return diffs_.size(); }
        [[nodiscard]] CommitCategory category() const noexcept { return category_; }

    private:
        CommitRecord() = default;

        std::string hash_;
        std::string author_name_;
        std::string author_email_;
        Timestamp timestamp_;
        std::string message_;
        FileDiffs diffs_;
        std::size_t lines_added_ = 0;
        std::size_t lines_deleted_ = 0;
        CommitCategory category_ = CommitCategory::Other;
    };

    // ============================================================================
    // Aggregates
    // ============================================================================

    /**
     * Running totals for one author name.
     */
    struct ContributorRollup {
        std::string email;              // From the first commit seen
        std::size_t commits = 0;
        std::size_t lines_added = 0;
        std::size_t lines_deleted = 0;
        std::size_t files_changed = 0;

        void add(const CommitRecord& record);

        [[nodiscard]] long long net_lines() const noexcept {
            return static_cast<long long>(lines_added) - static_cast<long long>(lines_deleted);
        }
    };

    /**
     * One directory of the shallow repository overview.
     */
    struct StructureEntry {
        std::string relative_path;      // "." for the root
        std::size_t file_count = 0;

        bool operator==(const StructureEntry&) const = default;
    };

    using RepositoryStructure = std::vector<StructureEntry>;

    /**
     * Complete output of one mining invocation.
     *
     * Invariant: commits.size() equals the sum of contributors[*].commits.
     */
    struct MiningResult {
        std::string repo_name;
        std::string period;
        std::optional<std::set<std::string>> contributor_filter;  // nullopt = all
        std::string branch;
        std::vector<CommitRecord> commits;       // Walk order (newest first)
        std::map<std::string, ContributorRollup> contributors;
        RepositoryStructure repository_structure;
        std::vector<std::string> warnings;

        [[nodiscard]] std::size_t total_commits() const noexcept {
            return commits.size();
        }
    };

    /**
     * Human-readable description of a day window: "Last N days" or "All time".
     */
    std::string describe_period(int days_back);

}  // namespace gitmine

#endif //GITMINE_TYPES_HPP
