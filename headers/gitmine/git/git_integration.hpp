//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_GIT_INTEGRATION_HPP
#define GITMINE_GIT_INTEGRATION_HPP

/**
 * @file git_integration.hpp
 * @brief Thin layer over the git command line.
 *
 * Provides:
 * - Executing git commands with a timeout
 * - Repository discovery and ref verification
 * - Commit listing with parents and committer time
 * - Patch retrieval for a commit against a parent or the empty tree
 *
 * Arguments are shell-quoted before execution, so refs and paths taken
 * from user input are passed through verbatim.
 */

#include "gitmine/error.hpp"
#include "gitmine/result.hpp"
#include "gitmine/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitmine::git
{
    /**
     * Field separator inside one commit record of the log format.
     */
    inline constexpr char FIELD_SEPARATOR = '\x1f';

    /**
     * Terminator of one commit record of the log format.
     */
    inline constexpr char RECORD_SEPARATOR = '\x1e';

    /**
     * Commit metadata as listed by git, before any diff analysis.
     */
    struct RawCommit {
        std::string hash;                   // Full SHA
        std::vector<std::string> parents;   // Empty for a root commit
        std::string author_name;
        std::string author_email;
        Timestamp commit_time;              // Committer time
        std::string message;                // Raw body, untrimmed

        [[nodiscard]] bool is_merge() const noexcept {
            return parents.size() > 1;
        }

        [[nodiscard]] bool is_root() const noexcept {
            return parents.empty();
        }
    };

    struct CommandResult {
        int exit_code = 0;
        std::string stdout_output;
        std::string stderr_output;
        Duration execution_time = Duration::zero();
    };

    /**
     * Executes a git command.
     *
     * @param args Command arguments (without "git" prefix).
     * @param working_dir Working directory for the command.
     * @param timeout Maximum execution time.
     * @return Command result, or an error if the directory is missing or
     *         the command timed out. A non-zero exit code is not an error.
     */
    [[nodiscard]] Result<CommandResult, Error> execute_git(
        const std::vector<std::string>& args,
        const fs::path& working_dir = fs::current_path(),
        Duration timeout = std::chrono::seconds(30)
    );

    /**
     * Quotes one argument for /bin/sh. Plain words are returned unchanged.
     */
    [[nodiscard]] std::string shell_quote(std::string_view arg);

    [[nodiscard]] bool is_git_repository(const fs::path& dir);

    /**
     * Gets the top-level directory of the working copy containing dir.
     */
    [[nodiscard]] Result<fs::path, Error> get_repository_root(
        const fs::path& dir = fs::current_path()
    );

    /**
     * Checks whether ref resolves to a commit.
     */
    [[nodiscard]] bool ref_exists(
        const std::string& ref,
        const fs::path& repo_dir = fs::current_path()
    );

    /**
     * Log format understood by parse_commit_record().
     */
    [[nodiscard]] std::string commit_log_format();

    /**
     * Parses one record produced with commit_log_format().
     *
     * Fields: hash, parents (space separated), author name, author email,
     * committer unix time, raw message.
     */
    [[nodiscard]] Result<RawCommit, Error> parse_commit_record(std::string_view record);

    /**
     * Parses the whole output of a log run into commits, in output order.
     */
    [[nodiscard]] Result<std::vector<RawCommit>, Error> parse_commit_log(std::string_view output);

    /**
     * Lists commits reachable from ref, newest first.
     *
     * @param ref Branch, tag or commit to walk from.
     * @param since When set, only commits with committer time at or after it.
     */
    [[nodiscard]] Result<std::vector<RawCommit>, Error> list_commits(
        const std::string& ref,
        std::optional<Timestamp> since,
        const fs::path& repo_dir = fs::current_path()
    );

    /**
     * Gets the parent hashes of a commit, first parent first.
     */
    [[nodiscard]] Result<std::vector<std::string>, Error> get_parents(
        const std::string& commit,
        const fs::path& repo_dir = fs::current_path()
    );

    /**
     * Gets the raw patch of commit against parent, or against the empty
     * tree when parent is not set. Renames are reported as delete + add.
     */
    [[nodiscard]] Result<std::string, Error> get_patch(
        const std::string& commit,
        const std::optional<std::string>& parent,
        const fs::path& repo_dir = fs::current_path()
    );

}  // namespace gitmine::git

#endif //GITMINE_GIT_INTEGRATION_HPP
