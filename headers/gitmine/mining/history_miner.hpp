//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_HISTORY_MINER_HPP
#define GITMINE_HISTORY_MINER_HPP

/**
 * @file history_miner.hpp
 * @brief Walks a commit range and aggregates per-commit and per-contributor
 *        statistics into a MiningResult.
 *
 * Pipeline for one invocation:
 * 1. Resolve the branch (explicit ref, or main -> master -> full HEAD history)
 * 2. Drop merge commits, then commits by authors outside the filter
 * 3. Extract diffs per commit (optionally on a thread pool)
 * 4. Build CommitRecords and fold them into contributor rollups in walk order
 *
 * Only an unreadable repository is fatal. Missing branches and unreadable
 * diffs become warnings on the result and the pass continues.
 */

#include "gitmine/diff/diff_extractor.hpp"
#include "gitmine/error.hpp"
#include "gitmine/git/git_integration.hpp"
#include "gitmine/result.hpp"
#include "gitmine/structure/repository_structure.hpp"
#include "gitmine/types.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace gitmine::mining
{
    /**
     * Parameters of one mining pass.
     */
    struct MiningOptions {
        /// Day window; 0 disables the date filter
        int days_back = 30;

        /// Author names to keep; nullopt keeps everyone
        std::optional<std::set<std::string>> contributor_filter;

        /// Ref to mine; nullopt applies the fallback policy
        std::optional<std::string> branch;

        /// Refs tried in order before falling back to the full HEAD history
        std::vector<std::string> fallback_branches = {"main", "master"};

        /// Diff extraction workers; 1 extracts on the calling thread
        unsigned int parallel_jobs = 1;

        bool include_structure = true;
        structure::StructureLimits structure_limits;

        /// "Now" for the date window; defaults to the system clock
        std::optional<Timestamp> reference_time;
    };

    /**
     * Source of commit listings.
     */
    class ICommitWalker {
    public:
        virtual ~ICommitWalker() = default;

        /**
         * Lists commits reachable from ref, newest first.
         *
         * @param since When set, only commits with committer time >= since.
         * @return The commits, or an error when ref cannot be resolved.
         */
        [[nodiscard]] virtual Result<std::vector<git::RawCommit>, Error> walk(
            const std::string& ref,
            std::optional<Timestamp> since
        ) const = 0;
    };

    class GitCommitWalker final : public ICommitWalker {
    public:
        explicit GitCommitWalker(fs::path repo_root);

        [[nodiscard]] Result<std::vector<git::RawCommit>, Error> walk(
            const std::string& ref,
            std::optional<Timestamp> since
        ) const override;

    private:
        fs::path repo_root_;
    };

    /**
     * Orchestrates one pass over the history exposed by a walker.
     *
     * Fills commits, contributors, period, filter, branch and warnings.
     * repo_name and repository_structure are left to mine(), which knows
     * the working copy.
     */
    class HistoryMiner {
    public:
        HistoryMiner(const ICommitWalker& walker, const diff::IDiffExtractor& extractor);

        [[nodiscard]] MiningResult run(const MiningOptions& options) const;

    private:
        struct ResolvedHistory {
            std::string ref;
            std::vector<git::RawCommit> commits;
        };

        [[nodiscard]] ResolvedHistory resolve_history(
            const MiningOptions& options,
            std::optional<Timestamp> since,
            std::vector<std::string>& warnings
        ) const;

        [[nodiscard]] std::vector<Result<FileDiffs, Error>> extract_all(
            const std::vector<const git::RawCommit*>& commits,
            unsigned int parallel_jobs
        ) const;

        const ICommitWalker& walker_;
        const diff::IDiffExtractor& extractor_;
    };

    /**
     * Start of the date window for options, or nullopt when days_back <= 0.
     */
    [[nodiscard]] std::optional<Timestamp> window_start(const MiningOptions& options);

    /**
     * Mines the git working copy at repo_root.
     *
     * @return The mining result, or an error when repo_root does not exist
     *         or is not a git working copy. No partial result is produced.
     */
    [[nodiscard]] Result<MiningResult, Error> mine(
        const fs::path& repo_root,
        const MiningOptions& options = {}
    );

}  // namespace gitmine::mining

#endif //GITMINE_HISTORY_MINER_HPP
