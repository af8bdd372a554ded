//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/mining/history_miner.hpp"
#include "gitmine/log.hpp"
#include "gitmine/utils/parallel.hpp"

#include <algorithm>
#include <chrono>

namespace gitmine::mining
{
    namespace {

        std::string short_hash(const std::string& hash) {
            return hash.substr(0, 8);
        }

        void add_warning(std::vector<std::string>& warnings, std::string message) {
            log::warn(message);
            warnings.push_back(std::move(message));
        }

        bool passes_filter(const git::RawCommit& commit, const MiningOptions& options) {
            if (commit.is_merge()) {
                return false;
            }
            const auto& filter = options.contributor_filter;
            if (filter && !filter->empty() && !filter->contains(commit.author_name)) {
                return false;
            }
            return true;
        }

        std::string repository_name(const fs::path& root) {
            auto name = root.filename().string();
            if (name.empty() || name == "." || name == "..") {
                name = root.parent_path().filename().string();
            }
            return name.empty() ? "Unknown" : name;
        }

    }  // namespace

    // ============================================================================
    // GitCommitWalker
    // ============================================================================

    GitCommitWalker::GitCommitWalker(fs::path repo_root)
        : repo_root_(std::move(repo_root)) {}

    Result<std::vector<git::RawCommit>, Error> GitCommitWalker::walk(
        const std::string& ref,
        const std::optional<Timestamp> since
    ) const {
        if (!git::ref_exists(ref, repo_root_)) {
            return Result<std::vector<git::RawCommit>, Error>::failure(
                Error::not_found("Branch not found", ref)
            );
        }
        return git::list_commits(ref, since, repo_root_);
    }

    // ============================================================================
    // HistoryMiner
    // ============================================================================

    HistoryMiner::HistoryMiner(const ICommitWalker& walker, const diff::IDiffExtractor& extractor)
        : walker_(walker)
        , extractor_(extractor) {}

    std::optional<Timestamp> window_start(const MiningOptions& options) {
        if (options.days_back <= 0) {
            return std::nullopt;
        }
        const Timestamp now = options.reference_time.value_or(std::chrono::system_clock::now());

        // A window reaching past the clock's range covers all history
        using std::chrono::duration_cast;
        using std::chrono::seconds;
        const auto headroom = duration_cast<seconds>(now.time_since_epoch()).count()
                            - duration_cast<seconds>(Timestamp::min().time_since_epoch()).count();
        if (options.days_back > headroom / 86400) {
            return std::nullopt;
        }
        return now - std::chrono::hours(24) * options.days_back;
    }

    HistoryMiner::ResolvedHistory HistoryMiner::resolve_history(
        const MiningOptions& options,
        const std::optional<Timestamp> since,
        std::vector<std::string>& warnings
    ) const {
        if (options.branch) {
            const auto& branch = *options.branch;
            auto commits = walker_.walk(branch, since);
            if (commits.is_err()) {
                add_warning(warnings, "Error accessing branch '" + branch + "': " + commits.error().to_string());
                return {branch, {}};
            }
            if (commits.value().empty()) {
                add_warning(warnings, "No commits found in branch '" + branch + "' for the specified time period");
            }
            return {branch, std::move(commits).value()};
        }

        for (const auto& candidate : options.fallback_branches) {
            auto commits = walker_.walk(candidate, since);
            if (commits.is_err()) {
                log::debug("Skipping branch '" + candidate + "': " + commits.error().to_string());
                continue;
            }
            if (commits.value().empty()) {
                log::debug("No commits in window on '" + candidate + "'");
                continue;
            }
            log::info("Mining branch '" + candidate + "'");
            return {candidate, std::move(commits).value()};
        }

        // Last resort ignores the date window.
        log::info("Falling back to the full history of HEAD");
        auto commits = walker_.walk("HEAD", std::nullopt);
        if (commits.is_err()) {
            add_warning(warnings, "Could not read the history of HEAD: " + commits.error().to_string());
            return {"HEAD", {}};
        }
        return {"HEAD", std::move(commits).value()};
    }

    std::vector<Result<FileDiffs, Error>> HistoryMiner::extract_all(
        const std::vector<const git::RawCommit*>& commits,
        const unsigned int parallel_jobs
    ) const {
        auto extract_one = [this](const git::RawCommit* commit) {
            return extractor_.extract(commit->hash);
        };

        if (parallel_jobs > 1 && commits.size() > 1) {
            const auto workers = std::min<std::size_t>(parallel_jobs, commits.size());
            parallel::ThreadPool pool(static_cast<unsigned int>(workers));
            return parallel::map(commits, extract_one, pool);
        }

        std::vector<Result<FileDiffs, Error>> results;
        results.reserve(commits.size());
        for (const auto* commit : commits) {
            results.push_back(extract_one(commit));
        }
        return results;
    }

    MiningResult HistoryMiner::run(const MiningOptions& options) const {
        MiningResult result;
        result.period = describe_period(options.days_back);
        // An empty filter set means no filtering
        if (options.contributor_filter && !options.contributor_filter->empty()) {
            result.contributor_filter = options.contributor_filter;
        }

        auto history = resolve_history(options, window_start(options), result.warnings);
        result.branch = history.ref;

        std::vector<const git::RawCommit*> selected;
        selected.reserve(history.commits.size());
        for (const auto& commit : history.commits) {
            if (passes_filter(commit, options)) {
                selected.push_back(&commit);
            }
        }

        log::debug(
            "Selected " + std::to_string(selected.size()) + " of " +
            std::to_string(history.commits.size()) + " commits on " + history.ref
        );

        auto diffs = extract_all(selected, options.parallel_jobs);

        result.commits.reserve(selected.size());
        for (std::size_t i = 0; i < selected.size(); ++i) {
            const auto& raw = *selected[i];

            FileDiffs commit_diffs;
            if (diffs[i].is_ok()) {
                commit_diffs = std::move(diffs[i]).value();
            } else {
                add_warning(
                    result.warnings,
                    "Could not read diffs for commit " + short_hash(raw.hash) + ": " + diffs[i].error().to_string()
                );
            }

            auto record = CommitRecord::create(
                raw.hash,
                raw.author_name,
                raw.author_email,
                raw.commit_time,
                raw.message,
                std::move(commit_diffs)
            );

            result.contributors[record.author_name()].add(record);
            result.commits.push_back(std::move(record));
        }

        return result;
    }

    // ============================================================================
    // Entry point
    // ============================================================================

    Result<MiningResult, Error> mine(const fs::path& repo_root, const MiningOptions& options) {
        std::error_code ec;
        if (!fs::exists(repo_root, ec)) {
            return Result<MiningResult, Error>::failure(
                Error::not_found("Repository path not found", repo_root.string())
            );
        }

        auto root = git::get_repository_root(repo_root);
        if (root.is_err()) {
            return Result<MiningResult, Error>::failure(
                Error::git_error("Not a git repository", repo_root.string())
            );
        }

        const fs::path& top = root.value();
        log::info("Mining repository at " + top.string());

        const GitCommitWalker walker(top);
        const diff::GitDiffExtractor extractor(top);
        const HistoryMiner miner(walker, extractor);

        auto result = miner.run(options);
        result.repo_name = repository_name(top);

        if (options.include_structure) {
            auto structure = structure::snapshot(top, options.structure_limits);
            if (structure.is_ok()) {
                result.repository_structure = std::move(structure).value();
            } else {
                add_warning(result.warnings, "Could not read repository structure: " + structure.error().to_string());
            }
        }

        return Result<MiningResult, Error>::success(std::move(result));
    }

}  // namespace gitmine::mining
