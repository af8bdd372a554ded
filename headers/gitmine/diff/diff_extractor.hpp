//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_DIFF_EXTRACTOR_HPP
#define GITMINE_DIFF_EXTRACTOR_HPP

/**
 * @file diff_extractor.hpp
 * @brief Per-file diff bodies of a single commit.
 *
 * A commit with parents is diffed against its first parent only; a root
 * commit against the empty tree. The history miner talks to the
 * IDiffExtractor interface so that extraction can be replaced in tests or
 * run on worker threads.
 */

#include "gitmine/error.hpp"
#include "gitmine/result.hpp"
#include "gitmine/types.hpp"

#include <string>

namespace gitmine::diff
{
    class IDiffExtractor {
    public:
        virtual ~IDiffExtractor() = default;

        /**
         * Extracts the diff bodies of a commit.
         *
         * @param commit_id Any revision that resolves to a commit.
         * @return The bodies keyed by path, or an error when the repository
         *         or the commit cannot be read.
         */
        [[nodiscard]] virtual Result<FileDiffs, Error> extract(const std::string& commit_id) const = 0;
    };

    /**
     * Extractor backed by the git command line.
     */
    class GitDiffExtractor final : public IDiffExtractor {
    public:
        explicit GitDiffExtractor(fs::path repo_root);

        [[nodiscard]] Result<FileDiffs, Error> extract(const std::string& commit_id) const override;

        [[nodiscard]] const fs::path& repo_root() const noexcept { return repo_root_; }

    private:
        fs::path repo_root_;
    };

    /**
     * Convenience form: any failure is logged as a warning and yields an
     * empty mapping, which callers must read as "no detectable diff".
     */
    [[nodiscard]] FileDiffs extract_diffs(const fs::path& repo_root, const std::string& commit_id);

}  // namespace gitmine::diff

#endif //GITMINE_DIFF_EXTRACTOR_HPP
