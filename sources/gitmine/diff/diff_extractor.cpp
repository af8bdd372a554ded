//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/diff/diff_extractor.hpp"
#include "gitmine/diff/patch_parser.hpp"
#include "gitmine/git/git_integration.hpp"
#include "gitmine/log.hpp"

#include <optional>

namespace gitmine::diff
{
    GitDiffExtractor::GitDiffExtractor(fs::path repo_root)
        : repo_root_(std::move(repo_root)) {}

    Result<FileDiffs, Error> GitDiffExtractor::extract(const std::string& commit_id) const {
        auto parents = git::get_parents(commit_id, repo_root_);
        if (parents.is_err()) {
            return Result<FileDiffs, Error>::failure(parents.error());
        }

        std::optional<std::string> first_parent;
        if (!parents.value().empty()) {
            first_parent = parents.value().front();
        }

        auto patch = git::get_patch(commit_id, first_parent, repo_root_);
        if (patch.is_err()) {
            return Result<FileDiffs, Error>::failure(patch.error());
        }

        return Result<FileDiffs, Error>::success(parse_patch(patch.value()));
    }

    FileDiffs extract_diffs(const fs::path& repo_root, const std::string& commit_id) {
        const GitDiffExtractor extractor(repo_root);
        auto diffs = extractor.extract(commit_id);
        if (diffs.is_err()) {
            log::warn("Error getting diffs for " + commit_id + ": " + diffs.error().to_string());
            return {};
        }
        return std::move(diffs).value();
    }

}  // namespace gitmine::diff
