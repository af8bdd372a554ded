//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/types.hpp"
#include "gitmine/classify/commit_classifier.hpp"
#include "gitmine/diff/diff_stats.hpp"
#include "gitmine/utils/string_utils.hpp"

namespace gitmine {

    std::optional<CommitCategory> category_from_string(const std::string_view str) {
        const auto lower = string_utils::to_lower(string_utils::trim(str));
        if (lower == "fix") return CommitCategory::Fix;
        if (lower == "feature") return CommitCategory::Feature;
        if (lower == "refactor") return CommitCategory::Refactor;
        if (lower == "docs") return CommitCategory::Docs;
        if (lower == "other") return CommitCategory::Other;
        return std::nullopt;
    }

    CommitRecord CommitRecord::create(
        std::string hash,
        std::string author_name,
        std::string author_email,
        const Timestamp timestamp,
        const std::string_view message,
        FileDiffs diffs
    ) {
        CommitRecord record;
        record.hash_ = std::move(hash);
        record.author_name_ = std::move(author_name);
        record.author_email_ = std::move(author_email);
        record.timestamp_ = timestamp;
        record.message_ = std::string(string_utils::trim(message));
        record.diffs_ = std::move(diffs);

        const auto counts = diff::count_lines(record.diffs_);
        record.lines_added_ = counts.added;
        record.lines_deleted_ = counts.deleted;
        record.category_ = classify::classify(record.message_);

        return record;
    }

    void ContributorRollup::add(const CommitRecord& record) {
        if (commits == 0) {
            email = record.author_email();
        }
        ++commits;
        lines_added += record.lines_added();
        lines_deleted += record.lines_deleted();
        files_changed += record.files_changed();
    }

    std::string describe_period(const int days_back) {
        if (days_back > 0) {
            return "Last " + std::to_string(days_back) + " days";
        }
        return "All time";
    }

}  // namespace gitmine
