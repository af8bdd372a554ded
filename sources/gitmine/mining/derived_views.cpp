//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/mining/derived_views.hpp"
#include "gitmine/utils/string_utils.hpp"

#include <ranges>

namespace gitmine::mining
{
    CountMap commit_type_counts(const MiningResult& result) {
        CountMap counts;
        for (const auto& commit : result.commits) {
            ++counts[to_string(commit.category())];
        }
        return counts;
    }

    CountMap file_type_counts(const MiningResult& result) {
        CountMap counts;
        for (const auto& commit : result.commits) {
            for (const auto& path : commit.diffs() | std::views::keys) {
                auto ext = fs::path(path).extension().string();
                if (!ext.empty()) {
                    ++counts[ext];
                }
            }
        }
        return counts;
    }

    CountMap day_activity(const MiningResult& result) {
        CountMap counts;
        for (const auto& commit : result.commits) {
            ++counts[string_utils::format_timestamp(commit.timestamp(), "%A")];
        }
        return counts;
    }

    CountMap file_change_counts(const MiningResult& result) {
        CountMap counts;
        for (const auto& commit : result.commits) {
            for (const auto& path : commit.diffs() | std::views::keys) {
                ++counts[path];
            }
        }
        return counts;
    }

    MiningTotals totals(const MiningResult& result) {
        MiningTotals t;
        t.commits = result.total_commits();
        t.contributors = result.contributors.size();
        for (const auto& commit : result.commits) {
            t.lines_added += commit.lines_added();
            t.lines_deleted += commit.lines_deleted();
            t.files_changed += commit.files_changed();
        }
        return t;
    }

}  // namespace gitmine::mining
