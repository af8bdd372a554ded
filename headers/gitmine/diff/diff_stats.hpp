//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_DIFF_STATS_HPP
#define GITMINE_DIFF_STATS_HPP

/**
 * @file diff_stats.hpp
 * @brief Added/deleted line counting on unified-diff text.
 *
 * A line is added when it starts with '+' but not "+++", deleted when it
 * starts with '-' but not "---". Context lines, hunk headers ("@@") and
 * metadata lines are ignored. This is a textual count, not a semantic diff.
 */

#include "gitmine/types.hpp"

#include <string_view>

namespace gitmine::diff
{
    /**
     * Counts added and deleted lines of one diff body. Pure; empty text
     * yields (0, 0).
     */
    [[nodiscard]] LineCounts count_lines(std::string_view diff_text) noexcept;

    /**
     * Sums count_lines() over every body of a commit.
     */
    [[nodiscard]] LineCounts count_lines(const FileDiffs& diffs) noexcept;

}  // namespace gitmine::diff

#endif //GITMINE_DIFF_STATS_HPP
