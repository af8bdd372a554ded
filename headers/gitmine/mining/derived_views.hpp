//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_DERIVED_VIEWS_HPP
#define GITMINE_DERIVED_VIEWS_HPP

/**
 * @file derived_views.hpp
 * @brief Summaries computed on demand from the commits of a MiningResult.
 *
 * None of these are stored on the result; each call walks the commit
 * sequence again, so the views can never disagree with it.
 */

#include "gitmine/types.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace gitmine::mining
{
    using CountMap = std::map<std::string, std::size_t>;

    struct MiningTotals {
        std::size_t commits = 0;
        std::size_t contributors = 0;
        std::size_t lines_added = 0;
        std::size_t lines_deleted = 0;
        std::size_t files_changed = 0;

        bool operator==(const MiningTotals&) const = default;
    };

    /**
     * Category name -> number of commits.
     */
    [[nodiscard]] CountMap commit_type_counts(const MiningResult& result);

    /**
     * Extension (with the dot, e.g. ".cpp") -> number of file changes.
     * Files without an extension are not counted.
     */
    [[nodiscard]] CountMap file_type_counts(const MiningResult& result);

    /**
     * Weekday name of the commit time in local time ("Monday") -> commits.
     */
    [[nodiscard]] CountMap day_activity(const MiningResult& result);

    /**
     * Path -> number of commits that touched it.
     */
    [[nodiscard]] CountMap file_change_counts(const MiningResult& result);

    [[nodiscard]] MiningTotals totals(const MiningResult& result);

}  // namespace gitmine::mining

#endif //GITMINE_DERIVED_VIEWS_HPP
