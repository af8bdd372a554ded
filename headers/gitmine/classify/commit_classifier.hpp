//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_COMMIT_CLASSIFIER_HPP
#define GITMINE_COMMIT_CLASSIFIER_HPP

/**
 * @file commit_classifier.hpp
 * @brief Keyword heuristics that assign a category to a commit message.
 *
 * The lower-cased message is searched for keywords, category by category,
 * in this order; the first category with a hit wins:
 *
 * | Category | Keywords                          |
 * |----------|-----------------------------------|
 * | fix      | fix, bug, issue, error            |
 * | feature  | feat, add, implement, new         |
 * | refactor | refactor, clean, restructure      |
 * | docs     | doc, readme, comment              |
 * | other    | (no keyword matched)              |
 *
 * Keywords match as substrings, so "address" counts as "add" and
 * "cleanup" as "clean".
 */

#include "gitmine/types.hpp"

#include <span>
#include <string_view>

namespace gitmine::classify
{
    struct CategoryRule {
        CommitCategory category;
        std::span<const std::string_view> keywords;
    };

    /**
     * The rules in priority order.
     */
    [[nodiscard]] std::span<const CategoryRule> category_rules() noexcept;

    [[nodiscard]] CommitCategory classify(std::string_view message);

}  // namespace gitmine::classify

#endif //GITMINE_COMMIT_CLASSIFIER_HPP
