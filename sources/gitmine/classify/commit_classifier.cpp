//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/classify/commit_classifier.hpp"
#include "gitmine/utils/string_utils.hpp"

#include <algorithm>
#include <array>

namespace gitmine::classify
{
    namespace {

        constexpr std::array<std::string_view, 4> FIX_KEYWORDS = {"fix", "bug", "issue", "error"};
        constexpr std::array<std::string_view, 4> FEATURE_KEYWORDS = {"feat", "add", "implement", "new"};
        constexpr std::array<std::string_view, 3> REFACTOR_KEYWORDS = {"refactor", "clean", "restructure"};
        constexpr std::array<std::string_view, 3> DOCS_KEYWORDS = {"doc", "readme", "comment"};

        constexpr std::array<CategoryRule, 4> RULES = {{
            {CommitCategory::Fix, FIX_KEYWORDS},
            {CommitCategory::Feature, FEATURE_KEYWORDS},
            {CommitCategory::Refactor, REFACTOR_KEYWORDS},
            {CommitCategory::Docs, DOCS_KEYWORDS},
        }};

    }  // namespace

    std::span<const CategoryRule> category_rules() noexcept {
        return RULES;
    }

    CommitCategory classify(const std::string_view message) {
        const auto lower = string_utils::to_lower(message);

        for (const auto& rule : RULES) {
            const bool hit = std::ranges::any_of(rule.keywords, [&lower](const std::string_view keyword) {
                return string_utils::contains(lower, keyword);
            });
            if (hit) {
                return rule.category;
            }
        }

        return CommitCategory::Other;
    }

}  // namespace gitmine::classify
