//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/diff/diff_stats.hpp"

#include <ranges>

namespace gitmine::diff
{
    LineCounts count_lines(const std::string_view diff_text) noexcept {
        LineCounts counts;

        std::size_t start = 0;
        while (start < diff_text.size()) {
            auto end = diff_text.find('\n', start);
            if (end == std::string_view::npos) {
                end = diff_text.size();
            }

            const auto line = diff_text.substr(start, end - start);
            if (!line.empty()) {
                if (line.front() == '+' && !line.starts_with("+++")) {
                    ++counts.added;
                } else if (line.front() == '-' && !line.starts_with("---")) {
                    ++counts.deleted;
                }
            }

            start = end + 1;
        }

        return counts;
    }

    LineCounts count_lines(const FileDiffs& diffs) noexcept {
        LineCounts total;
        for (const auto& body : diffs | std::views::values) {
            const auto counts = count_lines(body);
            total.added += counts.added;
            total.deleted += counts.deleted;
        }
        return total;
    }

}  // namespace gitmine::diff
