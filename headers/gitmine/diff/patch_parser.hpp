//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_PATCH_PARSER_HPP
#define GITMINE_PATCH_PARSER_HPP

/**
 * @file patch_parser.hpp
 * @brief Splits git patch output into per-file diff bodies.
 *
 * Input is the output of "git diff-tree -p" (or "git diff"): one section
 * per file, each starting with a "diff --git" header line. For each section
 * the body is the text from the first hunk header ("@@") to the end of the
 * section. Sections without hunks (binary files, mode-only changes, empty
 * files) get NO_DIFF_CONTENT.
 *
 * The path of a section is the post-change path from "+++ b/<path>"; for a
 * deleted file the pre-change path from "--- a/<path>"; when neither line
 * exists, the path from the "diff --git" header. Sections where no path can
 * be recovered are dropped.
 */

#include "gitmine/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace gitmine::diff
{
    [[nodiscard]] FileDiffs parse_patch(std::string_view patch);

    /**
     * Decodes a path as printed by git: strips surrounding quotes and
     * C-style escapes (\t, \n, \", \\, octal bytes), then the "a/" or "b/"
     * prefix. Returns nullopt for "/dev/null".
     */
    [[nodiscard]] std::optional<std::string> decode_patch_path(std::string_view raw);

}  // namespace gitmine::diff

#endif //GITMINE_PATCH_PARSER_HPP
