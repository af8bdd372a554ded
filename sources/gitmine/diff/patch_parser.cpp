//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/diff/patch_parser.hpp"
#include "gitmine/utils/string_utils.hpp"

#include <vector>

namespace gitmine::diff
{
    namespace {

        constexpr std::string_view DIFF_HEADER = "diff --git ";

        std::string unquote(const std::string_view quoted) {
            std::string out;
            out.reserve(quoted.size());

            for (std::size_t i = 1; i + 1 < quoted.size(); ++i) {
                const char c = quoted[i];
                if (c != '\\' || i + 2 >= quoted.size()) {
                    out += c;
                    continue;
                }

                const char next = quoted[++i];
                switch (next) {
                    case 'a': out += '\a'; break;
                    case 'b': out += '\b'; break;
                    case 'f': out += '\f'; break;
                    case 'n': out += '\n'; break;
                    case 'r': out += '\r'; break;
                    case 't': out += '\t'; break;
                    case 'v': out += '\v'; break;
                    case '"': out += '"'; break;
                    case '\\': out += '\\'; break;
                    default:
                        if (next >= '0' && next <= '7') {
                            int value = 0;
                            std::size_t digits = 0;
                            --i;
                            while (digits < 3 && i + 1 < quoted.size() - 1 &&
                                   quoted[i + 1] >= '0' && quoted[i + 1] <= '7') {
                                value = value * 8 + (quoted[++i] - '0');
                                ++digits;
                            }
                            out += static_cast<char>(value);
                        } else {
                            out += '\\';
                            out += next;
                        }
                        break;
                }
            }

            return out;
        }

        /**
         * Recovers the path from "a/<path> b/<path>". Without rename
         * detection both sides name the same file.
         */
        std::optional<std::string> path_from_header(const std::string_view rest) {
            if (rest.empty()) {
                return std::nullopt;
            }

            if (rest.front() == '"') {
                // Quoted form: "a/..." "b/..." or a mix of quoted and plain.
                std::size_t end = 1;
                while (end < rest.size() && !(rest[end] == '"' && rest[end - 1] != '\\')) {
                    ++end;
                }
                if (end >= rest.size()) {
                    return std::nullopt;
                }
                return decode_patch_path(rest.substr(0, end + 1));
            }

            if (rest.size() >= 5 && (rest.size() - 5) % 2 == 0) {
                const auto len = (rest.size() - 5) / 2;
                const auto a_side = rest.substr(0, 2 + len);
                const auto b_side = rest.substr(3 + len);
                if (rest[2 + len] == ' ' && a_side.substr(2) == b_side.substr(2)) {
                    return decode_patch_path(a_side);
                }
            }

            if (const auto pos = rest.find(" b/"); pos != std::string_view::npos) {
                return decode_patch_path(rest.substr(0, pos));
            }
            return std::nullopt;
        }

        struct Section {
            std::optional<std::string> header_path;
            std::optional<std::string> old_path;
            std::optional<std::string> new_path;
            std::string body;
            bool in_hunks = false;
        };

        void flush(Section& section, FileDiffs& diffs) {
            std::optional<std::string> path = section.new_path;
            if (!path) {
                path = section.old_path;
            }
            if (!path) {
                path = section.header_path;
            }

            if (path && !path->empty()) {
                diffs[*path] = section.in_hunks ? std::move(section.body)
                                                : std::string(NO_DIFF_CONTENT);
            }
            section = Section{};
        }

    }  // namespace

    std::optional<std::string> decode_patch_path(std::string_view raw) {
        // git appends a tab after names containing spaces on ---/+++ lines.
        while (!raw.empty() && (raw.back() == '\t' || raw.back() == '\r')) {
            raw.remove_suffix(1);
        }

        if (raw == "/dev/null") {
            return std::nullopt;
        }

        std::string path = raw.size() >= 2 && raw.front() == '"' && raw.back() == '"'
            ? unquote(raw)
            : std::string(raw);

        if (path.starts_with("a/") || path.starts_with("b/")) {
            path.erase(0, 2);
        }

        if (path.empty()) {
            return std::nullopt;
        }
        return path;
    }

    FileDiffs parse_patch(const std::string_view patch) {
        FileDiffs diffs;
        Section section;
        bool have_section = false;

        for (const auto line : string_utils::split_lines(patch)) {
            if (line.starts_with(DIFF_HEADER)) {
                if (have_section) {
                    flush(section, diffs);
                }
                have_section = true;
                section.header_path = path_from_header(line.substr(DIFF_HEADER.size()));
                continue;
            }

            if (!have_section) {
                continue;
            }

            if (section.in_hunks) {
                section.body.append(line);
                section.body += '\n';
                continue;
            }

            if (line.starts_with("@@")) {
                section.in_hunks = true;
                section.body.append(line);
                section.body += '\n';
            } else if (line.starts_with("--- ")) {
                section.old_path = decode_patch_path(line.substr(4));
            } else if (line.starts_with("+++ ")) {
                section.new_path = decode_patch_path(line.substr(4));
            }
        }

        if (have_section) {
            flush(section, diffs);
        }

        return diffs;
    }

}  // namespace gitmine::diff
