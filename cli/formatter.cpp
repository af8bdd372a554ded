//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/cli/formatter.hpp"
#include "gitmine/export/json_export.hpp"
#include "gitmine/mining/derived_views.hpp"
#include "gitmine/utils/string_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <initializer_list>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace gitmine::cli
{
    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";

        const char* RED = "\033[31m";
        const char* GREEN = "\033[32m";
        const char* YELLOW = "\033[33m";
        const char* CYAN = "\033[36m";

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    bool is_tty() {
        return isatty(fileno(stdout)) != 0;
    }

    namespace {

        std::string paint(const std::string& text, const char* color) {
            if (!colors::enabled()) {
                return text;
            }
            return std::string(color) + text + colors::RESET;
        }

    }  // namespace

    // ============================================================================
    // Formatting Functions
    // ============================================================================

    std::string format_count(const std::size_t count) {
        std::string result = std::to_string(count);

        int insert_pos = static_cast<int>(result.length()) - 3;
        while (insert_pos > 0) {
            result.insert(static_cast<std::size_t>(insert_pos), ",");
            insert_pos -= 3;
        }

        return result;
    }

    std::string format_delta(const long long delta) {
        if (delta > 0) {
            return "+" + std::to_string(delta);
        }
        return std::to_string(delta);
    }

    std::string truncate(const std::string& text, const std::size_t max_width) {
        if (text.length() <= max_width) {
            return text;
        }
        if (max_width <= 3) {
            return text.substr(0, max_width);
        }
        return text.substr(0, max_width - 3) + "...";
    }

    // ============================================================================
    // Table Implementation
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        while (row.size() < columns_.size()) {
            row.emplace_back();
        }
        rows_.push_back(std::move(row));
        separators_.push_back(false);
    }

    void Table::add_separator() {
        if (!separators_.empty()) {
            separators_.back() = true;
        }
    }

    void Table::clear() {
        rows_.clear();
        separators_.clear();
    }

    void Table::calculate_widths() {
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].width == 0) {
                std::size_t max_width = columns_[i].header.length();
                for (const auto& row : rows_) {
                    if (i < row.size() && row[i].length() > max_width) {
                        max_width = row[i].length();
                    }
                }
                columns_[i].width = max_width;
            }
        }
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        // Widths are computed on a copy so render() stays const
        Table temp = *this;
        temp.calculate_widths();

        auto render_row = [&](const Row& row, const bool is_header = false) {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                const auto& col = temp.columns_[i];
                const std::string cell = truncate(i < row.size() ? row[i] : "", col.width);

                if (is_header && colors::enabled()) {
                    out << colors::BOLD;
                }

                if (col.right_align) {
                    out << std::right << std::setw(static_cast<int>(col.width)) << cell;
                } else {
                    out << std::left << std::setw(static_cast<int>(col.width)) << cell;
                }

                if (is_header && colors::enabled()) {
                    out << colors::RESET;
                }

                if (i < temp.columns_.size() - 1) {
                    out << "  ";
                }
            }
            out << "\n";
        };

        auto render_separator = [&]() {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                out << std::string(temp.columns_[i].width, '-');
                if (i < temp.columns_.size() - 1) {
                    out << "--";
                }
            }
            out << "\n";
        };

        if (show_headers_) {
            Row header;
            for (const auto& col : temp.columns_) {
                header.push_back(col.header);
            }
            render_row(header, true);
            render_separator();
        }

        for (std::size_t i = 0; i < temp.rows_.size(); ++i) {
            render_row(temp.rows_[i]);
            if (i < temp.separators_.size() && temp.separators_[i]) {
                render_separator();
            }
        }
    }

    // ============================================================================
    // SummaryPrinter Implementation
    // ============================================================================

    SummaryPrinter::SummaryPrinter(std::ostream& out)
        : out_(out)
    {}

    void SummaryPrinter::print_heading(const std::string& title) const {
        out_ << "\n" << paint(title, colors::BOLD) << "\n";
    }

    void SummaryPrinter::print_overview(const MiningResult& result) const {
        const auto totals = mining::totals(result);

        std::string filter(json::ALL_CONTRIBUTORS);
        if (result.contributor_filter) {
            filter = string_utils::join(*result.contributor_filter, ", ");
        }

        out_ << paint("Repository: ", colors::BOLD) << result.repo_name << "\n";
        out_ << "  Branch:        " << result.branch << "\n";
        out_ << "  Period:        " << result.period << "\n";
        out_ << "  Filtered by:   " << filter << "\n";
        out_ << "  Commits:       " << format_count(totals.commits) << "\n";
        out_ << "  Contributors:  " << format_count(totals.contributors) << "\n";
        out_ << "  Lines:         "
             << paint("+" + format_count(totals.lines_added), colors::GREEN) << " "
             << paint("-" + format_count(totals.lines_deleted), colors::RED) << "\n";
        out_ << "  Files changed: " << format_count(totals.files_changed) << "\n";
    }

    void SummaryPrinter::print_contributors(const MiningResult& result) const {
        if (result.contributors.empty()) {
            return;
        }

        std::vector<std::pair<std::string, const ContributorRollup*>> ordered;
        ordered.reserve(result.contributors.size());
        for (const auto& [name, rollup] : result.contributors) {
            ordered.emplace_back(name, &rollup);
        }
        std::ranges::stable_sort(ordered, [](const auto& a, const auto& b) {
            return a.second->commits > b.second->commits;
        });

        print_heading("Contributors");

        Table table({
            {"Author", 0, false},
            {"Email", 0, false},
            {"Commits", 0, true},
            {"Added", 0, true},
            {"Deleted", 0, true},
            {"Net", 0, true},
            {"Files", 0, true},
        });

        for (const auto& [name, rollup] : ordered) {
            table.add_row({
                truncate(name, 30),
                truncate(rollup->email, 36),
                format_count(rollup->commits),
                format_count(rollup->lines_added),
                format_count(rollup->lines_deleted),
                format_delta(rollup->net_lines()),
                format_count(rollup->files_changed),
            });
        }

        table.render(out_);
    }

    void SummaryPrinter::print_categories(const MiningResult& result) const {
        if (result.commits.empty()) {
            return;
        }

        print_heading("Commit types");

        const auto counts = mining::commit_type_counts(result);
        Table table({{"Type", 0, false}, {"Commits", 0, true}});

        for (const auto category : {CommitCategory::Fix, CommitCategory::Feature, CommitCategory::Refactor,
                                    CommitCategory::Docs, CommitCategory::Other}) {
            if (const auto it = counts.find(to_string(category)); it != counts.end()) {
                table.add_row({it->first, format_count(it->second)});
            }
        }

        table.render(out_);
    }

    void SummaryPrinter::print_commits(const MiningResult& result, const std::size_t limit) const {
        if (result.commits.empty()) {
            out_ << "\nNo commits found.\n";
            return;
        }

        print_heading("Recent commits");

        Table table({
            {"Commit", 0, false},
            {"Date", 0, false},
            {"Author", 0, false},
            {"Type", 0, false},
            {"+/-", 0, true},
            {"Message", 0, false},
        });

        const std::size_t count = limit == 0 ? result.commits.size() : std::min(limit, result.commits.size());
        for (std::size_t i = 0; i < count; ++i) {
            const auto& commit = result.commits[i];
            const auto first_line = string_utils::split_lines(commit.message());
            table.add_row({
                commit.hash().substr(0, 8),
                string_utils::format_timestamp(commit.timestamp()),
                truncate(commit.author_name(), 24),
                to_string(commit.category()),
                "+" + std::to_string(commit.lines_added()) + "/-" + std::to_string(commit.lines_deleted()),
                truncate(first_line.empty() ? std::string() : std::string(first_line.front()), 60),
            });
        }

        table.render(out_);

        if (count < result.commits.size()) {
            out_ << paint("... and " + format_count(result.commits.size() - count) + " more", colors::DIM) << "\n";
        }
    }

    void SummaryPrinter::print_structure(const RepositoryStructure& structure) const {
        if (structure.empty()) {
            return;
        }

        print_heading("Repository structure");

        Table table({{"Directory", 0, false}, {"Files", 0, true}});
        for (const auto& entry : structure) {
            table.add_row({entry.relative_path, format_count(entry.file_count)});
        }

        table.render(out_);
    }

    void SummaryPrinter::print_warnings(const std::vector<std::string>& warnings) const {
        if (warnings.empty()) {
            return;
        }

        print_heading("Warnings");
        for (const auto& warning : warnings) {
            out_ << "  " << paint("!", colors::YELLOW) << " " << warning << "\n";
        }
    }

}  // namespace gitmine::cli
