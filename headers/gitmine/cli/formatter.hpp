//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef GITMINE_FORMATTER_HPP
#define GITMINE_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Text output for the CLI: aligned tables, colors and the mining
 *        summary printer.
 */

#include "gitmine/types.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace gitmine::cli
{
    /**
     * Terminal color codes.
     */
    namespace colors {

        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;

        extern const char* RED;
        extern const char* GREEN;
        extern const char* YELLOW;
        extern const char* CYAN;

        /**
         * Returns true if colors should be used (enabled and stdout is a tty).
         */
        bool enabled();

        void set_enabled(bool enable);

    }  // namespace colors

    [[nodiscard]] bool is_tty();

    struct Column {
        std::string header;
        std::size_t width = 0;    // 0 = auto
        bool right_align = false;
    };

    using Row = std::vector<std::string>;

    /**
     * Table formatter for aligned output.
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        /**
         * Adds a row, padding it with empty cells to the column count.
         */
        void add_row(Row row);

        /**
         * Draws a separator line under the last added row.
         */
        void add_separator();

        [[nodiscard]] std::string render() const;
        void render(std::ostream& out) const;

        void clear();

        void set_show_headers(bool show) { show_headers_ = show; }

        [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }

    private:
        void calculate_widths();

        std::vector<Column> columns_;
        std::vector<Row> rows_;
        std::vector<bool> separators_;
        bool show_headers_ = true;
    };

    /**
     * Formats a count with comma separators ("12,345").
     */
    [[nodiscard]] std::string format_count(std::size_t count);

    /**
     * Formats a signed line delta ("+12", "-3", "0").
     */
    [[nodiscard]] std::string format_delta(long long delta);

    /**
     * Truncates text to max_width, ending with "..." when cut.
     */
    [[nodiscard]] std::string truncate(const std::string& text, std::size_t max_width);

    /**
     * Summary printer for mining results.
     */
    class SummaryPrinter {
    public:
        explicit SummaryPrinter(std::ostream& out);

        /**
         * Prints repository, period, branch, filter and totals.
         */
        void print_overview(const MiningResult& result) const;

        /**
         * Prints one row per contributor, most commits first.
         */
        void print_contributors(const MiningResult& result) const;

        void print_categories(const MiningResult& result) const;

        /**
         * Prints the newest commits, limit = 0 for all.
         */
        void print_commits(const MiningResult& result, std::size_t limit = 10) const;

        void print_structure(const RepositoryStructure& structure) const;

        void print_warnings(const std::vector<std::string>& warnings) const;

    private:
        void print_heading(const std::string& title) const;

        std::ostream& out_;
    };

}  // namespace gitmine::cli

#endif //GITMINE_FORMATTER_HPP
