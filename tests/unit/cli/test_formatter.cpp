//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/cli/formatter.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace gitmine::cli
{
    namespace {

        MiningResult sample_result() {
            MiningResult result;
            result.repo_name = "demo";
            result.period = describe_period(30);
            result.branch = "main";

            const auto add = [&result](const std::string& hash, const std::string& author, const std::string& message) {
                auto record = CommitRecord::create(
                    hash, author, author + "@example.com",
                    std::chrono::system_clock::from_time_t(1700000000), message,
                    {{"a.txt", "@@ -1 +1,2 @@\n-x\n+y\n+z\n"}}
                );
                result.contributors[author].add(record);
                result.commits.push_back(std::move(record));
            };

            add("1111111111", "alice", "Fix crash");
            add("2222222222", "bob", "Add option");
            add("3333333333", "bob", "Cleanup");
            return result;
        }

    }  // namespace

    class FormatterTest : public ::testing::Test {
    protected:
        void SetUp() override {
            colors::set_enabled(false);
        }
    };

    TEST_F(FormatterTest, FormatCount) {
        EXPECT_EQ(format_count(0), "0");
        EXPECT_EQ(format_count(999), "999");
        EXPECT_EQ(format_count(1000), "1,000");
        EXPECT_EQ(format_count(1234567), "1,234,567");
    }

    TEST_F(FormatterTest, FormatDelta) {
        EXPECT_EQ(format_delta(12), "+12");
        EXPECT_EQ(format_delta(-3), "-3");
        EXPECT_EQ(format_delta(0), "0");
    }

    TEST_F(FormatterTest, Truncate) {
        EXPECT_EQ(truncate("short", 10), "short");
        EXPECT_EQ(truncate("a long commit message", 10), "a long ...");
        EXPECT_EQ(truncate("abcdef", 2), "ab");
    }

    TEST_F(FormatterTest, TableAlignsColumns) {
        Table table({{"Name", 0, false}, {"Commits", 0, true}});
        table.add_row({"alice", "3"});
        table.add_row({"bob"});

        const auto text = table.render();

        EXPECT_EQ(table.row_count(), 2u);
        EXPECT_EQ(text,
                  "Name   Commits\n"
                  "--------------\n"
                  "alice        3\n"
                  "bob           \n");
    }

    TEST_F(FormatterTest, TableWithoutHeaders) {
        Table table({{"Path", 0, false}});
        table.set_show_headers(false);
        table.add_row({"src"});

        EXPECT_EQ(table.render(), "src\n");

        table.clear();
        EXPECT_EQ(table.row_count(), 0u);
    }

    TEST_F(FormatterTest, OverviewShowsTotals) {
        std::ostringstream out;
        SummaryPrinter(out).print_overview(sample_result());

        const auto text = out.str();
        EXPECT_NE(text.find("demo"), std::string::npos);
        EXPECT_NE(text.find("Last 30 days"), std::string::npos);
        EXPECT_NE(text.find("All contributors"), std::string::npos);
        EXPECT_NE(text.find("+6"), std::string::npos);
        EXPECT_NE(text.find("-3"), std::string::npos);
    }

    TEST_F(FormatterTest, ContributorsMostCommitsFirst) {
        std::ostringstream out;
        SummaryPrinter(out).print_contributors(sample_result());

        const auto text = out.str();
        const auto bob = text.find("bob");
        const auto alice = text.find("alice");
        ASSERT_NE(bob, std::string::npos);
        ASSERT_NE(alice, std::string::npos);
        EXPECT_LT(bob, alice);
    }

    TEST_F(FormatterTest, CommitsRespectLimit) {
        std::ostringstream out;
        SummaryPrinter(out).print_commits(sample_result(), 2);

        const auto text = out.str();
        EXPECT_NE(text.find("11111111"), std::string::npos);
        EXPECT_NE(text.find("22222222"), std::string::npos);
        EXPECT_EQ(text.find("33333333"), std::string::npos);
        EXPECT_NE(text.find("... and 1 more"), std::string::npos);
    }

    TEST_F(FormatterTest, NoCommits) {
        std::ostringstream out;
        SummaryPrinter(out).print_commits(MiningResult{});

        EXPECT_NE(out.str().find("No commits found."), std::string::npos);
    }

    TEST_F(FormatterTest, WarningsListed) {
        std::ostringstream out;
        SummaryPrinter(out).print_warnings({"Could not read repository structure"});

        EXPECT_NE(out.str().find("Could not read repository structure"), std::string::npos);
    }

}  // namespace gitmine::cli
