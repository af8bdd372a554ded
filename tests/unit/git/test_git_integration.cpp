//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/git/git_integration.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <string>

namespace gitmine::git
{
    namespace {

        std::string record(const std::string& hash, const std::string& parents,
                           const std::string& name, const std::string& email,
                           const std::string& time, const std::string& message) {
            const std::string sep(1, FIELD_SEPARATOR);
            return hash + sep + parents + sep + name + sep + email + sep + time + sep + message;
        }

    }  // namespace

    // =============================================================================
    // Shell Quoting
    // =============================================================================

    TEST(ShellQuoteTest, PlainWordsUnchanged) {
        EXPECT_EQ(shell_quote("log"), "log");
        EXPECT_EQ(shell_quote("--since=@1700000000"), "--since=@1700000000");
        EXPECT_EQ(shell_quote("origin/main"), "origin/main");
    }

    TEST(ShellQuoteTest, SpecialCharactersQuoted) {
        EXPECT_EQ(shell_quote("feature branch"), "'feature branch'");
        EXPECT_EQ(shell_quote("$(rm -rf /)"), "'$(rm -rf /)'");
        EXPECT_EQ(shell_quote("HEAD^{commit}"), "'HEAD^{commit}'");
        EXPECT_EQ(shell_quote(""), "''");
    }

    TEST(ShellQuoteTest, SingleQuoteEscaped) {
        EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    }

    // =============================================================================
    // Commit Log Parsing
    // =============================================================================

    TEST(ParseCommitRecordTest, SingleParent) {
        const auto result = parse_commit_record(
            record("abc123", "def456", "Alice", "alice@example.com", "1700000000", "Fix bug\n")
        );

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        const auto& commit = result.value();
        EXPECT_EQ(commit.hash, "abc123");
        ASSERT_EQ(commit.parents.size(), 1u);
        EXPECT_EQ(commit.parents[0], "def456");
        EXPECT_EQ(commit.author_name, "Alice");
        EXPECT_EQ(commit.author_email, "alice@example.com");
        EXPECT_EQ(commit.commit_time, std::chrono::system_clock::from_time_t(1700000000));
        EXPECT_EQ(commit.message, "Fix bug\n");
        EXPECT_FALSE(commit.is_merge());
        EXPECT_FALSE(commit.is_root());
    }

    TEST(ParseCommitRecordTest, RootCommit) {
        const auto result = parse_commit_record(
            record("abc123", "", "Alice", "alice@example.com", "1700000000", "Initial commit")
        );

        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().parents.empty());
        EXPECT_TRUE(result.value().is_root());
    }

    TEST(ParseCommitRecordTest, MergeCommit) {
        const auto result = parse_commit_record(
            record("abc123", "p1 p2", "Bob", "bob@example.com", "1700000000", "Merge branch 'x'")
        );

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().parents.size(), 2u);
        EXPECT_TRUE(result.value().is_merge());
    }

    TEST(ParseCommitRecordTest, MultiLineMessageKeptVerbatim) {
        const std::string message = "Add parser\n\nLonger body\nwith several lines\n";
        const auto result = parse_commit_record(
            record("abc123", "def456", "Alice", "alice@example.com", "1700000000", message)
        );

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().message, message);
    }

    TEST(ParseCommitRecordTest, LeadingNewlineIgnored) {
        // Records after the first start with the newline git prints after %x1e
        const auto result = parse_commit_record(
            "\n" + record("abc123", "", "Alice", "alice@example.com", "1700000000", "msg")
        );

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().hash, "abc123");
    }

    TEST(ParseCommitRecordTest, InvalidTimeIsParseError) {
        const auto result = parse_commit_record(
            record("abc123", "", "Alice", "alice@example.com", "yesterday", "msg")
        );

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    }

    TEST(ParseCommitRecordTest, TruncatedRecordIsParseError) {
        const auto result = parse_commit_record("abc123\x1f" "def456\x1f" "Alice");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    }

    TEST(ParseCommitLogTest, MultipleRecordsInOrder) {
        const std::string rs(1, RECORD_SEPARATOR);
        const std::string output =
            record("c3", "c2", "Alice", "a@x", "1700000300", "third\n") + rs + "\n" +
            record("c2", "c1", "Bob", "b@x", "1700000200", "second\n") + rs + "\n" +
            record("c1", "", "Alice", "a@x", "1700000100", "first\n") + rs + "\n";

        const auto result = parse_commit_log(output);

        ASSERT_TRUE(result.is_ok());
        const auto& commits = result.value();
        ASSERT_EQ(commits.size(), 3u);
        EXPECT_EQ(commits[0].hash, "c3");
        EXPECT_EQ(commits[1].hash, "c2");
        EXPECT_EQ(commits[2].hash, "c1");
        EXPECT_TRUE(commits[2].is_root());
    }

    TEST(ParseCommitLogTest, EmptyOutput) {
        const auto result = parse_commit_log("");

        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().empty());
    }

    TEST(ParseCommitLogTest, BadRecordFailsWholeLog) {
        const std::string rs(1, RECORD_SEPARATOR);
        const std::string output =
            record("c2", "c1", "Bob", "b@x", "1700000200", "second") + rs + "\n" +
            record("c1", "", "Alice", "a@x", "not-a-time", "first") + rs + "\n";

        EXPECT_TRUE(parse_commit_log(output).is_err());
    }

    TEST(CommitLogFormatTest, UsesSeparators) {
        const auto format = commit_log_format();

        EXPECT_NE(format.find("%H"), std::string::npos);
        EXPECT_NE(format.find("%P"), std::string::npos);
        EXPECT_NE(format.find("%ct"), std::string::npos);
        EXPECT_NE(format.find("%x1f"), std::string::npos);
        EXPECT_NE(format.find("%x1e"), std::string::npos);
    }

    // =============================================================================
    // Command Execution
    // =============================================================================

    TEST(ExecuteGitTest, MissingDirectoryIsNotFound) {
        const auto missing = fs::temp_directory_path() / "gitmine_no_such_dir_for_git_test";
        std::error_code ec;
        fs::remove_all(missing, ec);

        const auto result = execute_git({"status"}, missing);

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

    TEST(ExecuteGitTest, MissingDirectoryIsNotARepository) {
        const auto missing = fs::temp_directory_path() / "gitmine_no_such_dir_for_git_test";
        std::error_code ec;
        fs::remove_all(missing, ec);

        EXPECT_FALSE(is_git_repository(missing));
        EXPECT_TRUE(get_repository_root(missing).is_err());
        EXPECT_FALSE(ref_exists("HEAD", missing));
    }

}  // namespace gitmine::git
