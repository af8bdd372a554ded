//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/mining/history_miner.hpp"
#include "gitmine/log.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <map>
#include <mutex>
#include <numeric>

namespace gitmine::mining
{
    namespace {

        Timestamp at(const std::time_t seconds) {
            return std::chrono::system_clock::from_time_t(seconds);
        }

        git::RawCommit raw(const std::string& hash, const std::string& author,
                           std::vector<std::string> parents = {"p"},
                           const std::string& message = "update") {
            git::RawCommit commit;
            commit.hash = hash;
            commit.parents = std::move(parents);
            commit.author_name = author;
            commit.author_email = author + "@example.com";
            commit.commit_time = at(1700000000);
            commit.message = message;
            return commit;
        }

        class FakeWalker final : public ICommitWalker {
        public:
            void set(const std::string& ref, std::vector<git::RawCommit> commits) {
                refs_[ref] = std::move(commits);
            }

            Result<std::vector<git::RawCommit>, Error> walk(
                const std::string& ref,
                const std::optional<Timestamp> since
            ) const override {
                calls.emplace_back(ref, since);
                const auto it = refs_.find(ref);
                if (it == refs_.end()) {
                    return Result<std::vector<git::RawCommit>, Error>::failure(
                        Error::not_found("Branch not found", ref)
                    );
                }
                return Result<std::vector<git::RawCommit>, Error>::success(it->second);
            }

            mutable std::vector<std::pair<std::string, std::optional<Timestamp>>> calls;

        private:
            std::map<std::string, std::vector<git::RawCommit>> refs_;
        };

        class FakeExtractor final : public diff::IDiffExtractor {
        public:
            void set(const std::string& hash, FileDiffs diffs) {
                diffs_[hash] = std::move(diffs);
            }

            Result<FileDiffs, Error> extract(const std::string& commit_id) const override {
                {
                    std::lock_guard lock(mutex_);
                    ++calls_;
                }
                const auto it = diffs_.find(commit_id);
                if (it == diffs_.end()) {
                    return Result<FileDiffs, Error>::failure(Error::git_error("Failed to diff commit", commit_id));
                }
                return Result<FileDiffs, Error>::success(it->second);
            }

            std::size_t calls() const {
                std::lock_guard lock(mutex_);
                return calls_;
            }

        private:
            std::map<std::string, FileDiffs> diffs_;
            mutable std::mutex mutex_;
            mutable std::size_t calls_ = 0;
        };

    }  // namespace

    class HistoryMinerTest : public ::testing::Test {
    protected:
        void SetUp() override {
            log::Logger::instance().set_level(log::Level::Error);

            extractor_.set("c1", {{"src/app.py", "@@ -1 +1,2 @@\n-a\n+b\n+c\n"}});
            extractor_.set("c2", {{"README.md", "@@ -0,0 +1 @@\n+hi\n"}});
            extractor_.set("c3", {{"src/app.py", "@@ -1,2 +1 @@\n-b\n-c\n+d\n"},
                                  {"docs/guide.md", "@@ -0,0 +1 @@\n+x\n"}});
            extractor_.set("m1", {{"merged.txt", "@@ -0,0 +1 @@\n+m\n"}});
        }

        MiningOptions options() const {
            MiningOptions opts;
            opts.reference_time = at(1700000000);
            return opts;
        }

        FakeWalker walker_;
        FakeExtractor extractor_;
    };

    // =============================================================================
    // Branch Resolution
    // =============================================================================

    TEST_F(HistoryMinerTest, PrefersMain) {
        walker_.set("main", {raw("c1", "alice")});
        walker_.set("master", {raw("c2", "bob")});

        const auto result = HistoryMiner(walker_, extractor_).run(options());

        EXPECT_EQ(result.branch, "main");
        ASSERT_EQ(result.commits.size(), 1u);
        EXPECT_EQ(result.commits[0].hash(), "c1");
        EXPECT_TRUE(result.warnings.empty());
    }

    TEST_F(HistoryMinerTest, FallsBackToMaster) {
        walker_.set("master", {raw("c2", "bob")});

        const auto result = HistoryMiner(walker_, extractor_).run(options());

        EXPECT_EQ(result.branch, "master");
        ASSERT_EQ(result.commits.size(), 1u);
        EXPECT_EQ(result.commits[0].hash(), "c2");
    }

    TEST_F(HistoryMinerTest, EmptyMainFallsBackToMaster) {
        walker_.set("main", {});
        walker_.set("master", {raw("c2", "bob")});

        const auto result = HistoryMiner(walker_, extractor_).run(options());

        EXPECT_EQ(result.branch, "master");
    }

    TEST_F(HistoryMinerTest, FallsBackToFullHeadHistory) {
        walker_.set("HEAD", {raw("c3", "carol"), raw("c1", "alice")});

        const auto result = HistoryMiner(walker_, extractor_).run(options());

        EXPECT_EQ(result.branch, "HEAD");
        EXPECT_EQ(result.commits.size(), 2u);

        ASSERT_EQ(walker_.calls.size(), 3u);
        EXPECT_EQ(walker_.calls[0].first, "main");
        EXPECT_TRUE(walker_.calls[0].second.has_value());
        EXPECT_EQ(walker_.calls[1].first, "master");
        EXPECT_EQ(walker_.calls[2].first, "HEAD");
        // The HEAD walk ignores the date window
        EXPECT_FALSE(walker_.calls[2].second.has_value());
    }

    TEST_F(HistoryMinerTest, UnreadableHeadIsWarning) {
        const auto result = HistoryMiner(walker_, extractor_).run(options());

        EXPECT_EQ(result.branch, "HEAD");
        EXPECT_TRUE(result.commits.empty());
        ASSERT_EQ(result.warnings.size(), 1u);
        EXPECT_NE(result.warnings[0].find("HEAD"), std::string::npos);
    }

    TEST_F(HistoryMinerTest, CustomFallbackOrder) {
        walker_.set("develop", {raw("c1", "alice")});
        walker_.set("main", {raw("c2", "bob")});

        auto opts = options();
        opts.fallback_branches = {"develop", "main"};
        const auto result = HistoryMiner(walker_, extractor_).run(opts);

        EXPECT_EQ(result.branch, "develop");
    }

    TEST_F(HistoryMinerTest, ExplicitBranchIsUsed) {
        walker_.set("main", {raw("c1", "alice")});
        walker_.set("release", {raw("c2", "bob")});

        auto opts = options();
        opts.branch = "release";
        const auto result = HistoryMiner(walker_, extractor_).run(opts);

        EXPECT_EQ(result.branch, "release");
        ASSERT_EQ(result.commits.size(), 1u);
        EXPECT_EQ(result.commits[0].hash(), "c2");
        ASSERT_EQ(walker_.calls.size(), 1u);
    }

    TEST_F(HistoryMinerTest, MissingExplicitBranchIsWarningNotFallback) {
        walker_.set("main", {raw("c1", "alice")});

        auto opts = options();
        opts.branch = "nope";
        const auto result = HistoryMiner(walker_, extractor_).run(opts);

        EXPECT_EQ(result.branch, "nope");
        EXPECT_TRUE(result.commits.empty());
        EXPECT_TRUE(result.contributors.empty());
        ASSERT_EQ(result.warnings.size(), 1u);
        EXPECT_NE(result.warnings[0].find("Error accessing branch 'nope'"), std::string::npos);
    }

    TEST_F(HistoryMinerTest, EmptyExplicitBranchIsWarning) {
        walker_.set("release", {});

        auto opts = options();
        opts.branch = "release";
        const auto result = HistoryMiner(walker_, extractor_).run(opts);

        EXPECT_TRUE(result.commits.empty());
        ASSERT_EQ(result.warnings.size(), 1u);
        EXPECT_EQ(result.warnings[0],
                  "No commits found in branch 'release' for the specified time period");
    }

    // =============================================================================
    // Commit Selection
    // =============================================================================

    TEST_F(HistoryMinerTest, MergeCommitsExcluded) {
        walker_.set("main", {raw("m1", "alice", {"p1", "p2"}), raw("c1", "alice")});

        const auto result = HistoryMiner(walker_, extractor_).run(options());

        ASSERT_EQ(result.commits.size(), 1u);
        EXPECT_EQ(result.commits[0].hash(), "c1");
        EXPECT_EQ(result.contributors.at("alice").commits, 1u);
    }

    TEST_F(HistoryMinerTest, OnlyMergeMeansEmptyResult) {
        walker_.set("main", {raw("m1", "alice", {"p1", "p2"})});

        const auto result = HistoryMiner(walker_, extractor_).run(options());

        EXPECT_EQ(result.branch, "main");
        EXPECT_TRUE(result.commits.empty());
        EXPECT_TRUE(result.contributors.empty());
        EXPECT_EQ(extractor_.calls(), 0u);
    }

    TEST_F(HistoryMinerTest, RootCommitIncluded) {
        walker_.set("main", {raw("c1", "alice", {})});

        const auto result = HistoryMiner(walker_, extractor_).run(options());

        ASSERT_EQ(result.commits.size(), 1u);
    }

    TEST_F(HistoryMinerTest, ContributorFilterByExactName) {
        walker_.set("main", {raw("c3", "carol"), raw("c2", "bob"), raw("c1", "alice")});

        auto opts = options();
        opts.contributor_filter = std::set<std::string>{"alice", "Bob"};
        const auto result = HistoryMiner(walker_, extractor_).run(opts);

        ASSERT_EQ(result.commits.size(), 1u);
        EXPECT_EQ(result.commits[0].author_name(), "alice");
        EXPECT_EQ(result.contributors.size(), 1u);
        ASSERT_TRUE(result.contributor_filter.has_value());
        EXPECT_EQ(result.contributor_filter->size(), 2u);
        // Filtered commits are never extracted
        EXPECT_EQ(extractor_.calls(), 1u);
    }

    TEST_F(HistoryMinerTest, EmptyFilterKeepsEveryone) {
        walker_.set("main", {raw("c2", "bob"), raw("c1", "alice")});

        auto opts = options();
        opts.contributor_filter = std::set<std::string>{};
        const auto result = HistoryMiner(walker_, extractor_).run(opts);

        ASSERT_EQ(result.commits.size(), 2u);
        EXPECT_EQ(result.contributors.size(), 2u);
        // Reported as unfiltered
        EXPECT_FALSE(result.contributor_filter.has_value());
    }

    // =============================================================================
    // Aggregation
    // =============================================================================

    TEST_F(HistoryMinerTest, RecordsAndRollupsAgree) {
        auto first = raw("c3", "alice", {"p"}, "Refactor app\n");
        first.author_email = "alice@new.example";
        walker_.set("main", {first, raw("c2", "bob", {"p"}, "Add readme"), raw("c1", "alice", {"p"}, "fix crash")});

        const auto result = HistoryMiner(walker_, extractor_).run(options());

        ASSERT_EQ(result.commits.size(), 3u);
        EXPECT_EQ(result.commits[0].hash(), "c3");
        EXPECT_EQ(result.commits[0].message(), "Refactor app");
        EXPECT_EQ(result.commits[0].category(), CommitCategory::Refactor);
        EXPECT_EQ(result.commits[1].category(), CommitCategory::Feature);
        EXPECT_EQ(result.commits[2].category(), CommitCategory::Fix);

        const auto& alice = result.contributors.at("alice");
        EXPECT_EQ(alice.commits, 2u);
        EXPECT_EQ(alice.lines_added, 4u);
        EXPECT_EQ(alice.lines_deleted, 3u);
        EXPECT_EQ(alice.files_changed, 3u);
        EXPECT_EQ(alice.email, "alice@new.example");

        const auto& bob = result.contributors.at("bob");
        EXPECT_EQ(bob.commits, 1u);
        EXPECT_EQ(bob.lines_added, 1u);

        const auto rollup_commits = std::accumulate(
            result.contributors.begin(), result.contributors.end(), std::size_t{0},
            [](const std::size_t sum, const auto& entry) { return sum + entry.second.commits; }
        );
        EXPECT_EQ(rollup_commits, result.total_commits());
    }

    TEST_F(HistoryMinerTest, FailedExtractionYieldsEmptyDiffsAndWarning) {
        walker_.set("main", {raw("unknown-commit-hash", "alice")});

        const auto result = HistoryMiner(walker_, extractor_).run(options());

        ASSERT_EQ(result.commits.size(), 1u);
        EXPECT_TRUE(result.commits[0].diffs().empty());
        EXPECT_EQ(result.commits[0].lines_added(), 0u);
        EXPECT_EQ(result.commits[0].files_changed(), 0u);
        EXPECT_EQ(result.contributors.at("alice").commits, 1u);
        ASSERT_EQ(result.warnings.size(), 1u);
        EXPECT_NE(result.warnings[0].find("unknown-"), std::string::npos);
    }

    TEST_F(HistoryMinerTest, ParallelExtractionPreservesOrder) {
        std::vector<git::RawCommit> commits;
        for (int i = 0; i < 40; ++i) {
            const auto hash = "h" + std::to_string(i);
            commits.push_back(raw(hash, i % 2 == 0 ? "alice" : "bob"));
            extractor_.set(hash, {{"f" + std::to_string(i) + ".txt", std::string(static_cast<std::size_t>(i), '+')}});
        }
        walker_.set("main", commits);

        auto sequential_opts = options();
        const auto sequential = HistoryMiner(walker_, extractor_).run(sequential_opts);

        auto parallel_opts = options();
        parallel_opts.parallel_jobs = 4;
        const auto parallel = HistoryMiner(walker_, extractor_).run(parallel_opts);

        ASSERT_EQ(parallel.commits.size(), 40u);
        for (std::size_t i = 0; i < parallel.commits.size(); ++i) {
            EXPECT_EQ(parallel.commits[i].hash(), sequential.commits[i].hash());
            EXPECT_EQ(parallel.commits[i].diffs(), sequential.commits[i].diffs());
        }
        EXPECT_EQ(parallel.contributors.at("alice").commits, 20u);
        EXPECT_EQ(parallel.contributors.at("bob").files_changed, 20u);
    }

    TEST_F(HistoryMinerTest, PeriodAndFilterRecorded) {
        walker_.set("main", {raw("c1", "alice")});

        auto opts = options();
        opts.days_back = 7;
        EXPECT_EQ(HistoryMiner(walker_, extractor_).run(opts).period, "Last 7 days");

        opts.days_back = 0;
        const auto all_time = HistoryMiner(walker_, extractor_).run(opts);
        EXPECT_EQ(all_time.period, "All time");
        EXPECT_FALSE(all_time.contributor_filter.has_value());
    }

    TEST_F(HistoryMinerTest, WindowPassedToWalker) {
        walker_.set("main", {raw("c1", "alice")});

        auto opts = options();
        opts.days_back = 0;
        (void)HistoryMiner(walker_, extractor_).run(opts);

        ASSERT_EQ(walker_.calls.size(), 1u);
        EXPECT_FALSE(walker_.calls[0].second.has_value());
    }

    // =============================================================================
    // Date Window
    // =============================================================================

    TEST(WindowStartTest, DaysBeforeReference) {
        MiningOptions opts;
        opts.reference_time = at(1700000000);
        opts.days_back = 7;

        const auto start = window_start(opts);

        ASSERT_TRUE(start.has_value());
        EXPECT_EQ(*start, at(1700000000 - 7 * 86400));
    }

    TEST(WindowStartTest, ZeroOrNegativeDisablesWindow) {
        MiningOptions opts;
        opts.days_back = 0;
        EXPECT_FALSE(window_start(opts).has_value());

        opts.days_back = -3;
        EXPECT_FALSE(window_start(opts).has_value());
    }

    TEST(WindowStartTest, WindowBeyondClockRangeCoversEverything) {
        MiningOptions opts;
        opts.reference_time = at(1700000000);
        opts.days_back = 200000;

        EXPECT_FALSE(window_start(opts).has_value());

        opts.days_back = std::numeric_limits<int>::max();
        EXPECT_FALSE(window_start(opts).has_value());
    }

    TEST(WindowStartTest, LargestRepresentableWindowStaysInPast) {
        MiningOptions opts;
        opts.reference_time = at(1700000000);
        opts.days_back = 100000;

        const auto start = window_start(opts);

        ASSERT_TRUE(start.has_value());
        EXPECT_LT(*start, *opts.reference_time);
        EXPECT_EQ(*start, at(1700000000) - std::chrono::hours(24) * 100000);
    }

    TEST_F(HistoryMinerTest, HugeWindowOnExplicitBranchKeepsCommits) {
        walker_.set("main", {raw("c1", "alice")});

        auto opts = options();
        opts.branch = "main";
        opts.days_back = 200000;
        const auto result = HistoryMiner(walker_, extractor_).run(opts);

        ASSERT_EQ(walker_.calls.size(), 1u);
        EXPECT_FALSE(walker_.calls[0].second.has_value());
        EXPECT_EQ(result.commits.size(), 1u);
        EXPECT_EQ(result.period, "Last 200000 days");
    }

    TEST(WindowStartTest, DefaultsToNow) {
        MiningOptions opts;
        opts.days_back = 1;

        const auto before = std::chrono::system_clock::now();
        const auto start = window_start(opts);
        const auto after = std::chrono::system_clock::now();

        ASSERT_TRUE(start.has_value());
        EXPECT_GE(*start, before - std::chrono::hours(24));
        EXPECT_LE(*start, after - std::chrono::hours(24));
    }

    // =============================================================================
    // Entry Point Errors
    // =============================================================================

    TEST(MineTest, MissingPathIsNotFound) {
        const auto result = mine(fs::temp_directory_path() / "gitmine_missing_repo_path");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

}  // namespace gitmine::mining
