//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/git/git_integration.hpp"
#include "gitmine/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <initializer_list>
#include <sstream>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <csignal>

namespace gitmine::git
{
    namespace {

        /**
         * Runs a shell command in working_dir, collecting stdout and stderr.
         * exit_code is -1 when the process could not be started and -2 on
         * timeout.
         */
        CommandResult execute_command_impl(
            const std::string& command,
            const fs::path& working_dir,
            const Duration timeout
        ) {
            CommandResult result;
            const auto start_time = std::chrono::steady_clock::now();

            int stdout_pipe[2];
            int stderr_pipe[2];

            if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
                result.exit_code = -1;
                return result;
            }
            if (pipe2(stderr_pipe, O_CLOEXEC) < 0) {
                close(stdout_pipe[0]);
                close(stdout_pipe[1]);
                result.exit_code = -1;
                return result;
            }

            const pid_t pid = fork();
            if (pid < 0) {
                close(stdout_pipe[0]);
                close(stdout_pipe[1]);
                close(stderr_pipe[0]);
                close(stderr_pipe[1]);
                result.exit_code = -1;
                return result;
            }

            if (pid == 0) {
                close(stdout_pipe[0]);
                close(stderr_pipe[0]);

                dup2(stdout_pipe[1], STDOUT_FILENO);
                dup2(stderr_pipe[1], STDERR_FILENO);

                close(stdout_pipe[1]);
                close(stderr_pipe[1]);

                if (chdir(working_dir.c_str()) != 0) {
                    _exit(127);
                }

                execl("/bin/sh", "sh", "-c", command.c_str(), nullptr);
                _exit(127);
            }

            close(stdout_pipe[1]);
            close(stderr_pipe[1]);

            fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
            fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

            const auto drain = [](const int fd, std::string& sink) {
                char buffer[8192];
                ssize_t n;
                while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
                    sink.append(buffer, static_cast<std::size_t>(n));
                }
            };

            const auto timeout_point = std::chrono::steady_clock::now() + timeout;
            int status = 0;
            bool finished = false;

            while (!finished) {
                if (std::chrono::steady_clock::now() > timeout_point) {
                    kill(pid, SIGTERM);
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    kill(pid, SIGKILL);
                    waitpid(pid, &status, 0);
                    result.exit_code = -2;
                    finished = true;
                    continue;
                }

                drain(stdout_pipe[0], result.stdout_output);
                drain(stderr_pipe[0], result.stderr_output);

                if (const pid_t wpid = waitpid(pid, &status, WNOHANG); wpid > 0) {
                    // The child may have written its last chunk after the previous read.
                    drain(stdout_pipe[0], result.stdout_output);
                    drain(stderr_pipe[0], result.stderr_output);

                    if (WIFEXITED(status)) {
                        result.exit_code = WEXITSTATUS(status);
                    } else if (WIFSIGNALED(status)) {
                        result.exit_code = -WTERMSIG(status);
                    }
                    finished = true;
                } else {
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                }
            }

            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            const auto end_time = std::chrono::steady_clock::now();
            result.execution_time = std::chrono::duration_cast<Duration>(end_time - start_time);

            return result;
        }

        std::string build_git_command(const std::vector<std::string>& args) {
            std::ostringstream cmd;
            cmd << "git";
            for (const auto& arg : args) {
                cmd << " " << shell_quote(arg);
            }
            return cmd.str();
        }

        /**
         * Options every invocation shares: no pager, no colors, paths
         * printed without octal escaping.
         */
        std::vector<std::string> base_args() {
            return {"--no-pager", "-c", "core.quotepath=false", "-c", "color.ui=never"};
        }

        std::vector<std::string> with_base_args(std::initializer_list<std::string> args) {
            auto all = base_args();
            all.insert(all.end(), args.begin(), args.end());
            return all;
        }

    }  // namespace

    // =============================================================================
    // Core Git Functions
    // =============================================================================

    std::string shell_quote(const std::string_view arg) {
        const bool plain = !arg.empty() && std::ranges::all_of(arg, [](const unsigned char c) {
            return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '/' ||
                   c == '=' || c == ':' || c == '@' || c == '%' || c == '+';
        });
        if (plain) {
            return std::string(arg);
        }

        std::string quoted = "'";
        for (const char c : arg) {
            if (c == '\'') {
                quoted += "'\\''";
            } else {
                quoted += c;
            }
        }
        quoted += "'";
        return quoted;
    }

    Result<CommandResult, Error> execute_git(
        const std::vector<std::string>& args,
        const fs::path& working_dir,
        const Duration timeout
    ) {
        if (std::error_code ec; !fs::is_directory(working_dir, ec)) {
            return Result<CommandResult, Error>::failure(
                Error::not_found("Working directory not found", working_dir.string())
            );
        }

        const std::string command = build_git_command(args);
        auto result = execute_command_impl(command, working_dir, timeout);

        if (result.exit_code == -1) {
            return Result<CommandResult, Error>::failure(
                Error::git_error("Failed to start git", command)
            );
        }

        if (result.exit_code == -2) {
            return Result<CommandResult, Error>::failure(
                Error::git_error("Git command timed out", command)
            );
        }

        return Result<CommandResult, Error>::success(std::move(result));
    }

    bool is_git_repository(const fs::path& dir) {
        auto result = execute_git(
            {"rev-parse", "--is-inside-work-tree"},
            dir,
            std::chrono::seconds(5)
        );
        return result.is_ok() && result.value().exit_code == 0 &&
               string_utils::trim(result.value().stdout_output) == "true";
    }

    Result<fs::path, Error> get_repository_root(const fs::path& dir) {
        auto result = execute_git(
            {"rev-parse", "--show-toplevel"},
            dir,
            std::chrono::seconds(5)
        );

        if (result.is_err()) {
            return Result<fs::path, Error>::failure(result.error());
        }

        if (result.value().exit_code != 0) {
            return Result<fs::path, Error>::failure(
                Error::git_error("Not a git repository", dir.string())
            );
        }

        return Result<fs::path, Error>::success(
            fs::path(std::string(string_utils::trim(result.value().stdout_output)))
        );
    }

    bool ref_exists(const std::string& ref, const fs::path& repo_dir) {
        auto result = execute_git(
            with_base_args({"rev-parse", "--verify", "--quiet", ref + "^{commit}"}),
            repo_dir,
            std::chrono::seconds(5)
        );
        return result.is_ok() && result.value().exit_code == 0;
    }

    std::string commit_log_format() {
        // hash, parents, author name, author email, committer time, body
        return "--format=%H%x1f%P%x1f%an%x1f%ae%x1f%ct%x1f%B%x1e";
    }

    Result<RawCommit, Error> parse_commit_record(std::string_view record) {
        record = string_utils::trim_left(record);

        // The message is last and may itself contain anything but the
        // record separator, so split only the first five fields.
        std::vector<std::string_view> fields;
        std::size_t start = 0;
        for (int i = 0; i < 5; ++i) {
            const auto pos = record.find(FIELD_SEPARATOR, start);
            if (pos == std::string_view::npos) {
                return Result<RawCommit, Error>::failure(
                    Error::parse_error("Truncated commit record", std::string(record.substr(0, 40)))
                );
            }
            fields.push_back(record.substr(start, pos - start));
            start = pos + 1;
        }

        RawCommit commit;
        commit.hash = std::string(string_utils::trim(fields[0]));
        if (commit.hash.empty()) {
            return Result<RawCommit, Error>::failure(
                Error::parse_error("Commit record without hash")
            );
        }

        for (const auto parent : string_utils::split(string_utils::trim(fields[1]), ' ')) {
            if (!parent.empty()) {
                commit.parents.emplace_back(parent);
            }
        }

        commit.author_name = std::string(fields[2]);
        commit.author_email = std::string(fields[3]);

        try {
            const auto epoch = std::stoll(std::string(string_utils::trim(fields[4])));
            commit.commit_time = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(epoch));
        } catch (const std::exception&) {
            return Result<RawCommit, Error>::failure(
                Error::parse_error("Invalid commit time", commit.hash)
            );
        }

        commit.message = std::string(record.substr(start));

        return Result<RawCommit, Error>::success(std::move(commit));
    }

    Result<std::vector<RawCommit>, Error> parse_commit_log(const std::string_view output) {
        std::vector<RawCommit> commits;

        for (const auto record : string_utils::split(output, RECORD_SEPARATOR)) {
            if (string_utils::trim(record).empty()) {
                continue;
            }
            auto commit = parse_commit_record(record);
            if (commit.is_err()) {
                return Result<std::vector<RawCommit>, Error>::failure(commit.error());
            }
            commits.push_back(std::move(commit.value()));
        }

        return Result<std::vector<RawCommit>, Error>::success(std::move(commits));
    }

    Result<std::vector<RawCommit>, Error> list_commits(
        const std::string& ref,
        const std::optional<Timestamp> since,
        const fs::path& repo_dir
    ) {
        auto args = with_base_args({"log", "--no-show-signature", commit_log_format()});

        std::optional<std::time_t> cutoff;
        if (since) {
            cutoff = std::chrono::system_clock::to_time_t(*since);
            args.push_back("--since=@" + std::to_string(*cutoff));
        }
        args.push_back(ref);
        args.emplace_back("--");

        auto result = execute_git(args, repo_dir, std::chrono::seconds(30));

        if (result.is_err()) {
            return Result<std::vector<RawCommit>, Error>::failure(result.error());
        }

        if (result.value().exit_code != 0) {
            return Result<std::vector<RawCommit>, Error>::failure(
                Error::git_error(
                    "Failed to list commits",
                    ref + ": " + std::string(string_utils::trim(result.value().stderr_output))
                )
            );
        }

        auto commits = parse_commit_log(result.value().stdout_output);
        if (commits.is_err() || !cutoff) {
            return commits;
        }

        // git compares at second precision; keep the window exact here too.
        auto& list = commits.value();
        std::erase_if(list, [&cutoff](const RawCommit& c) {
            return std::chrono::system_clock::to_time_t(c.commit_time) < *cutoff;
        });
        return commits;
    }

    Result<std::vector<std::string>, Error> get_parents(
        const std::string& commit,
        const fs::path& repo_dir
    ) {
        auto result = execute_git(
            with_base_args({"rev-list", "--parents", "-n", "1", commit + "^{commit}", "--"}),
            repo_dir,
            std::chrono::seconds(10)
        );

        if (result.is_err()) {
            return Result<std::vector<std::string>, Error>::failure(result.error());
        }

        if (result.value().exit_code != 0) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::not_found("Commit not found", commit)
            );
        }

        std::vector<std::string> parents;
        const auto line = string_utils::trim(result.value().stdout_output);
        const auto parts = string_utils::split(line, ' ');
        for (std::size_t i = 1; i < parts.size(); ++i) {
            if (!parts[i].empty()) {
                parents.emplace_back(parts[i]);
            }
        }

        return Result<std::vector<std::string>, Error>::success(std::move(parents));
    }

    Result<std::string, Error> get_patch(
        const std::string& commit,
        const std::optional<std::string>& parent,
        const fs::path& repo_dir
    ) {
        auto args = with_base_args({
            "diff-tree", "-p", "-r", "--no-commit-id", "--no-renames",
            "--no-ext-diff", "--no-textconv"
        });

        if (parent) {
            args.push_back(*parent);
        } else {
            args.emplace_back("--root");
        }
        args.push_back(commit);
        args.emplace_back("--");

        auto result = execute_git(args, repo_dir, std::chrono::seconds(60));

        if (result.is_err()) {
            return Result<std::string, Error>::failure(result.error());
        }

        if (result.value().exit_code != 0) {
            return Result<std::string, Error>::failure(
                Error::git_error(
                    "Failed to diff commit",
                    commit + ": " + std::string(string_utils::trim(result.value().stderr_output))
                )
            );
        }

        return Result<std::string, Error>::success(std::move(result.value().stdout_output));
    }

}  // namespace gitmine::git
