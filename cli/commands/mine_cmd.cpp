//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/cli/commands/command.hpp"
#include "gitmine/cli/formatter.hpp"

#include "gitmine/gitmine.hpp"

#include <iostream>

namespace gitmine::cli
{
    namespace {

        std::set<std::string> parse_contributor_list(const std::string& value) {
            std::set<std::string> names;
            for (const auto part : string_utils::split(value, ',')) {
                if (const auto name = string_utils::trim(part); !name.empty()) {
                    names.emplace(name);
                }
            }
            return names;
        }

    }  // namespace

    /**
     * Mine command - walks the history of a repository and reports
     * per-commit and per-contributor statistics.
     */
    class MineCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "mine";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Mine the commit history of a git repository";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: gitmine mine [OPTIONS] [PATH]\n"
                   "\n"
                   "Examples:\n"
                   "  gitmine mine\n"
                   "  gitmine mine --days 7 --contributors alice,bob ../project\n"
                   "  gitmine mine --days 0 --branch release --json --output history.json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"days", 'd', "Days of history to mine (0 = all time)", false, true, "", "N"},
                {"branch", 'b', "Branch to mine instead of main/master/HEAD", false, true, "", "REF"},
                {"contributors", 'c', "Comma-separated author names to keep", false, true, "", "NAMES"},
                {"config", 0, "Configuration file (default: <repo>/.gitmine.toml)", false, true, "", "FILE"},
                {"jobs", 'j', "Parallel diff extraction workers", false, true, "", "N"},
                {"limit", 'n', "Commits listed in text output (0 = all)", false, true, "10", "N"},
                {"no-diffs", 0, "Omit diff bodies from JSON output", false, false, "", ""},
                {"no-structure", 0, "Skip the repository structure snapshot", false, false, "", ""},
                {"summary", 's', "Include derived views in JSON output", false, false, "", ""},
                {"output", 'o', "Write JSON results to FILE", false, true, "", "FILE"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() > 1) {
                return "Expected at most one repository path";
            }
            if (args.has("days")) {
                const auto days = args.get_int("days");
                if (!days || *days < 0) {
                    return "--days must be a non-negative integer";
                }
            }
            if (args.has("jobs")) {
                const auto jobs = args.get_int("jobs");
                if (!jobs || *jobs < 1) {
                    return "--jobs must be a positive integer";
                }
            }
            if (const auto limit = args.get_int("limit"); !limit || *limit < 0) {
                return "--limit must be a non-negative integer";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            const fs::path repo_path = args.positional().empty() ? fs::path(".") : fs::path(args.positional().front());

            auto config = load_config(args, repo_path);
            if (config.is_err()) {
                print_error(config.error().to_string());
                return 1;
            }

            if (const auto level = log::level_from_string(config.value().logging.level)) {
                log::Logger::instance().set_level(*level);
            }
            apply_common_flags(args);

            auto options = config.value().to_options();
            if (const auto days = args.get_int("days")) {
                options.days_back = *days;
            }
            if (const auto branch = args.get("branch")) {
                options.branch = *branch;
            }
            if (const auto contributors = args.get("contributors")) {
                if (auto names = parse_contributor_list(*contributors); !names.empty()) {
                    options.contributor_filter = std::move(names);
                }
            }
            if (const auto jobs = args.get_int("jobs")) {
                options.parallel_jobs = static_cast<unsigned int>(*jobs);
            }
            if (args.get_flag("no-structure")) {
                options.include_structure = false;
            }

            print_verbose("Mining " + repo_path.string() + " (" + describe_period(options.days_back) + ")");

            auto result = mining::mine(repo_path, options);
            if (result.is_err()) {
                print_error("could not analyze repository: " + result.error().to_string());
                return 1;
            }

            const auto& mined = result.value();

            json::ExportOptions export_options;
            export_options.include_diffs = !args.get_flag("no-diffs");
            export_options.include_summary = args.get_flag("summary");

            if (auto output_file = args.get("output")) {
                if (auto written = json::write_file(*output_file, mined, export_options); written.is_err()) {
                    print_error(written.error().to_string());
                    return 1;
                }
                print_verbose("Results written to " + *output_file);
            }

            if (is_json()) {
                std::cout << json::to_string(mined, export_options) << "\n";
            } else if (!is_quiet()) {
                const SummaryPrinter printer(std::cout);
                printer.print_overview(mined);
                printer.print_contributors(mined);
                printer.print_categories(mined);
                printer.print_commits(mined, static_cast<std::size_t>(args.get_int("limit").value_or(10)));
                printer.print_structure(mined.repository_structure);
                printer.print_warnings(mined.warnings);
            }

            return 0;
        }

    private:
        /**
         * --config wins; otherwise the repository's .gitmine.toml is used
         * when present, else the defaults.
         */
        static Result<Config, Error> load_config(const ParsedArgs& args, const fs::path& repo_path) {
            if (const auto path = args.get("config")) {
                return Config::load_from_file(*path);
            }

            const fs::path candidate = repo_path / DEFAULT_CONFIG_FILE;
            if (std::error_code ec; fs::exists(candidate, ec)) {
                return Config::load_from_file(candidate);
            }

            return Result<Config, Error>::success(Config::default_config());
        }
    };

    namespace {
        struct MineCommandRegistrar {
            MineCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<MineCommand>()
                );
            }
        } mine_registrar;
    }

}  // namespace gitmine::cli
