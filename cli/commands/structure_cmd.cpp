//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/cli/commands/command.hpp"
#include "gitmine/cli/formatter.hpp"

#include "gitmine/structure/repository_structure.hpp"
#include "gitmine/utils/json_utils.hpp"

#include <iostream>

namespace gitmine::cli
{
    /**
     * Structure command - prints the shallow directory overview.
     */
    class StructureCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "structure";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show a shallow overview of the directories of a working copy";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: gitmine structure [OPTIONS] [PATH]\n"
                   "\n"
                   "Examples:\n"
                   "  gitmine structure\n"
                   "  gitmine structure --depth 3 --max-entries 25 ../project";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"depth", 0, "Deepest directory level listed", false, true, "2", "N"},
                {"max-entries", 0, "Maximum directories listed", false, true, "10", "N"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() > 1) {
                return "Expected at most one path";
            }
            if (const auto depth = args.get_int("depth"); !depth || *depth < 0) {
                return "--depth must be a non-negative integer";
            }
            if (const auto entries = args.get_int("max-entries"); !entries || *entries < 0) {
                return "--max-entries must be a non-negative integer";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_common_flags(args);

            const fs::path root = args.positional().empty() ? fs::path(".") : fs::path(args.positional().front());

            structure::StructureLimits limits;
            limits.max_depth = static_cast<std::size_t>(args.get_int("depth").value_or(2));
            limits.max_entries = static_cast<std::size_t>(args.get_int("max-entries").value_or(10));

            auto snapshot = structure::snapshot(root, limits);
            if (snapshot.is_err()) {
                print_error(snapshot.error().to_string());
                return 1;
            }

            if (is_json()) {
                json_utils::json entries = json_utils::json::array();
                for (const auto& entry : snapshot.value()) {
                    entries.push_back({{"path", entry.relative_path}, {"files", entry.file_count}});
                }
                std::cout << json_utils::dump(entries, 2) << "\n";
            } else {
                const SummaryPrinter printer(std::cout);
                printer.print_structure(snapshot.value());
            }

            return 0;
        }
    };

    namespace {
        struct StructureCommandRegistrar {
            StructureCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<StructureCommand>()
                );
            }
        } structure_registrar;
    }

}  // namespace gitmine::cli
