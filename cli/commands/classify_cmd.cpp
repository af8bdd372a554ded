//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/cli/commands/command.hpp"

#include "gitmine/classify/commit_classifier.hpp"
#include "gitmine/utils/json_utils.hpp"
#include "gitmine/utils/string_utils.hpp"

#include <iostream>

namespace gitmine::cli
{
    /**
     * Classify command - prints the category of a commit message.
     */
    class ClassifyCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "classify";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Classify a commit message as fix, feature, refactor, docs or other";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: gitmine classify [OPTIONS] MESSAGE...\n"
                   "\n"
                   "Examples:\n"
                   "  gitmine classify \"Fix crash on empty input\"\n"
                   "  gitmine classify --json update docs";
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().empty()) {
                return "No commit message given. Use 'gitmine classify <message>'";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_common_flags(args);

            const std::string message = string_utils::join(args.positional(), " ");
            const auto category = classify::classify(message);

            if (is_json()) {
                json_utils::json output;
                output["message"] = message;
                output["category"] = to_string(category);
                std::cout << json_utils::dump(output, 2) << "\n";
            } else {
                std::cout << to_string(category) << "\n";
            }

            return 0;
        }
    };

    namespace {
        struct ClassifyCommandRegistrar {
            ClassifyCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<ClassifyCommand>()
                );
            }
        } classify_registrar;
    }

}  // namespace gitmine::cli
