//
// Created by gregorian-rayne on 10/19/26.
//

#include "gitmine/cli/commands/command.hpp"
#include "gitmine/version.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void print_usage() {
        using gitmine::cli::CommandRegistry;

        std::cout << gitmine::PROJECT_NAME << " " << gitmine::VERSION_STRING << "\n\n";
        std::cout << "Usage: " << gitmine::PROJECT_SHORT_NAME << " <command> [OPTIONS]\n\n";
        std::cout << "Commands:\n";
        for (const auto* cmd : CommandRegistry::instance().list()) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name() << cmd->description() << "\n";
        }
        std::cout << "\nRun '" << gitmine::PROJECT_SHORT_NAME << " <command> --help' for command options.\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    using namespace gitmine::cli;

    try {
        if (argc < 2) {
            print_usage();
            return 1;
        }

        const std::string command_name = argv[1];

        if (command_name == "-h" || command_name == "--help" || command_name == "help") {
            print_usage();
            return 0;
        }

        if (command_name == "--version" || command_name == "version") {
            std::cout << gitmine::PROJECT_SHORT_NAME << " " << gitmine::VERSION_STRING << "\n";
            return 0;
        }

        Command* command = CommandRegistry::instance().find(command_name);
        if (command == nullptr) {
            std::cerr << "error: unknown command '" << command_name << "'\n\n";
            print_usage();
            return 1;
        }

        const std::vector<std::string> rest(argv + 2, argv + argc);
        auto parsed = parse_arguments(rest, command->arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n";
            return 1;
        }

        if (parsed.args.get_flag("help")) {
            command->print_help();
            return 0;
        }

        if (const auto problem = command->validate(parsed.args); !problem.empty()) {
            std::cerr << "error: " << problem << "\n";
            return 1;
        }

        return command->execute(parsed.args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
