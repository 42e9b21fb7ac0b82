#include <iostream>
#include <vector>
#include <string>
#include "cli/shell_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/utils.hpp>

void print_usage() {
    std::cout << theme::blue("    mcsh [--config <file>] [--timeout <ms>] [command ...]") << "\n"
              << theme::dim("        Run each command on one remote shell session and print") << "\n"
              << theme::dim("        the output. Without commands, start an interactive prompt.") << "\n\n"
              << theme::blue("    mcsh init") << "\n"
              << theme::dim("        Write a config template to ")
              << theme::dim(Config::get_default_config_path().string()) << "\n\n"
              << theme::dim("    mcsh --version        Show version\n"
                            "    mcsh --help           Show this help") << "\n\n";
}

int main(int argc, char** argv) {
    std::vector<std::string> commands;
    std::string config_path;
    int timeout_ms = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--version") {
            std::cout << "mcsh version 0.1.0\n";
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            timeout_ms = safe_stoi(argv[++i], 0);
        } else if (arg == "init" && commands.empty()) {
            auto created = create_default_config();
            if (created.is_err()) {
                std::cout << theme::fail(created.error);
                return 1;
            }
            std::cout << theme::ok("Config at " + Config::get_default_config_path().string());
            return 0;
        } else {
            commands.push_back(arg);
        }
    }

    auto config = config_path.empty() ? Config::load() : Config::load(config_path);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        std::cout << theme::step("Run 'mcsh init' to create a config template.");
        return 1;
    }

    ShellCLI cli(std::move(config.value));
    cli.set_timeout_ms(timeout_ms);
    if (!cli.connect()) {
        return 1;
    }

    if (commands.empty()) {
        cli.run_repl();
        return 0;
    }
    return cli.run_commands(commands);
}
