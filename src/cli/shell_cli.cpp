#include "shell_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <readline/readline.h>
#include <readline/history.h>

ShellCLI::ShellCLI(Config config)
    : config_(std::move(config)) {}

ShellCLI::~ShellCLI() {
    disconnect();
}

void ShellCLI::disconnect() {
    // Session channels must go before the transport that owns the SSH session
    session_.reset();
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
}

bool ShellCLI::connect() {
    const auto& host = config_.host();
    if (host.host.empty() || host.user.empty()) {
        std::cout << theme::fail("No host/user configured.");
        std::cout << theme::step("Edit " + Config::get_default_config_path().string()
                                 + " or pass --config <file>");
        return false;
    }

    transport_ = std::make_unique<SshTransport>(host);
    auto established = transport_->establish([](const std::string& msg) {
        std::cout << theme::log(msg);
    });
    if (established.failed()) {
        std::cout << theme::fail(established.stderr_data);
        transport_.reset();
        return false;
    }

    std::cout << theme::log("Starting " + config_.session().shell + "...");
    auto opened = MultiCommandSession::open(*transport_, config_.session());
    if (opened.is_err()) {
        std::cout << theme::fail(opened.error);
        disconnect();
        return false;
    }
    session_ = std::move(opened.value);

    std::cout << theme::ok("Connected to " + transport_->get_target()
                           + " (" + session_->kernel_name() + ")");
    return true;
}

bool ShellCLI::execute(const std::string& command) {
    if (!session_ || !session_->is_running()) {
        std::cout << theme::fail("Session is closed.");
        return false;
    }

    auto result = session_->run(command, timeout_ms_);
    if (!result.stdout_data.empty()) {
        std::cout << result.stdout_data;
        if (result.stdout_data.back() != '\n') std::cout << "\n";
    }
    if (result.exit_code == SHELL_STATUS_REMOTE_ERROR) {
        std::cerr << theme::yellow(result.stderr_data);
        if (result.stderr_data.back() != '\n') std::cerr << "\n";
    } else if (result.exit_code == SHELL_STATUS_IO_ERROR) {
        std::cout << theme::fail(result.stderr_data);
    }
    return result.success();
}

int ShellCLI::run_commands(const std::vector<std::string>& commands) {
    int status = 0;
    for (const auto& cmd : commands) {
        if (!execute(cmd)) status = 1;
    }
    return status;
}

bool ShellCLI::handle_builtin(const std::string& line) {
    std::istringstream iss(line);
    std::string command;
    iss >> command;

    if (command == ":prompt") {
        std::cout << theme::kv("prompt", "[" + session_->shell_prompt() + "]");
        return true;
    }
    if (command == ":kernel") {
        std::cout << theme::kv("kernel", session_->kernel_name());
        return true;
    }
    if (command == ":timeout") {
        std::string value;
        iss >> value;
        if (!value.empty()) {
            timeout_ms_ = safe_stoi(value, timeout_ms_);
        }
        int effective = timeout_ms_ > 0 ? timeout_ms_ : DEFAULT_RESPONSE_TIMEOUT_MS;
        std::cout << theme::kv("timeout", std::to_string(effective) + " ms");
        return true;
    }
    if (command == ":help") {
        std::cout << theme::dim("    :prompt         show the learned prompt signature") << "\n"
                  << theme::dim("    :kernel         show the remote kernel name") << "\n"
                  << theme::dim("    :timeout [ms]   show or set the per-command timeout") << "\n"
                  << theme::dim("    exit            close the session") << "\n";
        return true;
    }
    return false;
}

void ShellCLI::run_repl() {
    std::string prompt = theme::blue("mcsh") + ":" + transport_->get_target() + "> ";
    std::string line;

    while (session_ && session_->is_running()) {
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        trim(line);
        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        if (line == "exit" || line == "quit") {
            break;
        }
        if (line[0] == ':' && handle_builtin(line)) {
            continue;
        }

        execute(line);
    }

    if (session_ && !session_->is_running()) {
        std::cout << theme::fail("Connection to remote shell lost.");
    }
}
