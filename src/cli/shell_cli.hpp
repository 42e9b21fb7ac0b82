#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <shell/multi_command_session.hpp>
#include <ssh/transport.hpp>

// ShellCLI: connects with the configured host settings, opens one
// MultiCommandSession and feeds it commands from argv or a readline REPL.
class ShellCLI {
public:
    explicit ShellCLI(Config config);
    ~ShellCLI();

    // Connect, handshake. Prints progress and failures; false on failure.
    bool connect();

    // Run each command in order. Returns 1 if any command failed, else 0.
    int run_commands(const std::vector<std::string>& commands);

    // Interactive loop until EOF or "exit".
    void run_repl();

    void set_timeout_ms(int timeout_ms) { timeout_ms_ = timeout_ms; }

private:
    Config config_;
    std::unique_ptr<SshTransport> transport_;
    std::unique_ptr<MultiCommandSession> session_;
    int timeout_ms_ = 0;

    // Returns false if the command failed.
    bool execute(const std::string& command);
    bool handle_builtin(const std::string& line);
    void disconnect();
};
