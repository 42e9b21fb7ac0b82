#include "multi_command_session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/terminal_modes.hpp>
#include <fmt/format.h>

std::vector<TerminalMode> default_terminal_modes() {
    return {
        {TTY_OP_ECHO, 0},
        {TTY_OP_ISPEED, PTY_BAUD_RATE},
        {TTY_OP_OSPEED, PTY_BAUD_RATE},
    };
}

std::string normalize_kernel_name(const std::string& raw) {
    std::string name = to_lower(raw);
    trim(name);
    auto eol = name.find_first_of("\r\n");
    if (eol != std::string::npos) {
        name.erase(eol);
        trim(name);
    }
    return name;
}

// ── Lifecycle ──────────────────────────────────────────────────

MultiCommandSession::MultiCommandSession(ConstructTag, std::unique_ptr<RemoteChannel> channel)
    : channel_(std::move(channel)),
      collector_(exchange_),
      stdout_drainer_(*channel_, StreamKind::STDOUT, exchange_, running_,
                      [this] { close(); }),
      stderr_drainer_(*channel_, StreamKind::STDERR, exchange_, running_,
                      [this] { close(); }) {}

MultiCommandSession::~MultiCommandSession() {
    close();
    stdout_drainer_.join();
    stderr_drainer_.join();
}

Result<std::unique_ptr<MultiCommandSession>>
MultiCommandSession::open(ChannelFactory& transport, const SessionConfig& config) {
    using SessionResult = Result<std::unique_ptr<MultiCommandSession>>;

    auto opened = transport.open_channel();
    if (opened.is_err()) {
        return SessionResult::Err("Failed to open channel: " + opened.error);
    }
    std::unique_ptr<RemoteChannel> channel = std::move(opened.value);

    for (const auto& [name, value] : config.env) {
        auto env = channel->setenv(name, value);
        if (env.is_err()) {
            channel->close();
            return SessionResult::Err(fmt::format("Failed to set {}: {}", name, env.error));
        }
    }

    PtyRequest pty{config.term, config.columns, config.rows, default_terminal_modes()};
    auto pty_result = channel->request_pty(pty);
    if (pty_result.is_err()) {
        channel->close();
        return SessionResult::Err("Failed to request pty: " + pty_result.error);
    }

    auto session = std::make_unique<MultiCommandSession>(ConstructTag{}, std::move(channel));

    auto shaken = session->handshake(config.shell.empty() ? DEFAULT_SHELL : config.shell);
    if (shaken.is_err()) {
        mcsh_log("[session] handshake failed: " + shaken.error);
        session->close();
        return SessionResult::Err(shaken.error);
    }
    return SessionResult::Ok(std::move(session));
}

Result<void> MultiCommandSession::handshake(const std::string& shell) {
    // Drainers first so no banner bytes are lost to a race with the shell
    stdout_drainer_.start();
    stderr_drainer_.start();

    auto started = channel_->start(shell);
    if (started.is_err()) {
        return Result<void>::Err(fmt::format("Failed to start {}: {}", shell, started.error));
    }
    mcsh_log("[session] started " + shell);

    auto banner = read_response(DEFAULT_RESPONSE_TIMEOUT_MS);
    if (banner.failed()) {
        return Result<void>::Err("Shell startup reported: " + banner.stderr_data);
    }

    auto prompt = run("", PROMPT_PROBE_TIMEOUT_MS);
    if (prompt.failed()) {
        return Result<void>::Err("Failed to detect shell prompt: " + prompt.stderr_data);
    }
    shell_prompt_ = prompt.stdout_data;
    drain_stdout();

    auto kernel = run(KERNEL_PROBE_COMMAND, KERNEL_PROBE_TIMEOUT_MS,
                      {"Linux", "Darwin", "$ ", "# "});
    drain_stdout();
    if (kernel.failed()) {
        return Result<void>::Err("Failed to detect kernel name: " + kernel.stderr_data);
    }
    kernel_name_ = normalize_kernel_name(kernel.stdout_data);

    mcsh_log(fmt::format("[session] prompt({} bytes) kernel={}",
                         shell_prompt_.size(), kernel_name_));
    return Result<void>::Ok();
}

void MultiCommandSession::close() {
    if (!running_.exchange(false)) return;

    mcsh_log("[session] closing");
    exchange_.close();
    channel_->close_input();
    channel_->close();
}

// ── Commands ───────────────────────────────────────────────────

SSHResult MultiCommandSession::run(const std::string& command, int timeout_ms,
                                   const std::vector<std::string>& terminators) {
    drain_stdout();

    auto written = channel_->write(command + "\n");
    if (written.is_err()) {
        SSHResult r{SHELL_STATUS_IO_ERROR, "",
                    fmt::format("Failed to execute command: {}, err: {}", command, written.error)};
        mcsh_log_cmd("[run]", command, r);
        return r;
    }

    auto r = read_response(timeout_ms, terminators);
    mcsh_log_cmd("[run]", command, r);
    return r;
}

SSHResult MultiCommandSession::read_response(int timeout_ms,
                                             const std::vector<std::string>& terminators) {
    if (timeout_ms == 0) {
        timeout_ms = DEFAULT_RESPONSE_TIMEOUT_MS;
    }

    std::vector<Terminator> parsed;
    if (terminators.empty()) {
        parsed = parse_terminators({shell_prompt_.empty()
                                        ? std::string(FALLBACK_PROMPT_TERMINATOR)
                                        : shell_prompt_ + "$"});
    } else {
        parsed = parse_terminators(terminators);
    }

    return collector_.collect(timeout_ms, parsed, shell_prompt_);
}

void MultiCommandSession::drain_stdout() {
    int windows = collector_.flush(shell_prompt_);
    if (windows > 0) {
        mcsh_log(fmt::format("[session] flushed stale output ({} windows)", windows));
    }
}
