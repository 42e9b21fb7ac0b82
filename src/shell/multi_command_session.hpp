#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "chunk_exchange.hpp"
#include "remote_channel.hpp"
#include "response_collector.hpp"
#include "stream_drainer.hpp"

// MultiCommandSession: runs commands one after another on a single
// interactive shell and returns each reply, detecting the end of a reply by
// terminator patterns (by default the shell's own prompt).
//
// open() performs the handshake:
//   env + pty -> start drainers -> start shell -> absorb banner ->
//   learn prompt (empty command) -> flush -> probe kernel (uname -s) -> flush
//
// Usage:
//     auto opened = MultiCommandSession::open(transport, config);
//     if (opened.is_err()) { ... opened.error ... }
//     auto& shell = *opened.value;
//     auto r = shell.run("ls /tmp", 2000);
//     auto r2 = shell.run("make", 60000, {"BUILD OK", "Error$"});
//
// run() is not thread-safe: callers serialize their own commands.
class MultiCommandSession {
public:
    // Only open() can build the tag.
    class ConstructTag {
        friend class MultiCommandSession;
        ConstructTag() {}
    };

    static Result<std::unique_ptr<MultiCommandSession>> open(ChannelFactory& transport,
                                                             const SessionConfig& config);
    MultiCommandSession(ConstructTag, std::unique_ptr<RemoteChannel> channel);
    ~MultiCommandSession();

    MultiCommandSession(const MultiCommandSession&) = delete;
    MultiCommandSession& operator=(const MultiCommandSession&) = delete;

    // Flush stale output, send command + "\n", collect the reply.
    // timeout_ms 0 means DEFAULT_RESPONSE_TIMEOUT_MS; no terminators means
    // "the prompt came back".
    SSHResult run(const std::string& command, int timeout_ms = 0,
                  const std::vector<std::string>& terminators = {});

    const std::string& shell_prompt() const { return shell_prompt_; }
    const std::string& kernel_name() const { return kernel_name_; }

    // Stop the drainers, close input and channel. Safe to call multiple times.
    void close();
    bool is_running() const { return running_; }

private:
    std::unique_ptr<RemoteChannel> channel_;
    ChunkExchange exchange_;
    ResponseCollector collector_;
    std::atomic<bool> running_{true};
    std::string shell_prompt_;
    std::string kernel_name_;
    StreamDrainer stdout_drainer_;
    StreamDrainer stderr_drainer_;

    Result<void> handshake(const std::string& shell);

    // Collect a reply with default timeout/terminators resolved.
    SSHResult read_response(int timeout_ms, const std::vector<std::string>& terminators = {});

    // Discard leftover output until a flush window comes back empty.
    void drain_stdout();
};

// Terminal modes requested for the shell's pseudo-terminal: echo off,
// 14.4 kbaud in/out.
std::vector<TerminalMode> default_terminal_modes();

// Normalize the kernel probe reply: trim, lower-case, first line only.
std::string normalize_kernel_name(const std::string& raw);
