#pragma once

#include <cstddef>

// ── Command status ──────────────────────────────────────────
constexpr int SHELL_STATUS_OK            = 0;
constexpr int SHELL_STATUS_REMOTE_ERROR  = 1;     // remote wrote to the error stream
constexpr int SHELL_STATUS_IO_ERROR      = -1;    // local write/setup failure

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_RESPONSE_TIMEOUT_MS = 5000;  // used when a caller passes 0
constexpr int FLUSH_TIMEOUT_MS            = 1;     // stale-output flush window
constexpr int PROMPT_PROBE_TIMEOUT_MS     = 1000;  // empty command that echoes the prompt
constexpr int KERNEL_PROBE_TIMEOUT_MS     = 20000; // uname -s
constexpr int SSH_POLL_INTERVAL_MS        = 50;    // socket poll while a read has no data
constexpr int SSH_WRITE_MAX_RETRIES       = 100;   // EAGAIN retries before a write stalls

// ── Buffer sizes ────────────────────────────────────────────
constexpr size_t DRAIN_BUF_SIZE          = 128 * 1024;

// ── Terminators ─────────────────────────────────────────────
// Used when no prompt signature has been learned yet.
constexpr const char* FALLBACK_PROMPT_TERMINATOR = "$ $";

// ── Handshake ───────────────────────────────────────────────
constexpr const char* DEFAULT_SHELL        = "/bin/bash";
constexpr const char* KERNEL_PROBE_COMMAND = "uname -s";
constexpr int PTY_BAUD_RATE                = 14400;

// ── Logging ─────────────────────────────────────────────────
constexpr size_t LOG_PREVIEW_BYTES = 500;
