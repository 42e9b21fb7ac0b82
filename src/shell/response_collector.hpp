#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "chunk_exchange.hpp"
#include "terminator.hpp"

// ResponseCollector: gathers one command's reply from the chunk exchange.
//
// Reads chunks until the accumulated text of a stream satisfies a terminator
// while no further stdout chunk is waiting, or until the deadline. A deadline
// is not an error: the call returns whatever arrived.
//
// Error-stream text becomes a soft error (SHELL_STATUS_REMOTE_ERROR) carried
// next to the stdout text. When the prompt signature is known, the echoed
// "\r\n<prompt>" that follows the reply is cut off.
class ResponseCollector {
public:
    explicit ResponseCollector(ChunkExchange& exchange);

    SSHResult collect(int timeout_ms,
                      const std::vector<Terminator>& terminators,
                      const std::string& shell_prompt);

    // Discard leftover output: collect with a minimal window and no
    // terminators until a window yields no stdout text. Returns the number
    // of windows that produced output.
    int flush(const std::string& shell_prompt);

private:
    ChunkExchange& exchange_;
};

// Cut the reply at the last "\r\n" + prompt. Left untouched when the prompt is
// empty or only found at the very start.
std::string strip_trailing_prompt(const std::string& output, const std::string& shell_prompt);
