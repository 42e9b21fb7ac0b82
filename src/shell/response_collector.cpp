#include "response_collector.hpp"
#include <core/constants.hpp>
#include <chrono>

ResponseCollector::ResponseCollector(ChunkExchange& exchange)
    : exchange_(exchange) {}

SSHResult ResponseCollector::collect(int timeout_ms,
                                     const std::vector<Terminator>& terminators,
                                     const std::string& shell_prompt) {
    auto deadline = ChunkExchange::Clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string out;
    std::string err_out;

    while (true) {
        auto chunk = exchange_.take_until(deadline);
        if (!chunk) break;

        // A match only ends the read once no further stdout chunk is waiting.
        if (chunk->stream == StreamKind::STDOUT) {
            out += chunk->text;
            if (has_terminator(out, terminators) &&
                exchange_.pending(StreamKind::STDOUT) == 0) {
                break;
            }
        } else {
            err_out += chunk->text;
            if (has_terminator(err_out, terminators) &&
                exchange_.pending(StreamKind::STDOUT) == 0) {
                break;
            }
        }
    }

    int status = err_out.empty() ? SHELL_STATUS_OK : SHELL_STATUS_REMOTE_ERROR;
    return SSHResult{status, strip_trailing_prompt(out, shell_prompt), err_out};
}

int ResponseCollector::flush(const std::string& shell_prompt) {
    int windows = 0;
    while (true) {
        auto r = collect(FLUSH_TIMEOUT_MS, {}, shell_prompt);
        if (r.stdout_data.empty()) return windows;
        windows++;
    }
}

std::string strip_trailing_prompt(const std::string& output, const std::string& shell_prompt) {
    if (output.empty() || shell_prompt.empty()) return output;

    auto index = output.rfind("\r\n" + shell_prompt);
    if (index != std::string::npos && index > 0) {
        return output.substr(0, index);
    }
    return output;
}
