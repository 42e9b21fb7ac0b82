#include "stream_drainer.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <vector>

const char* stream_name(StreamKind stream) {
    return stream == StreamKind::STDOUT ? "stdout" : "stderr";
}

StreamDrainer::StreamDrainer(RemoteChannel& channel, StreamKind stream,
                             ChunkExchange& exchange,
                             const std::atomic<bool>& running,
                             FailureCallback on_failure)
    : channel_(channel), stream_(stream), exchange_(exchange),
      running_(running), on_failure_(std::move(on_failure)) {}

StreamDrainer::~StreamDrainer() {
    join();
}

void StreamDrainer::start() {
    thread_ = std::thread(&StreamDrainer::drain_loop, this);
}

void StreamDrainer::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void StreamDrainer::drain_loop() {
    std::vector<char> buf(DRAIN_BUF_SIZE);

    while (running_) {
        ssize_t n = channel_.read(stream_, buf.data(), buf.size());

        if (n > 0) {
            if (!exchange_.offer(stream_, std::string(buf.data(), static_cast<size_t>(n)))) {
                return;  // session closed while the chunk waited for a taker
            }
            continue;
        }

        if (running_) {
            mcsh_log(fmt::format("[drainer] {} read failed ({}), closing session",
                                 stream_name(stream_), n));
            if (on_failure_) on_failure_();
        }
        return;
    }
}
