#pragma once

#include <atomic>
#include <functional>
#include <thread>
#include "chunk_exchange.hpp"
#include "remote_channel.hpp"

// StreamDrainer: background thread that empties one channel stream into the
// chunk exchange, one chunk per successful read.
//
// Any read failure (error or end of stream) on either stream means the whole
// session is unusable: the drainer calls on_failure, which tears the session
// down, and exits.
class StreamDrainer {
public:
    using FailureCallback = std::function<void()>;

    StreamDrainer(RemoteChannel& channel, StreamKind stream, ChunkExchange& exchange,
                  const std::atomic<bool>& running, FailureCallback on_failure);
    ~StreamDrainer();

    StreamDrainer(const StreamDrainer&) = delete;
    StreamDrainer& operator=(const StreamDrainer&) = delete;

    void start();

    // Waits for the thread. No-op if never started or called on the drainer itself.
    void join();

    StreamKind stream() const { return stream_; }

private:
    RemoteChannel& channel_;
    StreamKind stream_;
    ChunkExchange& exchange_;
    const std::atomic<bool>& running_;
    FailureCallback on_failure_;
    std::thread thread_;

    void drain_loop();
};

const char* stream_name(StreamKind stream);
