#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include "remote_channel.hpp"

struct Chunk {
    StreamKind stream;
    std::string text;
};

// ChunkExchange: unbuffered hand-off between the stream drainers and the
// response collector. One lane per stream.
//
// offer() parks the chunk in its lane and blocks until a collector takes it,
// so a drainer never runs more than one read ahead of the consumer.
// take_until() is the collector's multi-way wait: the oldest chunk from
// either lane, or nothing once the deadline passes.
//
// Locking: a single mutex guards both lanes; offer() waits on taken_cv_,
// take_until() waits on offered_cv_.
class ChunkExchange {
public:
    using Clock = std::chrono::steady_clock;

    ChunkExchange() = default;

    ChunkExchange(const ChunkExchange&) = delete;
    ChunkExchange& operator=(const ChunkExchange&) = delete;

    // Returns false if the exchange was closed before the chunk was taken.
    bool offer(StreamKind stream, std::string text);

    // Returns nullopt at the deadline, or immediately when closed and empty.
    std::optional<Chunk> take_until(Clock::time_point deadline);

    // Chunks offered on this lane and not yet taken.
    size_t pending(StreamKind stream) const;

    // Release every blocked offer(). Chunks already parked stay takeable.
    void close();
    bool is_closed() const;

private:
    struct Entry {
        uint64_t seq;
        Chunk chunk;
    };

    mutable std::mutex mutex_;
    std::condition_variable offered_cv_;
    std::condition_variable taken_cv_;
    std::deque<Entry> stdout_lane_;
    std::deque<Entry> stderr_lane_;
    uint64_t next_seq_ = 0;
    bool closed_ = false;

    std::deque<Entry>& lane(StreamKind stream);
    const std::deque<Entry>& lane(StreamKind stream) const;
};
