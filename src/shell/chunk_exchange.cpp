#include "chunk_exchange.hpp"

std::deque<ChunkExchange::Entry>& ChunkExchange::lane(StreamKind stream) {
    return stream == StreamKind::STDOUT ? stdout_lane_ : stderr_lane_;
}

const std::deque<ChunkExchange::Entry>& ChunkExchange::lane(StreamKind stream) const {
    return stream == StreamKind::STDOUT ? stdout_lane_ : stderr_lane_;
}

bool ChunkExchange::offer(StreamKind stream, std::string text) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) return false;

    uint64_t seq = next_seq_++;
    auto& q = lane(stream);
    q.push_back({seq, Chunk{stream, std::move(text)}});
    offered_cv_.notify_all();

    // Lanes are FIFO, so ours is gone once the front is newer than it
    taken_cv_.wait(lock, [&] {
        return closed_ || q.empty() || q.front().seq > seq;
    });
    return q.empty() || q.front().seq > seq;
}

std::optional<Chunk> ChunkExchange::take_until(Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto ready = [&] {
        return !stdout_lane_.empty() || !stderr_lane_.empty() || closed_;
    };
    if (!offered_cv_.wait_until(lock, deadline, ready)) {
        return std::nullopt;
    }
    if (stdout_lane_.empty() && stderr_lane_.empty()) {
        return std::nullopt;  // closed
    }

    // Oldest chunk across both lanes
    std::deque<Entry>* from = &stdout_lane_;
    if (stdout_lane_.empty() ||
        (!stderr_lane_.empty() && stderr_lane_.front().seq < stdout_lane_.front().seq)) {
        from = &stderr_lane_;
    }

    Chunk chunk = std::move(from->front().chunk);
    from->pop_front();
    taken_cv_.notify_all();
    return chunk;
}

size_t ChunkExchange::pending(StreamKind stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lane(stream).size();
}

void ChunkExchange::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    offered_cv_.notify_all();
    taken_cv_.notify_all();
}

bool ChunkExchange::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}
