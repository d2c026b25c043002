#include "backend/SnapshotPublisher.hpp"

namespace tunebox::backend {

SnapshotPublisher::SnapshotPublisher()
    : current_(std::make_shared<const model::Snapshot>()) {
}

void SnapshotPublisher::publish(model::PlaybackState state) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<model::Snapshot>();
    next->seq = current_.load(std::memory_order_acquire)->seq + 1;
    next->playback = std::move(state);
    next->timestamp = std::chrono::steady_clock::now();
    current_.store(std::move(next), std::memory_order_release);
}

std::shared_ptr<const model::Snapshot> SnapshotPublisher::get_current() const {
    return current_.load(std::memory_order_acquire);
}

uint64_t SnapshotPublisher::seq() const {
    return get_current()->seq;
}

}  // namespace tunebox::backend
