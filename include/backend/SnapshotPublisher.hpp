#pragma once

#include "model/Snapshot.hpp"
#include <atomic>
#include <memory>
#include <mutex>

namespace tunebox::backend {

// Single writer (UI loop), any number of readers. Each publish swaps in a
// fresh immutable snapshot; readers keep whatever they loaded alive.
class SnapshotPublisher {
public:
    SnapshotPublisher();

    // Stamps seq and timestamp, then makes the state visible to readers.
    void publish(model::PlaybackState state);
    std::shared_ptr<const model::Snapshot> get_current() const;
    uint64_t seq() const;

private:
    std::atomic<std::shared_ptr<const model::Snapshot>> current_;
    std::mutex write_mutex_;
};

}  // namespace tunebox::backend
