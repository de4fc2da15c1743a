#include <loadscaler/core/snapshot/snapshot_store.hpp>

using namespace LoadScaler;

void SnapshotStore::publish(const LoadSnapshot& snapshot) {
    // Allocate and fill outside the lock
    auto next = std::make_shared<const LoadSnapshot>(snapshot);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        current_.swap(next);
    }
    publish_count_.fetch_add(1, std::memory_order_relaxed);
    // previous snapshot (now in `next`) is released here, outside the lock
}

std::shared_ptr<const LoadSnapshot> SnapshotStore::read() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return current_;
}

bool SnapshotStore::hasSnapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return current_ != nullptr;
}
