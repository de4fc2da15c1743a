#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include <loadscaler/core/snapshot/load_snapshot.hpp>

namespace LoadScaler {

/**
 * Read side of the snapshot cache. Query handlers only see this.
 */
class SnapshotReader {
public:
    virtual ~SnapshotReader() = default;

    /**
     * @return latest published snapshot, or nullptr if nothing was published yet
     */
    virtual std::shared_ptr<const LoadSnapshot> read() const = 0;
};

/**
 * Single-slot snapshot cache (one writer, many readers)
 *
 * The writer builds the new snapshot outside the lock; the critical section
 * is a shared_ptr swap, so a reader never waits for a reduction.
 */
class SnapshotStore : public SnapshotReader {
public:
    SnapshotStore() = default;
    ~SnapshotStore() override = default;

    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    /**
     * Only RefreshLoop should call this
     */
    void publish(const LoadSnapshot& snapshot);

    std::shared_ptr<const LoadSnapshot> read() const override;

    bool hasSnapshot() const;
    uint64_t publishCount() const { return publish_count_.load(std::memory_order_relaxed); }

private:
    mutable std::mutex mtx_;
    std::shared_ptr<const LoadSnapshot> current_;
    std::atomic<uint64_t> publish_count_{0};
};

} // namespace LoadScaler
