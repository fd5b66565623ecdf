#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace medscribe {
namespace core {

/**
 * Name-scoped locks: one mutex per recording id, created on demand and
 * dropped when the last holder or waiter releases it.
 */
class RecordingLockRegistry {
    struct Entry {
        std::mutex mutex;
        size_t users = 0;
    };

public:
    /**
     * Holds the lock for one recording id until destroyed
     */
    class Guard {
    public:
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&&) = delete;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

        const std::string& getRecordingId() const { return recordingId_; }

    private:
        friend class RecordingLockRegistry;
        Guard(RecordingLockRegistry* registry, std::string recordingId, std::shared_ptr<Entry> entry);

        RecordingLockRegistry* registry_;
        std::string recordingId_;
        std::shared_ptr<Entry> entry_;
    };

    RecordingLockRegistry() = default;
    RecordingLockRegistry(const RecordingLockRegistry&) = delete;
    RecordingLockRegistry& operator=(const RecordingLockRegistry&) = delete;

    /**
     * Block until the lock for this id is free.
     * @throws utils::PipelineException for an empty id
     */
    Guard acquire(const std::string& recordingId);

    // Ids with at least one holder or waiter
    size_t getActiveCount() const;

private:
    void release(const std::string& recordingId);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace core
} // namespace medscribe
