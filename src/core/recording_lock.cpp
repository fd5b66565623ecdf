#include "core/recording_lock.hpp"
#include "utils/error_handler.hpp"

namespace medscribe {
namespace core {

RecordingLockRegistry::Guard::Guard(RecordingLockRegistry* registry, std::string recordingId,
                                    std::shared_ptr<Entry> entry)
    : registry_(registry)
    , recordingId_(std::move(recordingId))
    , entry_(std::move(entry)) {
}

RecordingLockRegistry::Guard::Guard(Guard&& other) noexcept
    : registry_(other.registry_)
    , recordingId_(std::move(other.recordingId_))
    , entry_(std::move(other.entry_)) {
    other.registry_ = nullptr;
}

RecordingLockRegistry::Guard::~Guard() {
    if (!registry_ || !entry_) {
        return;
    }
    entry_->mutex.unlock();
    registry_->release(recordingId_);
}

RecordingLockRegistry::Guard RecordingLockRegistry::acquire(const std::string& recordingId) {
    if (recordingId.empty()) {
        throw utils::PipelineException("Cannot lock an empty recording id", "RecordingLockRegistry");
    }

    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = entries_[recordingId];
        if (!slot) {
            slot = std::make_shared<Entry>();
        }
        ++slot->users;
        entry = slot;
    }

    entry->mutex.lock();
    return Guard(this, recordingId, std::move(entry));
}

void RecordingLockRegistry::release(const std::string& recordingId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(recordingId);
    if (it == entries_.end()) {
        return;
    }
    if (--it->second->users == 0) {
        entries_.erase(it);
    }
}

size_t RecordingLockRegistry::getActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace core
} // namespace medscribe
