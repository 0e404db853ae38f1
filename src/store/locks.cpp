#include "locks.hpp"

namespace consent {
namespace store {

KeyedLocks::Guard::Guard(Guard&& other) noexcept
    : owner_(other.owner_), key_(std::move(other.key_)), entry_(other.entry_) {
    other.owner_ = nullptr;
    other.entry_ = nullptr;
}

KeyedLocks::Guard& KeyedLocks::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        unlock();
        owner_ = other.owner_;
        key_ = std::move(other.key_);
        entry_ = other.entry_;
        other.owner_ = nullptr;
        other.entry_ = nullptr;
    }
    return *this;
}

KeyedLocks::Guard::~Guard() {
    unlock();
}

void KeyedLocks::Guard::unlock() {
    if (!entry_) return;
    entry_->mutex.unlock();
    owner_->release_ref(key_);
    entry_ = nullptr;
    owner_ = nullptr;
}

KeyedLocks::Entry* KeyedLocks::acquire_ref(const std::string& key) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto& slot = entries_[key];
    if (!slot) {
        slot = std::make_unique<Entry>();
    }
    slot->refs++;
    return slot.get();
}

void KeyedLocks::release_ref(const std::string& key) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return;
    if (--it->second->refs == 0) {
        entries_.erase(it);
    }
}

KeyedLocks::Guard KeyedLocks::lock(const std::string& key) {
    Entry* entry = acquire_ref(key);
    entry->mutex.lock();
    return Guard(this, key, entry);
}

std::optional<KeyedLocks::Guard> KeyedLocks::try_lock(const std::string& key) {
    Entry* entry = acquire_ref(key);
    if (!entry->mutex.try_lock()) {
        release_ref(key);
        return std::nullopt;
    }
    return Guard(this, key, entry);
}

std::size_t KeyedLocks::active_keys() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return entries_.size();
}

} // namespace store
} // namespace consent
