#ifndef CONSENT_STORE_LOCKS_HPP
#define CONSENT_STORE_LOCKS_HPP

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace consent {
namespace store {

// -----------------------------------------------------------------------------
// KeyedLocks - one exclusive mutex per key, created on demand
//
// Entries are reference counted and dropped once no holder or waiter is left,
// so the table only ever contains keys that are in use.
// -----------------------------------------------------------------------------
class KeyedLocks {
    struct Entry {
        std::mutex  mutex;
        std::size_t refs = 0;
    };

public:
    // Owns one acquired key. Releases it on destruction.
    class Guard {
    public:
        Guard() = default;
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

        bool owns_lock() const { return entry_ != nullptr; }
        const std::string& key() const { return key_; }

        void unlock();

    private:
        friend class KeyedLocks;
        Guard(KeyedLocks* owner, std::string key, Entry* entry)
            : owner_(owner), key_(std::move(key)), entry_(entry) {}

        KeyedLocks* owner_ = nullptr;
        std::string key_;
        Entry*      entry_ = nullptr;
    };

    KeyedLocks() = default;
    KeyedLocks(const KeyedLocks&) = delete;
    KeyedLocks& operator=(const KeyedLocks&) = delete;

    // Waits until the key is free.
    Guard lock(const std::string& key);

    // Returns nullopt immediately if another holder has the key.
    std::optional<Guard> try_lock(const std::string& key);

    // Number of keys currently held or waited on.
    std::size_t active_keys() const;

private:
    Entry* acquire_ref(const std::string& key);
    void release_ref(const std::string& key);

    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

} // namespace store
} // namespace consent

#endif // CONSENT_STORE_LOCKS_HPP
