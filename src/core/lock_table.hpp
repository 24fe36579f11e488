#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

#include "core/types.hpp"

namespace core {

// Exclusive row locks keyed by Key. A transaction that finds the row taken waits
// on the table's queue until the holder releases it or the deadline passes.
// Locks are re-entrant for the owning transaction. The table does not order
// acquisitions itself; callers acquire in the ledger's canonical order.
template <typename Key, typename Compare = std::less<Key>>
class LockTable {
public:
    using clock = std::chrono::steady_clock;

    LockTable() = default;
    LockTable(const LockTable&) = delete;
    LockTable& operator=(const LockTable&) = delete;

    // Returns false when the deadline passed before the row became free.
    bool acquire(TxnId txn, const Key& key, clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mu_);
        auto [it, inserted] = rows_.try_emplace(key);
        Entry& entry = it->second;
        if (inserted || entry.owner == no_id) {
            entry.owner = txn;
            return true;
        }
        if (entry.owner == txn) {
            return true;
        }

        waits_.fetch_add(1, std::memory_order_relaxed);
        ++entry.waiters;
        const bool granted = released_.wait_until(lock, deadline, [&] { return entry.owner == no_id; });
        --entry.waiters;
        if (!granted) {
            timeouts_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        entry.owner = txn;
        return true;
    }

    void release(TxnId txn, const Key& key) noexcept {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = rows_.find(key);
        if (it == rows_.end() || it->second.owner != txn) {
            return;
        }
        if (it->second.waiters == 0) {
            rows_.erase(it);
            return;
        }
        it->second.owner = no_id;
        released_.notify_all();
    }

    bool is_held_by(TxnId txn, const Key& key) const {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = rows_.find(key);
        return it != rows_.end() && it->second.owner == txn;
    }

    std::size_t locked_count() const {
        std::lock_guard<std::mutex> lock(mu_);
        std::size_t n = 0;
        for (const auto& [key, entry] : rows_) {
            if (entry.owner != no_id) {
                ++n;
            }
        }
        return n;
    }

    std::uint64_t wait_count() const noexcept { return waits_.load(std::memory_order_relaxed); }
    std::uint64_t timeout_count() const noexcept { return timeouts_.load(std::memory_order_relaxed); }

private:
    struct Entry {
        TxnId owner{no_id};
        std::size_t waiters{0};
    };

    mutable std::mutex mu_;
    std::condition_variable released_;
    std::map<Key, Entry, Compare> rows_;
    std::atomic<std::uint64_t> waits_{0};
    std::atomic<std::uint64_t> timeouts_{0};
};

} // namespace core
