#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "sqlcas/core/errors.hpp"
#include "sqlcas/db/db.hpp"
#include "sqlcas/registry/registry.hpp"

namespace sqlcas::registry {

using ConnectionHandle = std::shared_ptr<const sqlcas::db::Connection>;

// Lazily opened read-only connections, one per database name, kept for the
// lifetime of the cache. A cached handle keeps serving the file it was opened
// on even if a later registry build points the name elsewhere.
class ConnectionCache {
public:
    explicit ConnectionCache(const Registry& registry) noexcept : registry_(registry) {}

    ConnectionCache(const ConnectionCache&) = delete;
    ConnectionCache& operator=(const ConnectionCache&) = delete;

    // NotFound if the registry does not know `name`; an open failure is
    // returned as-is and nothing is cached.
    [[nodiscard]] sqlcas::core::Status get(std::string_view name, ConnectionHandle* out) noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

    // Name slots currently held, including ones whose open is in progress.
    [[nodiscard]] std::size_t slot_count() const noexcept;

    // Connections opened so far, across all names.
    [[nodiscard]] std::size_t open_count() const noexcept { return opens_.load(std::memory_order_relaxed); }

private:
    // Opening happens under the slot mutex, so concurrent first requests for
    // one name open a single connection while other names proceed.
    // A slot whose open failed is retired and dropped from slots_; a waiter
    // that finds it retired starts over with a fresh slot.
    struct Slot {
        std::mutex mutex;
        ConnectionHandle conn;
        bool retired{false};
    };

    // Lock order: a slot mutex may be held while taking mutex_, never the
    // reverse.
    void retire(std::string_view name, const std::shared_ptr<Slot>& slot) noexcept;

    const Registry& registry_;
    mutable std::mutex mutex_;  // guards slots_
    std::map<std::string, std::shared_ptr<Slot>, std::less<>> slots_;
    std::atomic<std::size_t> opens_{0};
};

} // namespace sqlcas::registry
