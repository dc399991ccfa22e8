#include "sqlcas/registry/connection_cache.hpp"

#include <utility>
#include <vector>

namespace sqlcas::registry {

using namespace sqlcas::core;

Status ConnectionCache::get(std::string_view name, ConnectionHandle* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Registry, StatusCode::Invalid);
    }

    // Unknown names never get a slot.
    DatabaseRecord rec;
    Status s = registry_.lookup(name, &rec);
    if (!is_ok(s)) {
        return s;
    }

    while (true) {
        std::shared_ptr<Slot> slot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = slots_.find(name);
            if (it == slots_.end()) {
                it = slots_.emplace(std::string(name), std::make_shared<Slot>()).first;
            }
            slot = it->second;
        }

        std::lock_guard<std::mutex> slot_lock(slot->mutex);
        if (slot->retired) {
            continue;
        }
        if (slot->conn) {
            *out = slot->conn;
            return ok_status();
        }

        auto conn = std::make_shared<sqlcas::db::Connection>();
        s = sqlcas::db::db_open_readonly(registry_.path_for(rec).c_str(), conn.get());
        if (!is_ok(s)) {
            retire(name, slot);
            return s;
        }
        opens_.fetch_add(1, std::memory_order_relaxed);

        slot->conn = std::move(conn);
        *out = slot->conn;
        return ok_status();
    }
}

void ConnectionCache::retire(std::string_view name, const std::shared_ptr<Slot>& slot) noexcept {
    slot->retired = true;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(name);
    if (it != slots_.end() && it->second == slot) {
        slots_.erase(it);
    }
}

std::size_t ConnectionCache::size() const noexcept {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slots.reserve(slots_.size());
        for (const auto& [name, slot] : slots_) {
            slots.push_back(slot);
        }
    }

    std::size_t n = 0;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> slot_lock(slot->mutex);
        if (slot->conn) ++n;
    }
    return n;
}

std::size_t ConnectionCache::slot_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

} // namespace sqlcas::registry
