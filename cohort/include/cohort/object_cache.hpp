#pragma once
// Object Cache: id -> live handle
//
// Filled only by successful resolution and emptied by explicit removal.
// The table decides membership; the cache may be stale or empty at any
// time and only saves repeated resolution.

#include "types.hpp"
#include <unordered_map>
#include <vector>

namespace cohort {

class ObjectCache {
public:
    // Cached handle, or nullptr on a miss
    HandlePtr get(const MemberId& id) const {
        auto it = entries_.find(id);
        if (it == entries_.end()) return nullptr;
        return it->second;
    }

    bool contains(const MemberId& id) const {
        auto it = entries_.find(id);
        return it != entries_.end() && it->second;
    }

    // Store a resolved handle. A live entry already present is kept.
    void insert(const MemberId& id, HandlePtr handle) {
        if (!handle) return;
        auto& slot = entries_[id];
        if (!slot) slot = std::move(handle);
    }

    // Replace the entry wholesale
    void replace(const MemberId& id, HandlePtr handle) {
        if (!handle) {
            entries_.erase(id);
            return;
        }
        entries_[id] = std::move(handle);
    }

    void erase(const MemberId& id) {
        entries_.erase(id);
    }

    void erase(const std::vector<MemberId>& ids) {
        for (const auto& id : ids) entries_.erase(id);
    }

    void clear() { entries_.clear(); }

    size_t size() const { return entries_.size(); }

private:
    std::unordered_map<MemberId, HandlePtr, MemberIdHash> entries_;
};

} // namespace cohort
