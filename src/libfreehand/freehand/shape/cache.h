// =====================================================================
//  src/libfreehand/freehand/shape/cache.h — Identity-keyed geometry cache
// =====================================================================
//
//  Memoizes values derived from shared, immutable inputs (point lists,
//  styles).  Entries are keyed by the *identity* of the input, not its
//  contents: a new list with equal points is a different key.
//
//  The cache only holds a weak reference to each key.  Once the last
//  owner of a key lets it go the entry can never be hit again and is
//  dropped by purgeExpired() (or evict() when the owner knows).  Misses
//  also purge on their own whenever the table has doubled since the last
//  purge, so a stream of short-lived keys keeps the table small.
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FREEHAND_SHAPE_CACHE_H
#define FREEHAND_SHAPE_CACHE_H

#include "../core.h"

#include <QtGlobal>

#include <memory>
#include <unordered_map>
#include <utility>

namespace freehand {
namespace shape {

template <typename Key, typename Value>
class IdentityCache {
public:
    using KeyPtr = std::shared_ptr<const Key>;

    /// Return the value cached for @p key, or compute, store and return it.
    /// A null key is never cached.
    template <typename Compute>
    const Value& get(const KeyPtr& key, Compute&& compute)
    {
        return getIf(key, [](const Value&) { return true; }, std::forward<Compute>(compute));
    }

    /// Like get(), but a cached value is only reused when @p isValid
    /// accepts it; otherwise it is recomputed and replaced.
    template <typename Validate, typename Compute>
    const Value& getIf(const KeyPtr& key, Validate&& isValid, Compute&& compute)
    {
        if (!key) {
            m_scratch = compute();
            return m_scratch;
        }

        auto it = m_entries.find(key.get());
        if (it != m_entries.end()) {
            // The address may have been reused by a new list after the
            // old one died; only a live, identical owner counts as a hit.
            if (it->second.owner.lock() == key && isValid(it->second.value)) {
                ++m_hits;
                return it->second.value;
            }
            m_entries.erase(it);
        }

        ++m_misses;
        if (static_cast<int>(m_entries.size()) >= m_purgeThreshold) {
            purgeExpired();
            m_purgeThreshold = qMax(MIN_PURGE_THRESHOLD, 2 * size());
        }

        Entry entry{ std::weak_ptr<const Key>(key), compute() };
        auto inserted = m_entries.emplace(key.get(), std::move(entry));
        return inserted.first->second.value;
    }

    /// Check for a live entry without computing anything
    bool contains(const KeyPtr& key) const
    {
        if (!key) return false;
        auto it = m_entries.find(key.get());
        return it != m_entries.end() && it->second.owner.lock() == key;
    }

    /// Drop the entry for @p key
    void evict(const KeyPtr& key)
    {
        if (key) {
            m_entries.erase(key.get());
        }
    }

    /// Drop every entry whose key is no longer owned by anyone.
    /// @return Number of entries removed
    int purgeExpired()
    {
        int removed = 0;
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (it->second.owner.expired()) {
                it = m_entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        if (removed > 0) {
            qCDebug(lcFreehand) << "IdentityCache: purged" << removed << "expired entries";
        }
        return removed;
    }

    void clear()
    {
        m_entries.clear();
        m_purgeThreshold = MIN_PURGE_THRESHOLD;
    }

    int size() const { return static_cast<int>(m_entries.size()); }

    /// Lookups answered from the cache
    int hits() const { return m_hits; }

    /// Lookups that had to compute
    int misses() const { return m_misses; }

private:
    /// Table size at which a miss first purges expired entries
    static constexpr int MIN_PURGE_THRESHOLD = 32;

    struct Entry {
        std::weak_ptr<const Key> owner;
        Value value;
    };

    std::unordered_map<const Key*, Entry> m_entries;
    Value m_scratch{};
    int m_hits = 0;
    int m_misses = 0;
    int m_purgeThreshold = MIN_PURGE_THRESHOLD;
};

}  // namespace shape
}  // namespace freehand

#endif  // FREEHAND_SHAPE_CACHE_H
