#pragma once
#include "wolfram_types.h"
#include <optional>
#include <QHash>
#include <QMutex>

struct WolframCacheKey {
    QString query;
    bool imageOnly = false;

    bool operator==(const WolframCacheKey& other) const {
        return imageOnly == other.imageOnly && query == other.query;
    }
};

inline size_t qHash(const WolframCacheKey& key, size_t seed = 0) noexcept
{
    return qHashMulti(seed, key.query, key.imageOnly);
}

// Bounded memo of successful Wolfram answers. When full, inserting a new key
// evicts one arbitrary entry; entries never expire.
class WolframResultCache {
public:
    explicit WolframResultCache(int capacity = 100);

    std::optional<WolframResults> lookup(const QString& query, bool imageOnly) const;
    void insert(const QString& query, bool imageOnly, const WolframResults& results);

    int size() const;
    int capacity() const { return m_capacity; }
    void clear();

private:
    const int m_capacity;
    mutable QMutex m_mutex;
    QHash<WolframCacheKey, WolframResults> m_entries;
};
