#include "result_cache.h"
#include "core/log_manager.h"

WolframResultCache::WolframResultCache(int capacity)
    : m_capacity(qMax(1, capacity))
{
}

std::optional<WolframResults> WolframResultCache::lookup(const QString& query, bool imageOnly) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_entries.constFind(WolframCacheKey{query, imageOnly});
    if (it == m_entries.constEnd())
        return std::nullopt;
    return it.value();
}

void WolframResultCache::insert(const QString& query, bool imageOnly, const WolframResults& results)
{
    QMutexLocker locker(&m_mutex);
    const WolframCacheKey key{query, imageOnly};
    if (!m_entries.contains(key) && m_entries.size() >= m_capacity) {
        auto victim = m_entries.begin();
        LOG_DEBUG(QString("wolfram cache full (%1), evicting '%2'").arg(m_capacity).arg(victim.key().query));
        m_entries.erase(victim);
    }
    m_entries.insert(key, results);
}

int WolframResultCache::size() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_entries.size());
}

void WolframResultCache::clear()
{
    QMutexLocker locker(&m_mutex);
    m_entries.clear();
}
