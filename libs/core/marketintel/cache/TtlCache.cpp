#include "TtlCache.hpp"
#include "Log.hpp"
#include <mutex>

namespace Vigil {

TtlCache::TtlCache(size_t purgeEveryNWrites)
    : m_purgeEvery(purgeEveryNWrites == 0 ? 1 : purgeEveryNWrites)
{}

std::optional<nlohmann::json> TtlCache::get(const std::string& key) const {
    std::shared_ptr<const CacheEntry> entry;
    {
        std::shared_lock<std::shared_mutex> lock(m_mx);
        auto it = m_entries.find(key);
        if (it == m_entries.end()) return std::nullopt;
        entry = it->second;
    }
    if (entry->expired(std::chrono::steady_clock::now())) return std::nullopt;
    return entry->value;
}

void TtlCache::put(const std::string& key, nlohmann::json value, std::chrono::milliseconds ttl) {
    auto now = std::chrono::steady_clock::now();
    auto entry = std::make_shared<const CacheEntry>(CacheEntry{key, std::move(value), now, ttl});

    std::unique_lock<std::shared_mutex> lock(m_mx);
    m_entries[key] = std::move(entry);

    if (++m_writes % m_purgeEvery == 0) {
        size_t removed = purgeLocked(now);
        if (removed > 0) {
            LOG_D("cache", "purged {} expired entries ({} remain)", removed, m_entries.size());
        }
    }
}

size_t TtlCache::purgeExpired() {
    std::unique_lock<std::shared_mutex> lock(m_mx);
    return purgeLocked(std::chrono::steady_clock::now());
}

size_t TtlCache::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mx);
    return m_entries.size();
}

size_t TtlCache::purgeLocked(std::chrono::steady_clock::time_point now) {
    return std::erase_if(m_entries, [now](const auto& kv) { return kv.second->expired(now); });
}

std::string TtlCache::makeKey(std::string_view source, std::string_view symbol, const nlohmann::json& params) {
    std::string key;
    key.reserve(source.size() + symbol.size() + 16);
    key.append(source).append(":").append(symbol).append(":");
    key.append(params.is_null() ? "{}" : params.dump());
    return key;
}

} // namespace Vigil
