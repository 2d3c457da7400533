/*
Vigil — TtlCache
Role: Thread-safe key/value store with per-entry time-to-live and lazy expiry.
Inputs/Outputs: put(key, value, ttl) stores an immutable entry; get(key) returns a live value or nothing.
Threading: std::shared_mutex; concurrent readers, exclusive writers. Last writer wins.
Performance: Reads never evict; expired entries are purged on the write path every N writes.
Integration: Written by the Context Assembler and Feed Ingestor; read by the assembler and analyzers.
Observability: Purges log at debug under "cache".
Related: TtlCache.cpp, ContextAssembler.hpp, FeedIngestor.hpp.
Assumptions: No size bound; the key space is bounded by configured feeds and analysis requests.
*/
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace Vigil {

struct CacheEntry {
    std::string                           key;
    nlohmann::json                        value;
    std::chrono::steady_clock::time_point insertedAt;
    std::chrono::milliseconds             ttl;

    [[nodiscard]] bool expired(std::chrono::steady_clock::time_point now) const noexcept {
        return now - insertedAt >= ttl;
    }
};

class TtlCache {
public:
    explicit TtlCache(size_t purgeEveryNWrites = 256);

    [[nodiscard]] std::optional<nlohmann::json> get(const std::string& key) const;
    void put(const std::string& key, nlohmann::json value, std::chrono::milliseconds ttl);

    /// Drops every expired entry now; returns how many were removed.
    size_t purgeExpired();

    /// Entries currently stored, expired ones included.
    [[nodiscard]] size_t size() const;

    /// "source:SYMBOL:<params as compact JSON>"; object keys are sorted so equal params give equal keys.
    static std::string makeKey(std::string_view source, std::string_view symbol, const nlohmann::json& params);

private:
    size_t purgeLocked(std::chrono::steady_clock::time_point now);

    mutable std::shared_mutex                                            m_mx;
    std::unordered_map<std::string, std::shared_ptr<const CacheEntry>>   m_entries;
    size_t                                                               m_purgeEvery;
    std::atomic<size_t>                                                  m_writes{0};
};

} // namespace Vigil
