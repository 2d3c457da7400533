/*
Vigil — StandIns
Role: In-process collaborators so the gateway runs end to end without vendor clients:
      a random-walk bar feed, analyzers that read the cached latest bar, and a summarizing
      reasoning backend.
Threading: All three are safe to call from backend-pool threads.
Integration: Registered by main.cpp; real deployments replace them with vendor-backed implementations.
Assumptions: Output is illustrative only; no indicator or model quality is implied.
*/
#pragma once
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include "marketintel/analysis/IAnalyzer.hpp"
#include "marketintel/analysis/IReasoningBackend.hpp"
#include "marketintel/cache/TtlCache.hpp"
#include "marketintel/fetch/IDataSource.hpp"

namespace Vigil::StandIns {

class SimulatedFeedSource : public IDataSource {
public:
    explicit SimulatedFeedSource(double startPrice = 100.0, uint32_t seed = std::random_device{}());

    Result<nlohmann::json> pollOrStream(const FetchParams& params, const Deadline& deadline) override;

private:
    std::mutex                              m_mx;
    std::mt19937                            m_rng;
    double                                  m_startPrice;
    std::unordered_map<std::string, double> m_last;   // symbol -> last close
};

class SnapshotAnalyzer : public IAnalyzer {
public:
    SnapshotAnalyzer(AnalysisKind kind, const TtlCache& cache) : m_kind(kind), m_cache(cache) {}

    [[nodiscard]] AnalysisKind kind() const override { return m_kind; }
    Result<nlohmann::json> analyze(const std::string& symbol, const nlohmann::json& params,
                                   const Deadline& deadline) override;

private:
    AnalysisKind    m_kind;
    const TtlCache& m_cache;
};

class SummaryReasoningBackend : public IReasoningBackend {
public:
    explicit SummaryReasoningBackend(std::string name) : m_name(std::move(name)) {}

    [[nodiscard]] std::string name() const override { return m_name; }
    Result<nlohmann::json> infer(const ContextBundle& bundle, const Deadline& deadline) override;

private:
    std::string m_name;
};

} // namespace Vigil::StandIns
