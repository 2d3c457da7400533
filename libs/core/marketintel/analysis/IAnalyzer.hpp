#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "../fetch/IDataSource.hpp"
#include "../model/MarketTypes.hpp"

namespace Vigil {

// One specialized analysis backend (technical indicators, pattern recognition, sentiment).
class IAnalyzer {
public:
    virtual ~IAnalyzer() = default;

    [[nodiscard]] virtual AnalysisKind kind() const = 0;
    virtual Result<nlohmann::json> analyze(const std::string& symbol, const nlohmann::json& params,
                                           const Deadline& deadline) = 0;
};

/// Exposes an analyzer to the RateLimitedFetcher so analyzer calls get the same
/// admission and breaker treatment as any other upstream.
class AnalyzerSource final : public IDataSource {
public:
    explicit AnalyzerSource(std::shared_ptr<IAnalyzer> analyzer) : m_analyzer(std::move(analyzer)) {}

    Result<nlohmann::json> pollOrStream(const FetchParams& params, const Deadline& deadline) override {
        return m_analyzer->analyze(params.symbol, params.options, deadline);
    }

private:
    std::shared_ptr<IAnalyzer> m_analyzer;
};

} // namespace Vigil
