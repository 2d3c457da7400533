/*
Vigil — OrchestrationRouter
Role: Turns an analysis request into an Insight: assemble context, then reason over it.
Inputs/Outputs: handle(AnalysisRequest) -> Result<Insight>.
Threading: Runs on request-pool threads; reasoning calls run on the backend pool and are awaited
           against the request deadline so a hung backend cannot hold the request.
Performance: The local backend gets at most reasoning.local_budget_ms; the cloud backend the rest.
Integration: Called by Gateway for analyze frames.
Observability: Fallbacks and failures log under "router".
Related: OrchestrationRouter.cpp, ContextAssembler.hpp, IReasoningBackend.hpp.
Assumptions: Either backend may be absent; an absent backend is skipped.
*/
#pragma once
#include <memory>
#include <boost/asio/thread_pool.hpp>
#include "ContextAssembler.hpp"
#include "IReasoningBackend.hpp"

namespace Vigil {

class OrchestrationRouter {
public:
    OrchestrationRouter(ContextAssembler& assembler,
                        std::shared_ptr<IReasoningBackend> local,
                        std::shared_ptr<IReasoningBackend> cloud,
                        boost::asio::thread_pool& backendPool,
                        const ReasoningConfig& reasoning,
                        const FeatureFlags& features);

    [[nodiscard]] Result<Insight> handle(const AnalysisRequest& request);

private:
    enum class Outcome { Answered, Failed, NoAnswer };

    /// Runs one backend on the pool, waiting at most until `deadline`.
    Outcome runBackend(const std::shared_ptr<IReasoningBackend>& backend,
                       const std::shared_ptr<const ContextBundle>& bundle,
                       Deadline deadline,
                       nlohmann::json& content);

    ContextAssembler&                  m_assembler;
    std::shared_ptr<IReasoningBackend> m_local;
    std::shared_ptr<IReasoningBackend> m_cloud;
    boost::asio::thread_pool&          m_pool;
    ReasoningConfig                    m_reasoning;
    FeatureFlags                       m_features;
};

} // namespace Vigil
