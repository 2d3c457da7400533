#include "OrchestrationRouter.hpp"
#include "Log.hpp"
#include <future>
#include <boost/asio/post.hpp>

namespace Vigil {

OrchestrationRouter::OrchestrationRouter(ContextAssembler& assembler,
                                         std::shared_ptr<IReasoningBackend> local,
                                         std::shared_ptr<IReasoningBackend> cloud,
                                         boost::asio::thread_pool& backendPool,
                                         const ReasoningConfig& reasoning,
                                         const FeatureFlags& features)
    : m_assembler(assembler)
    , m_local(std::move(local))
    , m_cloud(std::move(cloud))
    , m_pool(backendPool)
    , m_reasoning(reasoning)
    , m_features(features)
{}

Result<Insight> OrchestrationRouter::handle(const AnalysisRequest& request) {
    const auto started = std::chrono::steady_clock::now();
    if (request.deadline.expired()) return outcome::failure(make_error_code(Errc::deadline_exceeded));

    // Analyzers get a share of the budget; the rest is kept for reasoning.
    AnalysisRequest contextRequest = request;
    const auto left = request.deadline.remaining();
    if (left != std::chrono::milliseconds::max()) {
        contextRequest.deadline = request.deadline.child(std::chrono::milliseconds{
            static_cast<int64_t>(static_cast<double>(left.count()) * m_reasoning.contextShare)});
    }

    std::shared_ptr<const ContextBundle> bundle;
    try {
        bundle = std::make_shared<const ContextBundle>(m_assembler.assemble(contextRequest));
    }
    catch (const std::exception& ex) {
        LOG_E("router", "request {} context assembly threw: {}", request.requestId, ex.what());
        return outcome::failure(make_error_code(Errc::upstream_failed));
    }

    if (bundle->allFailed()) {
        LOG_D("router", "request {} has no usable context", request.requestId);
        return outcome::failure(make_error_code(Errc::no_context));
    }

    Insight insight;
    insight.requestId = request.requestId;
    insight.symbols = request.symbols;
    insight.partial = !bundle->complete;
    insight.missingKinds = bundle->missingKinds();

    auto finish = [&](std::string backend, nlohmann::json content) {
        insight.backend = std::move(backend);
        insight.content = std::move(content);
        insight.elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        return outcome::success(std::move(insight));
    };

    // With AI insights switched off the assembled context is the answer.
    if (!m_features.aiInsights) return finish("context", bundle->toJson());

    bool anyAnswered = false;
    nlohmann::json content;

    if (m_local) {
        switch (runBackend(m_local, bundle, request.deadline.child(m_reasoning.localBudget), content)) {
            case Outcome::Answered: return finish("local", std::move(content));
            case Outcome::Failed:
                anyAnswered = true;
                LOG_I("router", "request {} local backend failed, falling back to cloud", request.requestId);
                break;
            case Outcome::NoAnswer:
                LOG_I("router", "request {} local backend out of budget, falling back to cloud", request.requestId);
                break;
        }
    }

    if (m_cloud && !request.deadline.expired()) {
        switch (runBackend(m_cloud, bundle, request.deadline.child(), content)) {
            case Outcome::Answered: return finish("cloud", std::move(content));
            case Outcome::Failed:   anyAnswered = true; break;
            case Outcome::NoAnswer: break;
        }
    }

    if (anyAnswered) {
        LOG_W("router", "request {}: no reasoning backend produced an insight", request.requestId);
        return outcome::failure(make_error_code(Errc::reasoning_unavailable));
    }
    LOG_W("router", "request {}: deadline passed before any backend answered", request.requestId);
    return outcome::failure(make_error_code(Errc::deadline_exceeded));
}

OrchestrationRouter::Outcome OrchestrationRouter::runBackend(const std::shared_ptr<IReasoningBackend>& backend,
                                                             const std::shared_ptr<const ContextBundle>& bundle,
                                                             Deadline deadline,
                                                             nlohmann::json& content) {
    auto task = std::make_shared<std::packaged_task<Result<nlohmann::json>()>>(
        [backend, bundle, deadline]() -> Result<nlohmann::json> {
            try {
                return backend->infer(*bundle, deadline);
            }
            catch (const std::exception& ex) {
                LOG_W("router", "backend '{}' threw: {}", backend->name(), ex.what());
                return outcome::failure(make_error_code(Errc::upstream_failed));
            }
        });
    auto future = task->get_future();
    boost::asio::post(m_pool, [task]() { (*task)(); });

    if (!waitFor(future, deadline)) {
        deadline.cancel();
        return Outcome::NoAnswer;
    }

    auto result = future.get();
    if (!result) {
        LOG_D("router", "backend '{}' answered with {}", backend->name(), errorKindName(result.error()));
        return Outcome::Failed;
    }
    content = std::move(result).value();
    return Outcome::Answered;
}

} // namespace Vigil
