#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "../model/Errors.hpp"
#include "../model/MarketTypes.hpp"

namespace Vigil {

// LLM-style reasoning service. The router runs a local instance first and falls back to a cloud one.
class IReasoningBackend {
public:
    virtual ~IReasoningBackend() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    virtual Result<nlohmann::json> infer(const ContextBundle& bundle, const Deadline& deadline) = 0;
};

} // namespace Vigil
