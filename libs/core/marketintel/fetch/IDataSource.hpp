#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "../model/Deadline.hpp"
#include "../model/Errors.hpp"

namespace Vigil {

struct FetchParams {
    std::string    symbol;
    std::string    timeframe;
    nlohmann::json options = nlohmann::json::object();
};

// External data provider (market feed, news API, analyzer backend). Implementations
// should give up once the deadline has expired; the fetcher treats late answers as timeouts.
class IDataSource {
public:
    virtual ~IDataSource() = default;

    virtual Result<nlohmann::json> pollOrStream(const FetchParams& params, const Deadline& deadline) = 0;
};

} // namespace Vigil
