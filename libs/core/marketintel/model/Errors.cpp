#include "Errors.hpp"

namespace Vigil {

namespace {

class VigilCategory final : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "vigil"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::rate_limited:          return "Rate limit exceeded, retry later";
            case Errc::circuit_open:          return "Upstream temporarily unavailable";
            case Errc::timeout:               return "Upstream call timed out";
            case Errc::no_context:            return "No analyzer produced usable data";
            case Errc::deadline_exceeded:     return "Request exceeded its deadline";
            case Errc::auth_failed:           return "Authentication failed";
            case Errc::disconnected:          return "Connection closed";
            case Errc::upstream_failed:       return "Upstream call failed";
            case Errc::unknown_source:        return "Unknown data source";
            case Errc::reasoning_unavailable: return "No reasoning backend could produce an insight";
            case Errc::feature_disabled:      return "Feature disabled by configuration";
            case Errc::protocol_violation:    return "Malformed or unexpected message";
            case Errc::invalid_request:       return "Invalid request";
        }
        return "Unknown error";
    }
};

} // namespace

const boost::system::error_category& vigilCategory() noexcept {
    static const VigilCategory category;
    return category;
}

boost::system::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), vigilCategory()};
}

std::string_view errorKindName(const boost::system::error_code& ec) noexcept {
    if (ec.category() != vigilCategory()) return "Internal";
    switch (static_cast<Errc>(ec.value())) {
        case Errc::rate_limited:          return "RateLimited";
        case Errc::circuit_open:          return "CircuitOpen";
        case Errc::timeout:               return "Timeout";
        case Errc::no_context:            return "NoContext";
        case Errc::deadline_exceeded:     return "DeadlineExceeded";
        case Errc::auth_failed:           return "AuthFailed";
        case Errc::disconnected:          return "Disconnected";
        case Errc::upstream_failed:       return "UpstreamFailed";
        case Errc::unknown_source:        return "UnknownSource";
        case Errc::reasoning_unavailable: return "ReasoningUnavailable";
        case Errc::feature_disabled:      return "FeatureDisabled";
        case Errc::protocol_violation:    return "ProtocolViolation";
        case Errc::invalid_request:       return "InvalidRequest";
    }
    return "Internal";
}

std::string clientMessage(const boost::system::error_code& ec) {
    if (ec.category() != vigilCategory()) return "Internal error";
    return ec.message();
}

} // namespace Vigil
