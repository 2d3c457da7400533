#pragma once
/*
Vigil — Errors
Role: The error kinds every component reports, as a boost::system error category.
Inputs/Outputs: Errc values convert to boost::system::error_code; Result<T> carries value or code.
Threading: Stateless; the category is a function-local static.
Integration: Fetcher, assembler and router return Result<T>; the gateway turns codes into error frames.
Related: Errors.cpp, ClientProtocol.hpp.
*/
#include <string>
#include <string_view>
#include <boost/system/error_code.hpp>
#include <boost/outcome/result.hpp>

namespace Vigil {

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

enum class Errc {
    rate_limited = 1,
    circuit_open,
    timeout,
    no_context,
    deadline_exceeded,
    auth_failed,
    disconnected,
    upstream_failed,
    unknown_source,
    reasoning_unavailable,
    feature_disabled,
    protocol_violation,
    invalid_request,
};

const boost::system::error_category& vigilCategory() noexcept;

boost::system::error_code make_error_code(Errc e) noexcept;

/// Wire name of an error kind ("RateLimited", "CircuitOpen", ...).
/// Codes from other categories map to "Internal".
std::string_view errorKindName(const boost::system::error_code& ec) noexcept;

/// Client-safe message for an error code; never contains upstream text.
std::string clientMessage(const boost::system::error_code& ec);

template <class T>
using Result = outcome::result<T>;

} // namespace Vigil

namespace boost::system {
template <>
struct is_error_code_enum<Vigil::Errc> : std::true_type {};
}
