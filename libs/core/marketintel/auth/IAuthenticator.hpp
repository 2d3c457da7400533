#pragma once
#include <optional>
#include <string>
#include "../model/MarketTypes.hpp"

namespace Vigil {

// Opaque capability check: a presented credential either maps to a principal or it does not.
class IAuthenticator {
public:
    virtual ~IAuthenticator() = default;

    [[nodiscard]] virtual std::optional<Principal> authenticate(const std::string& credential) const = 0;
};

} // namespace Vigil
