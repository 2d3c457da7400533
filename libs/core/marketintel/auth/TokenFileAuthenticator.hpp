/*
Vigil — TokenFileAuthenticator
Role: Maps client bearer tokens to principals from a JSON token file.
Inputs/Outputs: Reads {"tokens":[{"token":..., "principal":...}]}; authenticate(token) -> principal.
Threading: Immutable after construction; authenticate() is safe from any thread.
Performance: File I/O is a one-time cost in the constructor; lookups are a hash probe.
Integration: Built by apps/vigil_gateway from auth.tokens_file; used by Gateway on auth frames.
Observability: Logs the number of loaded tokens, never the tokens themselves.
Related: IAuthenticator.hpp, tokens.example.json.
Assumptions: Token issuance and rotation happen outside the gateway.
*/
#pragma once
#include <string>
#include <unordered_map>
#include "IAuthenticator.hpp"

namespace Vigil {

class TokenFileAuthenticator : public IAuthenticator {
public:
    /// Throws std::runtime_error if the file is missing or malformed.
    explicit TokenFileAuthenticator(const std::string& tokenFile);

    /// In-memory token table.
    explicit TokenFileAuthenticator(std::unordered_map<std::string, std::string> tokenToPrincipal);

    [[nodiscard]] std::optional<Principal> authenticate(const std::string& credential) const override;

    [[nodiscard]] size_t size() const noexcept { return m_tokens.size(); }

private:
    void loadTokenFile(const std::string& path);

    std::unordered_map<std::string, std::string> m_tokens;   // token -> principal id
};

} // namespace Vigil
