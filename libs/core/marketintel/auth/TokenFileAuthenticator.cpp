#include "TokenFileAuthenticator.hpp"
#include "Log.hpp"
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace Vigil {

TokenFileAuthenticator::TokenFileAuthenticator(const std::string& tokenFile) {
    loadTokenFile(tokenFile);
}

TokenFileAuthenticator::TokenFileAuthenticator(std::unordered_map<std::string, std::string> tokenToPrincipal)
    : m_tokens(std::move(tokenToPrincipal))
{}

std::optional<Principal> TokenFileAuthenticator::authenticate(const std::string& credential) const {
    if (credential.empty()) return std::nullopt;
    auto it = m_tokens.find(credential);
    if (it == m_tokens.end()) return std::nullopt;
    return Principal{it->second};
}

void TokenFileAuthenticator::loadTokenFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("TokenFileAuthenticator: failed to open token file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    }
    catch (const std::exception& ex) {
        throw std::runtime_error("TokenFileAuthenticator: failed to parse JSON from token file: " + std::string(ex.what()));
    }

    if (!j.is_object() || !j.contains("tokens") || !j["tokens"].is_array()) {
        throw std::runtime_error("TokenFileAuthenticator: missing 'tokens' array in " + path);
    }

    for (const auto& entry : j["tokens"]) {
        if (!entry.is_object()) {
            throw std::runtime_error("TokenFileAuthenticator: token entries must be objects");
        }
        std::string token = entry.value("token", "");
        std::string principal = entry.value("principal", "");
        if (token.empty() || principal.empty()) {
            throw std::runtime_error("TokenFileAuthenticator: entry needs both 'token' and 'principal'");
        }
        m_tokens[std::move(token)] = std::move(principal);
    }

    LOG_I("auth", "loaded {} token(s) from {}", m_tokens.size(), path);
}

} // namespace Vigil
