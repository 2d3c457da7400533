#pragma once
#include "marketintel/auth/IAuthenticator.hpp"
#include <atomic>
#include <map>
#include <stdexcept>
#include <string>

/// Mock authenticator: a fixed token table plus a call counter
class MockAuthenticator : public Vigil::IAuthenticator {
public:
    MockAuthenticator() {
        tokens_["good-token"] = "alice";
        tokens_["other-token"] = "bob";
    }

    std::optional<Vigil::Principal> authenticate(const std::string& credential) const override {
        ++calls_;
        if (throws_) throw std::runtime_error("token store unavailable");
        auto it = tokens_.find(credential);
        if (it == tokens_.end()) return std::nullopt;
        return Vigil::Principal{it->second};
    }

    void addToken(std::string token, std::string principal) {
        tokens_[std::move(token)] = std::move(principal);
    }

    void setThrows(bool t) { throws_ = t; }

    int calls() const { return calls_.load(); }

private:
    std::map<std::string, std::string> tokens_;
    mutable std::atomic<int> calls_{0};
    std::atomic<bool> throws_{false};
};
