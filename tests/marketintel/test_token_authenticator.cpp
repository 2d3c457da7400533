/*
Vigil — TokenFileAuthenticator Tests
Role: Verify token file loading and token → principal lookup
Testing Strategy: Temporary token files; in-memory tables
Coverage: Valid file, unknown/empty tokens, missing file, malformed JSON, bad entries
*/
#include <gtest/gtest.h>
#include "marketintel/auth/TokenFileAuthenticator.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace Vigil;

namespace {

std::string writeTemp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

} // namespace

TEST(TokenFileAuthenticator, LoadsTokensFromFile) {
    auto path = writeTemp("vigil_tokens_ok.json", R"({"tokens":[
        {"token":"t-alice","principal":"alice"},
        {"token":"t-bob","principal":"bob"}]})");

    TokenFileAuthenticator auth(path);
    EXPECT_EQ(auth.size(), 2u);

    auto p = auth.authenticate("t-bob");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->id, "bob");
    std::filesystem::remove(path);
}

TEST(TokenFileAuthenticator, UnknownAndEmptyTokensAreRejected) {
    TokenFileAuthenticator auth(std::unordered_map<std::string, std::string>{{"t-alice", "alice"}});
    EXPECT_FALSE(auth.authenticate("t-mallory").has_value());
    EXPECT_FALSE(auth.authenticate("").has_value());
    EXPECT_TRUE(auth.authenticate("t-alice").has_value());
}

TEST(TokenFileAuthenticator, MissingFileThrows) {
    EXPECT_THROW(TokenFileAuthenticator("/nonexistent/tokens.json"), std::runtime_error);
}

TEST(TokenFileAuthenticator, MalformedFilesThrow) {
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"vigil_tokens_bad_json.json", "{ nope"},
        {"vigil_tokens_no_array.json", R"({"keys":[]})"},
        {"vigil_tokens_bad_entry.json", R"({"tokens":["just-a-string"]})"},
        {"vigil_tokens_no_principal.json", R"({"tokens":[{"token":"t"}]})"},
    };
    for (const auto& [name, content] : cases) {
        auto path = writeTemp(name, content);
        EXPECT_THROW(TokenFileAuthenticator{path}, std::runtime_error) << name;
        std::filesystem::remove(path);
    }
}
