#include <gtest/gtest.h>

#include "adapters/secondary/JsonScopeRegistry.hpp"
#include <fstream>
#include <cstdio>

using namespace sessions;

class JsonScopeRegistryTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& path : written_) {
            std::remove(path.c_str());
        }
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        std::string path = ::testing::TempDir() + name;
        std::ofstream out(path);
        out << content;
        written_.push_back(path);
        return path;
    }

    std::vector<std::string> written_;
};

TEST_F(JsonScopeRegistryTest, LoadsScopesWithNames) {
    auto path = writeFile("scopes_ok.json", R"({
        "scopes": [
            {"key": "k-portal", "name": "Portal"},
            {"key": "k-shop"}
        ]
    })");

    adapters::secondary::JsonScopeRegistry registry(path);

    EXPECT_TRUE(registry.isKnownScope("k-portal"));
    EXPECT_TRUE(registry.isKnownScope("k-shop"));
    EXPECT_FALSE(registry.isKnownScope("k-unknown"));
    EXPECT_EQ(registry.getScopeName("k-portal").value_or(""), "Portal");
    EXPECT_EQ(registry.getScopeName("k-shop").value_or(""), "k-shop");
    EXPECT_FALSE(registry.getScopeName("k-unknown").has_value());
}

TEST_F(JsonScopeRegistryTest, LoadsBundledSampleConfig) {
    adapters::secondary::JsonScopeRegistry registry(
        std::string(IDENTITY_SESSIONS_TEST_DATA_DIR) + "/scopes.json");

    EXPECT_TRUE(registry.isKnownScope("replace-with-portal-api-key"));
    EXPECT_EQ(registry.getScopeName("replace-with-shop-api-key").value_or(""), "Shop");
}

TEST_F(JsonScopeRegistryTest, MissingFileThrows) {
    EXPECT_THROW(adapters::secondary::JsonScopeRegistry(::testing::TempDir() + "no_such_scopes.json"),
                 std::runtime_error);
}

TEST_F(JsonScopeRegistryTest, MalformedJsonThrows) {
    auto path = writeFile("scopes_broken.json", R"({"scopes": [ )");

    EXPECT_THROW(adapters::secondary::JsonScopeRegistry{path}, std::runtime_error);
}

TEST_F(JsonScopeRegistryTest, WrongShapeThrows) {
    auto noScopes = writeFile("scopes_empty_object.json", R"({})");
    auto notArray = writeFile("scopes_not_array.json", R"({"scopes": {"key": "k"}})");
    auto emptyKey = writeFile("scopes_empty_key.json", R"({"scopes": [{"key": ""}]})");

    EXPECT_THROW(adapters::secondary::JsonScopeRegistry{noScopes}, std::runtime_error);
    EXPECT_THROW(adapters::secondary::JsonScopeRegistry{notArray}, std::runtime_error);
    EXPECT_THROW(adapters::secondary::JsonScopeRegistry{emptyKey}, std::runtime_error);
}
