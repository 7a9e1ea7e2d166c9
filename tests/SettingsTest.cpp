#include <gtest/gtest.h>

#include "settings/DbSettings.hpp"
#include "settings/CodecSettings.hpp"
#include "settings/SessionSettings.hpp"
#include "utils/Base64.hpp"
#include <cstdlib>
#include <vector>

using namespace sessions;
using namespace std::chrono_literals;

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : variables_) {
            unsetenv(name);
        }
    }

    void TearDown() override {
        for (const char* name : variables_) {
            unsetenv(name);
        }
    }

    static std::string validKey() {
        return "base64:" + utils::base64Encode(std::string(32, '\x11'));
    }

    std::vector<const char*> variables_ = {
        "SESSION_DB_HOST", "SESSION_DB_PORT", "SESSION_DB_NAME", "SESSION_DB_USER",
        "SESSION_DB_PASSWORD", "SESSION_DB_CONNECT_TIMEOUT", "SESSION_ENCRYPTION_KEY", "SESSION_TOKEN_CONTEXT",
        "SESSION_LIFETIME", "SESSION_CODE_VALIDITY", "SESSION_DELEGATED_LIFETIME",
        "SESSION_SCOPES_FILE"
    };
};

// ============================================
// DB SETTINGS
// ============================================

TEST_F(SettingsTest, DbSettings_RequiresPassword) {
    EXPECT_THROW(settings::DbSettings(), std::runtime_error);
}

TEST_F(SettingsTest, DbSettings_BuildsConnectionString) {
    setenv("SESSION_DB_PASSWORD", "secret", 1);
    setenv("SESSION_DB_HOST", "db.internal", 1);
    setenv("SESSION_DB_PORT", "6432", 1);

    settings::DbSettings db;

    EXPECT_EQ(db.getHost(), "db.internal");
    EXPECT_EQ(db.getPort(), 6432);
    EXPECT_EQ(db.getConnectTimeout(), 5);
    EXPECT_EQ(db.getConnectionString(),
              "host=db.internal port=6432 dbname=sessions_db user=sessions_user password=secret"
              " connect_timeout=5 application_name=session-maintenance");
}

TEST_F(SettingsTest, DbSettings_RejectsMalformedPort) {
    setenv("SESSION_DB_PASSWORD", "secret", 1);

    for (const char* port : {"", "abc", "54x32", "-1", "0", "65536", "99999999999"}) {
        setenv("SESSION_DB_PORT", port, 1);
        EXPECT_THROW(settings::DbSettings(), std::runtime_error) << "port '" << port << "'";
    }

    setenv("SESSION_DB_PORT", "65535", 1);
    EXPECT_EQ(settings::DbSettings().getPort(), 65535);
}

TEST_F(SettingsTest, DbSettings_ConnectTimeoutFromEnvironment) {
    setenv("SESSION_DB_PASSWORD", "secret", 1);
    setenv("SESSION_DB_CONNECT_TIMEOUT", "12", 1);

    EXPECT_EQ(settings::DbSettings().getConnectTimeout(), 12);

    setenv("SESSION_DB_CONNECT_TIMEOUT", "301", 1);
    EXPECT_THROW(settings::DbSettings(), std::runtime_error);
}

// ============================================
// CODEC SETTINGS
// ============================================

TEST_F(SettingsTest, CodecSettings_RequiresKey) {
    EXPECT_THROW(settings::CodecSettings(), std::runtime_error);
}

TEST_F(SettingsTest, CodecSettings_ParsesKeyAndDefaultContext) {
    setenv("SESSION_ENCRYPTION_KEY", validKey().c_str(), 1);

    settings::CodecSettings codec;

    EXPECT_EQ(codec.getKey(), std::string(32, '\x11'));
    EXPECT_EQ(codec.getContext(), "identity-sessions");
}

TEST_F(SettingsTest, CodecSettings_ContextOverride) {
    setenv("SESSION_ENCRYPTION_KEY", validKey().c_str(), 1);
    setenv("SESSION_TOKEN_CONTEXT", "crm-gateway", 1);

    settings::CodecSettings codec;

    EXPECT_EQ(codec.getContext(), "crm-gateway");
}

TEST_F(SettingsTest, CodecSettings_RejectsMalformedKeys) {
    EXPECT_THROW(settings::CodecSettings::parseKey(utils::base64Encode(std::string(32, 'x'))),
                 std::runtime_error);
    EXPECT_THROW(settings::CodecSettings::parseKey("base64:" + utils::base64Encode(std::string(16, 'x'))),
                 std::runtime_error);
    EXPECT_THROW(settings::CodecSettings::parseKey("base64:***"), std::runtime_error);
    EXPECT_THROW(settings::CodecSettings::parseKey(""), std::runtime_error);
}

// ============================================
// SESSION SETTINGS
// ============================================

TEST_F(SettingsTest, SessionSettings_Defaults) {
    settings::SessionSettings session;

    EXPECT_EQ(session.getSessionLifetime(), 1800s);
    EXPECT_EQ(session.getCodeValidity(), 300s);
    EXPECT_EQ(session.getDelegatedLifetime(), 1800s);
    EXPECT_EQ(session.getScopesFile(), "config/scopes.json");
}

TEST_F(SettingsTest, SessionSettings_FromEnvironment) {
    setenv("SESSION_LIFETIME", "600", 1);
    setenv("SESSION_CODE_VALIDITY", "120", 1);
    setenv("SESSION_DELEGATED_LIFETIME", "900", 1);
    setenv("SESSION_SCOPES_FILE", "/etc/sessions/scopes.json", 1);

    settings::SessionSettings session;

    EXPECT_EQ(session.getSessionLifetime(), 600s);
    EXPECT_EQ(session.getCodeValidity(), 120s);
    EXPECT_EQ(session.getDelegatedLifetime(), 900s);
    EXPECT_EQ(session.getScopesFile(), "/etc/sessions/scopes.json");
}
