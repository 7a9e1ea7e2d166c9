#include <gtest/gtest.h>

#include "adapters/secondary/AeadIdentityTokenCodec.hpp"
#include "utils/Base64.hpp"
#include "mocks/ScriptedRandomSource.hpp"
#include <cctype>

using namespace sessions;
using namespace sessions::tests::mocks;

class AeadIdentityTokenCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        random_ = std::make_shared<ScriptedRandomSource>();
        codec_ = std::make_shared<adapters::secondary::AeadIdentityTokenCodec>(
            std::string(32, 'k'), "identity-sessions", random_
        );
    }

    std::shared_ptr<adapters::secondary::AeadIdentityTokenCodec> makeCodec(
        const std::string& key,
        const std::string& context
    ) {
        return std::make_shared<adapters::secondary::AeadIdentityTokenCodec>(key, context, random_);
    }

    std::shared_ptr<ScriptedRandomSource> random_;
    std::shared_ptr<adapters::secondary::AeadIdentityTokenCodec> codec_;
};

// ============================================
// SEAL / OPEN
// ============================================

TEST_F(AeadIdentityTokenCodecTest, OpenReturnsSealedIdentity) {
    std::vector<std::string> identities = {"user-42", "a", "client@example.com", std::string(500, 'x')};
    for (const auto& identity : identities) {
        auto opened = codec_->open(codec_->seal(identity));

        ASSERT_TRUE(opened.has_value()) << identity;
        EXPECT_EQ(*opened, identity);
    }
}

TEST_F(AeadIdentityTokenCodecTest, TokenIsUnpaddedUrlSafeNonceCiphertextTag) {
    std::string token = codec_->seal("user-42");

    for (char c : token) {
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_')
            << "unexpected character: " << c;
    }

    auto raw = utils::base64UrlDecode(token);
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->size(),
              adapters::secondary::AeadIdentityTokenCodec::NONCE_SIZE + std::string("user-42").size() +
              adapters::secondary::AeadIdentityTokenCodec::TAG_SIZE);
}

TEST_F(AeadIdentityTokenCodecTest, SealUsesFreshNonceEveryCall) {
    EXPECT_NE(codec_->seal("user-42"), codec_->seal("user-42"));
}

TEST_F(AeadIdentityTokenCodecTest, SealUsesNonceFromRandomSource) {
    std::vector<uint8_t> nonce = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
    random_->script(nonce);

    auto raw = utils::base64UrlDecode(codec_->seal("user-42"));

    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->substr(0, 12), std::string(nonce.begin(), nonce.end()));
}

// ============================================
// FAIL-CLOSED OPEN
// ============================================

TEST_F(AeadIdentityTokenCodecTest, AnySingleByteChangeFailsToOpen) {
    auto raw = utils::base64UrlDecode(codec_->seal("user-42"));
    ASSERT_TRUE(raw.has_value());

    for (std::size_t i = 0; i < raw->size(); ++i) {
        std::string tampered = *raw;
        tampered[i] = static_cast<char>(tampered[i] ^ 0x01);

        EXPECT_FALSE(codec_->open(utils::base64UrlEncode(tampered)).has_value())
            << "byte " << i;
    }
}

TEST_F(AeadIdentityTokenCodecTest, WrongKeyFailsToOpen) {
    auto other = makeCodec(std::string(32, 'z'), "identity-sessions");

    EXPECT_FALSE(other->open(codec_->seal("user-42")).has_value());
}

TEST_F(AeadIdentityTokenCodecTest, WrongContextFailsToOpen) {
    auto other = makeCodec(std::string(32, 'k'), "another-application");

    EXPECT_FALSE(other->open(codec_->seal("user-42")).has_value());
}

TEST_F(AeadIdentityTokenCodecTest, TruncatedTokenFailsToOpen) {
    std::string token = codec_->seal("user-42");

    EXPECT_FALSE(codec_->open(token.substr(0, token.size() - 1)).has_value());
    EXPECT_FALSE(codec_->open(token.substr(0, token.size() - 4)).has_value());
    EXPECT_FALSE(codec_->open(token.substr(0, 20)).has_value());
}

TEST_F(AeadIdentityTokenCodecTest, MalformedTokenFailsToOpen) {
    EXPECT_FALSE(codec_->open("").has_value());
    EXPECT_FALSE(codec_->open("not a token!").has_value());
    EXPECT_FALSE(codec_->open(codec_->seal("user-42") + "=").has_value());
}

// ============================================
// DETERMINISTIC SEAL
// ============================================

TEST_F(AeadIdentityTokenCodecTest, SealDeterministic_SameInputsSameToken) {
    EXPECT_EQ(codec_->sealDeterministic("user-42", "identity-lookup"),
              codec_->sealDeterministic("user-42", "identity-lookup"));
}

TEST_F(AeadIdentityTokenCodecTest, SealDeterministic_DifferentInputsDifferentTokens) {
    auto base = codec_->sealDeterministic("user-42", "identity-lookup");

    EXPECT_NE(base, codec_->sealDeterministic("user-43", "identity-lookup"));
    EXPECT_NE(base, codec_->sealDeterministic("user-42", "public-id"));
}

TEST_F(AeadIdentityTokenCodecTest, SealDeterministic_KeyBoundaryIsUnambiguous) {
    EXPECT_NE(codec_->sealDeterministic("c", "ab"),
              codec_->sealDeterministic("bc", "a"));
}

TEST_F(AeadIdentityTokenCodecTest, SealDeterministic_OpensToIdentity) {
    auto opened = codec_->open(codec_->sealDeterministic("user-42", "identity-lookup"));

    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, "user-42");
}

TEST_F(AeadIdentityTokenCodecTest, SealDeterministic_DoesNotConsumeRandomness) {
    std::vector<uint8_t> nonce(12, 0x07);
    random_->script(nonce);

    codec_->sealDeterministic("user-42", "identity-lookup");
    auto raw = utils::base64UrlDecode(codec_->seal("user-42"));

    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->substr(0, 12), std::string(12, '\x07'));
}

// ============================================
// RESEAL
// ============================================

TEST_F(AeadIdentityTokenCodecTest, Reseal_NewCiphertextSameIdentity) {
    std::string token = codec_->seal("user-42");

    auto resealed = codec_->reseal(token);

    ASSERT_TRUE(resealed.has_value());
    EXPECT_NE(*resealed, token);
    auto opened = codec_->open(*resealed);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, "user-42");
}

TEST_F(AeadIdentityTokenCodecTest, Reseal_RejectsUnauthenticToken) {
    EXPECT_FALSE(codec_->reseal("garbage").has_value());
    EXPECT_FALSE(makeCodec(std::string(32, 'z'), "identity-sessions")
                     ->reseal(codec_->seal("user-42")).has_value());
}

// ============================================
// CONSTRUCTION
// ============================================

TEST_F(AeadIdentityTokenCodecTest, RejectsKeyOfWrongSize) {
    EXPECT_THROW(makeCodec(std::string(16, 'k'), "identity-sessions"), std::invalid_argument);
    EXPECT_THROW(makeCodec(std::string(33, 'k'), "identity-sessions"), std::invalid_argument);
}

TEST_F(AeadIdentityTokenCodecTest, RejectsMissingRandomSource) {
    EXPECT_THROW(
        adapters::secondary::AeadIdentityTokenCodec(std::string(32, 'k'), "identity-sessions", nullptr),
        std::invalid_argument
    );
}
