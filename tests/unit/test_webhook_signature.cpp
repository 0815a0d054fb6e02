/**
 * @file test_webhook_signature.cpp
 * @brief Unit tests for HMAC-SHA256 webhook signatures
 */

#include <gtest/gtest.h>

#include "taskcore/webhook/domain/model/WebhookSignature.hpp"

using taskcore::webhook::domain::model::WebhookSignature;

TEST(WebhookSignatureTest, Sign_MatchesKnownVector) {
    // RFC 4231 test case 2
    EXPECT_EQ(WebhookSignature::sign("Jefe", "what do ya want for nothing?"),
              "sha256=5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(WebhookSignatureTest, Verify_AcceptsOwnSignatureOnly) {
    const std::string secret = WebhookSignature::generateSecret();
    const std::string body = R"({"eventId":"e-1"})";
    const std::string signature = WebhookSignature::sign(secret, body);

    EXPECT_TRUE(WebhookSignature::verify(secret, body, signature));
    EXPECT_FALSE(WebhookSignature::verify(secret, body + " ", signature));
    EXPECT_FALSE(WebhookSignature::verify("another-secret-value", body, signature));
    EXPECT_FALSE(WebhookSignature::verify(secret, body, signature.substr(0, 20)));
}

TEST(WebhookSignatureTest, SignPayload_IndependentOfKeyInsertionOrder) {
    Json::Value first(Json::objectValue);
    first["b"] = 2;
    first["a"] = 1;
    Json::Value second(Json::objectValue);
    second["a"] = 1;
    second["b"] = 2;

    EXPECT_EQ(WebhookSignature::signPayload("secret-0123456789", first),
              WebhookSignature::signPayload("secret-0123456789", second));
}

TEST(WebhookSignatureTest, GenerateSecret_IsRandomHex) {
    const std::string first = WebhookSignature::generateSecret();
    const std::string second = WebhookSignature::generateSecret();

    EXPECT_EQ(first.size(), 64u);
    EXPECT_NE(first, second);
    EXPECT_EQ(first.find_first_not_of("0123456789abcdef"), std::string::npos);
}
