#include <gtest/gtest.h>

#include "core/Gateway.hpp"
#include "mocks/InMemorySessionStore.hpp"

using namespace sessiongate::tests::mocks;

constexpr const char* TEST_ORIGIN = "https://app.example.com";

// ============================================
// FIXTURE
// ============================================

class GatewayTest : public ::testing::Test {
  protected:
    void SetUp() override {
        store_ = std::make_shared<InMemorySessionStore>();
        store_->addToken("good-token");
    }

    CGateway makeGateway(SCookieConfig cookie = {}) {
        return CGateway(CGateway::SGatewaySettings{.cookie = cookie, .origins = COriginPolicy{}, .preflightMaxAge = 600}, store_);
    }

    static SGatewayRequest post(const std::string& body) {
        SGatewayRequest req;
        req.method     = GATEWAY_METHOD_POST;
        req.methodName = "POST";
        req.origin     = TEST_ORIGIN;
        req.body       = body;
        req.ip         = "203.0.113.7";
        return req;
    }

    static SGatewayRequest withMethod(eGatewayMethod method, const std::string& name) {
        SGatewayRequest req;
        req.method     = method;
        req.methodName = name;
        req.origin     = TEST_ORIGIN;
        return req;
    }

    static void expectCors(const SGatewayResponse& res) {
        ASSERT_TRUE(res.allowOrigin.has_value());
        EXPECT_EQ(*res.allowOrigin, TEST_ORIGIN);
        EXPECT_TRUE(res.allowCredentials);
        EXPECT_TRUE(res.varyOrigin);
    }

    std::shared_ptr<InMemorySessionStore> store_;
};

// ============================================
// ISSUING
// ============================================

TEST_F(GatewayTest, ValidTokenIssuesCookie) {
    const auto GATEWAY = makeGateway();

    const auto RES = GATEWAY.handle(post(R"({"token":"good-token"})"));

    EXPECT_EQ(RES.code, 200);
    EXPECT_EQ(RES.outcome, GATEWAY_OUTCOME_ISSUED);
    EXPECT_EQ(RES.body, R"({"success":true})");
    EXPECT_TRUE(RES.json);
    ASSERT_TRUE(RES.setCookie.has_value());
    EXPECT_EQ(*RES.setCookie, "echo_session=good-token; Path=/; Max-Age=2592000; HttpOnly; SameSite=Lax; Secure");
    expectCors(RES);
}

TEST_F(GatewayTest, CookieFollowsDeploymentConfig) {
    SCookieConfig cookie;
    cookie.domain = "example.com";
    cookie.secure = false;

    const auto RES = makeGateway(cookie).handle(post(R"({"token":"good-token"})"));

    ASSERT_TRUE(RES.setCookie.has_value());
    EXPECT_EQ(*RES.setCookie, "echo_session=good-token; Path=/; Max-Age=2592000; HttpOnly; SameSite=Lax; Domain=example.com");
}

TEST_F(GatewayTest, UnknownFieldsAreIgnored) {
    const auto RES = makeGateway().handle(post(R"({"token":"good-token","remember":true,"device":{"id":1}})"));

    EXPECT_EQ(RES.code, 200);
}

// ============================================
// DENYING
// ============================================

TEST_F(GatewayTest, InvalidTokenIsGeneric401) {
    const auto RES = makeGateway().handle(post(R"({"token":"bad-token"})"));

    EXPECT_EQ(RES.code, 401);
    EXPECT_EQ(RES.outcome, GATEWAY_OUTCOME_DENIED);
    EXPECT_FALSE(RES.setCookie.has_value());
    EXPECT_EQ(RES.body, R"({"error":"Invalid session token"})");
    EXPECT_EQ(RES.body.find("expired"), std::string::npos);
    EXPECT_EQ(RES.body.find("revoked"), std::string::npos);
    expectCors(RES);
}

TEST_F(GatewayTest, RevokedTokenLooksLikeUnknownToken) {
    store_->addToken("revoked-token", false);
    const auto GATEWAY = makeGateway();

    EXPECT_EQ(GATEWAY.handle(post(R"({"token":"revoked-token"})")).body, GATEWAY.handle(post(R"({"token":"never-seen"})")).body);
}

TEST_F(GatewayTest, StoreFailureIs503WithoutDetail) {
    CGateway   gateway(CGateway::SGatewaySettings{}, std::make_shared<FailingSessionStore>());

    const auto RES = gateway.handle(post(R"({"token":"good-token"})"));

    EXPECT_EQ(RES.code, 503);
    EXPECT_EQ(RES.outcome, GATEWAY_OUTCOME_STORE_UNAVAILABLE);
    EXPECT_FALSE(RES.setCookie.has_value());
    EXPECT_EQ(RES.body, R"({"error":"Internal server error"})");
    EXPECT_EQ(RES.body.find("5432"), std::string::npos);
}

TEST_F(GatewayTest, MissingStoreIsConfigurationError) {
    CGateway   gateway(CGateway::SGatewaySettings{}, nullptr);

    const auto RES = gateway.handle(post(R"({"token":"good-token"})"));

    EXPECT_EQ(RES.code, 500);
    EXPECT_EQ(RES.outcome, GATEWAY_OUTCOME_MISCONFIGURED);
    EXPECT_EQ(RES.body, R"({"error":"Server configuration error"})");
}

// ============================================
// INPUT ERRORS
// ============================================

TEST_F(GatewayTest, MalformedBodiesAre400WithoutStoreQuery) {
    const auto GATEWAY = makeGateway();

    for (const auto& body : {R"({"token":42})", R"({"token":true})", R"({"token":["good-token"]})", R"(not json)", R"(["good-token"])", R"("good-token")",
                             R"({"token":"good-token")", R"({"token":"good-token"}garbage)", R"({"token":"good-token"}{"x":1})"}) {
        const auto RES = GATEWAY.handle(post(body));
        EXPECT_EQ(RES.code, 400) << body;
        EXPECT_EQ(RES.outcome, GATEWAY_OUTCOME_BAD_REQUEST) << body;
        EXPECT_EQ(RES.body, R"({"error":"Invalid request body"})") << body;
        EXPECT_FALSE(RES.setCookie.has_value());
    }

    EXPECT_EQ(store_->lookups(), 0u);
}

TEST_F(GatewayTest, TrailingWhitespaceIsAccepted) {
    EXPECT_EQ(makeGateway().handle(post("{\"token\":\"good-token\"}\r\n  ")).code, 200);
}

TEST_F(GatewayTest, MissingTokenIs400WithoutStoreQuery) {
    const auto GATEWAY = makeGateway();

    for (const auto& body : {"", "{}", R"({"token":null})", R"({"token":""})", R"({"other":"good-token"})"}) {
        const auto RES = GATEWAY.handle(post(body));
        EXPECT_EQ(RES.code, 400) << body;
        EXPECT_EQ(RES.body, R"({"error":"Token required"})") << body;
        expectCors(RES);
    }

    EXPECT_EQ(store_->lookups(), 0u);
}

// ============================================
// METHODS & CORS
// ============================================

TEST_F(GatewayTest, PreflightEchoesOrigin) {
    const auto RES = makeGateway().handle(withMethod(GATEWAY_METHOD_OPTIONS, "OPTIONS"));

    EXPECT_EQ(RES.code, 204);
    EXPECT_EQ(RES.outcome, GATEWAY_OUTCOME_PREFLIGHT);
    EXPECT_TRUE(RES.body.empty());
    EXPECT_FALSE(RES.json);
    expectCors(RES);
    EXPECT_NE(*RES.allowOrigin, "*");
    EXPECT_EQ(RES.allowMethods, "POST, OPTIONS");
    EXPECT_EQ(RES.allowHeaders, "Content-Type, Authorization");
    EXPECT_EQ(RES.maxAge, 600);
    EXPECT_EQ(store_->lookups(), 0u);
}

TEST_F(GatewayTest, OtherMethodsAre405) {
    const auto GATEWAY = makeGateway();

    for (const auto& [method, name] : std::vector<std::pair<eGatewayMethod, std::string>>{{GATEWAY_METHOD_GET, "GET"}, {GATEWAY_METHOD_OTHER, "DELETE"}}) {
        const auto RES = GATEWAY.handle(withMethod(method, name));
        EXPECT_EQ(RES.code, 405) << name;
        EXPECT_EQ(RES.allow, (std::vector<eGatewayMethod>{GATEWAY_METHOD_POST, GATEWAY_METHOD_OPTIONS}));
        EXPECT_EQ(RES.body, R"({"error":"Method not allowed"})");
        expectCors(RES);
    }
}

TEST_F(GatewayTest, NoOriginMeansNoAllowOrigin) {
    auto req = post(R"({"token":"good-token"})");
    req.origin.reset();

    const auto RES = makeGateway().handle(req);

    EXPECT_EQ(RES.code, 200);
    EXPECT_FALSE(RES.allowOrigin.has_value());
    EXPECT_TRUE(RES.allowCredentials);
}

TEST_F(GatewayTest, DisallowedOriginIsNotEchoed) {
    CGateway gateway(CGateway::SGatewaySettings{.origins = COriginPolicy({std::make_shared<re2::RE2>(R"(https://app\.example\.com)")})}, store_);

    auto     req = post(R"({"token":"good-token"})");
    req.origin   = "https://evil.example.net";

    const auto RES = gateway.handle(req);

    EXPECT_FALSE(RES.allowOrigin.has_value());
}

// ============================================
// FAILURE CONTAINMENT
// ============================================

TEST_F(GatewayTest, ThrowingStoreNeverLeaksTheException) {
    CGateway   gateway(CGateway::SGatewaySettings{}, std::make_shared<ThrowingSessionStore>());

    const auto RES = gateway.handle(post(R"({"token":"good-token"})"));

    EXPECT_EQ(RES.code, 503);
    EXPECT_EQ(RES.body.find("exploded"), std::string::npos);
}

TEST(GatewayOutcomeTest, OutcomeNames) {
    EXPECT_STREQ(gatewayOutcomeToString(GATEWAY_OUTCOME_ISSUED), "ISSUED");
    EXPECT_STREQ(gatewayOutcomeToString(GATEWAY_OUTCOME_DENIED), "DENIED");
    EXPECT_STREQ(gatewayOutcomeToString(GATEWAY_OUTCOME_STORE_UNAVAILABLE), "STORE_UNAVAILABLE");
}
