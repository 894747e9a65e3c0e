#include <gtest/gtest.h>

#include "core/Handler.hpp"
#include "headers/originHeader.hpp"
#include "mocks/InMemorySessionStore.hpp"

#include <chrono>
#include <memory>
#include <optional>

#include <fmt/format.h>
#include <pistache/client.h>
#include <pistache/endpoint.h>
#include <pistache/http.h>
#include <pistache/net.h>

using namespace sessiongate::tests::mocks;

constexpr const char* TEST_ORIGIN = "https://app.example.com";

struct SClientResult {
    int                        code = 0;
    std::string                body;

    std::optional<std::string> allowOrigin;
    std::string                allowCredentials;
    std::string                vary;
    std::string                maxAge;
    bool                       hasAllow = false;

    bool                       hasSessionCookie = false;
    std::string                cookieValue;
    std::string                cookiePath;
    int                        cookieMaxAge   = 0;
    bool                       cookieHttpOnly = false;
    bool                       cookieSecure   = false;
};

static std::string rawHeader(const Pistache::Http::Response& response, const std::string& name) {
    try {
        return response.headers().getRaw(name).value();
    } catch (std::exception& e) { return ""; }
}

class ServerHandlerTest : public ::testing::TestWithParam<bool> {
  protected:
    void SetUp() override {
        if (!Pistache::Http::Header::Registry::instance().isRegistered(OriginHeader::Name))
            Pistache::Http::Header::Registry::instance().registerHeader<OriginHeader>();

        store_ = std::make_shared<InMemorySessionStore>();
        store_->addToken("good-token");

        auto gateway = std::make_shared<const CGateway>(CGateway::SGatewaySettings{}, store_);

        endpoint_    = std::make_unique<Pistache::Http::Endpoint>(Pistache::Address(Pistache::Ipv4::loopback(), Pistache::Port(0)));
        endpoint_->init(Pistache::Http::Endpoint::options().threads(1).flags(Pistache::Tcp::Options::ReuseAddr));
        endpoint_->setHandler(Pistache::Http::make_handler<CServerHandler>(gateway, GetParam()));
        endpoint_->serveThreaded();
    }

    void TearDown() override {
        endpoint_->shutdown();
    }

    SClientResult call(Pistache::Http::Method method, const std::string& body, const std::optional<std::string>& origin = std::nullopt) {
        SClientResult                        result;

        Pistache::Http::Experimental::Client client;
        client.init(Pistache::Http::Experimental::Client::options().threads(1));

        auto builder = client.prepareRequest(fmt::format("http://127.0.0.1:{}/", static_cast<uint16_t>(endpoint_->getPort())), method);
        builder.body(body);
        builder.header<Pistache::Http::Header::ContentType>(Pistache::Http::Mime::MediaType("application/json"));
        if (origin.has_value())
            builder.header<OriginHeader>(*origin);
        builder.timeout(std::chrono::seconds(5));

        auto resp = builder.send();
        resp.then(
            [&result](Pistache::Http::Response response) {
                result.code = static_cast<int>(response.code());
                result.body = response.body();

                if (const auto ALLOW_ORIGIN = response.headers().tryGet<Pistache::Http::Header::AccessControlAllowOrigin>(); ALLOW_ORIGIN)
                    result.allowOrigin = ALLOW_ORIGIN->uri();
                result.allowCredentials = rawHeader(response, "Access-Control-Allow-Credentials");
                result.vary             = rawHeader(response, "Vary");
                result.maxAge           = rawHeader(response, "Access-Control-Max-Age");
                result.hasAllow         = response.headers().has<Pistache::Http::Header::Allow>();

                result.hasSessionCookie = response.cookies().has("echo_session");
                if (result.hasSessionCookie) {
                    const auto& COOKIE    = response.cookies().get("echo_session");
                    result.cookieValue    = COOKIE.value;
                    result.cookiePath     = COOKIE.path.value_or("");
                    result.cookieMaxAge   = COOKIE.maxAge.value_or(0);
                    result.cookieHttpOnly = COOKIE.httpOnly;
                    result.cookieSecure   = COOKIE.secure;
                }
            },
            [](std::exception_ptr e) { ADD_FAILURE() << "request failed"; });

        Pistache::Async::Barrier<Pistache::Http::Response> b(resp);
        b.wait_for(std::chrono::seconds(6));

        client.shutdown();
        return result;
    }

    std::shared_ptr<InMemorySessionStore>     store_;
    std::unique_ptr<Pistache::Http::Endpoint> endpoint_;
};

TEST_P(ServerHandlerTest, ValidTokenSetsCookieOverHttp) {
    const auto RESULT = call(Pistache::Http::Method::Post, R"({"token":"good-token"})", TEST_ORIGIN);

    EXPECT_EQ(RESULT.code, 200);
    EXPECT_EQ(RESULT.body, R"({"success":true})");

    ASSERT_TRUE(RESULT.hasSessionCookie);
    EXPECT_EQ(RESULT.cookieValue, "good-token");
    EXPECT_EQ(RESULT.cookiePath, "/");
    EXPECT_EQ(RESULT.cookieMaxAge, 2592000);
    EXPECT_TRUE(RESULT.cookieHttpOnly);
    EXPECT_TRUE(RESULT.cookieSecure);

    ASSERT_TRUE(RESULT.allowOrigin.has_value());
    EXPECT_EQ(*RESULT.allowOrigin, TEST_ORIGIN);
    EXPECT_EQ(RESULT.allowCredentials, "true");
    EXPECT_EQ(RESULT.vary, "Origin");
}

TEST_P(ServerHandlerTest, PreflightOverHttp) {
    const auto RESULT = call(Pistache::Http::Method::Options, "", TEST_ORIGIN);

    EXPECT_EQ(RESULT.code, 204);
    ASSERT_TRUE(RESULT.allowOrigin.has_value());
    EXPECT_EQ(*RESULT.allowOrigin, TEST_ORIGIN);
    EXPECT_EQ(RESULT.allowCredentials, "true");
    EXPECT_EQ(RESULT.vary, "Origin");
    EXPECT_EQ(RESULT.maxAge, "600");
    EXPECT_FALSE(RESULT.hasSessionCookie);
    EXPECT_EQ(store_->lookups(), 0u);
}

TEST_P(ServerHandlerTest, InvalidTokenIsRejectedOverHttp) {
    const auto RESULT = call(Pistache::Http::Method::Post, R"({"token":"bad-token"})");

    EXPECT_EQ(RESULT.code, 401);
    EXPECT_EQ(RESULT.body, R"({"error":"Invalid session token"})");
    EXPECT_FALSE(RESULT.hasSessionCookie);
    EXPECT_FALSE(RESULT.allowOrigin.has_value());
    EXPECT_EQ(RESULT.allowCredentials, "true");
}

TEST_P(ServerHandlerTest, TrailingGarbageIsRejectedOverHttp) {
    const auto RESULT = call(Pistache::Http::Method::Post, R"({"token":"good-token"}garbage)");

    EXPECT_EQ(RESULT.code, 400);
    EXPECT_FALSE(RESULT.hasSessionCookie);
    EXPECT_EQ(store_->lookups(), 0u);
}

TEST_P(ServerHandlerTest, GetIsNotAllowedOverHttp) {
    const auto RESULT = call(Pistache::Http::Method::Get, "");

    EXPECT_EQ(RESULT.code, 405);
    EXPECT_TRUE(RESULT.hasAllow);
    EXPECT_EQ(store_->lookups(), 0u);
}

INSTANTIATE_TEST_SUITE_P(SyncAndAsync, ServerHandlerTest, ::testing::Bool());
