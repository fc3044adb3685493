#include <gtest/gtest.h>

#include "adapters/primary/CreateOrGetAccountHandler.hpp"
#include "adapters/primary/IssueTokenHandler.hpp"
#include "adapters/primary/ValidateTokenHandler.hpp"
#include "adapters/primary/SleepSessionHandler.hpp"
#include "adapters/primary/AuthInterceptorMiddleware.hpp"
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"

#include "application/IdentityIssuer.hpp"
#include "application/TokenService.hpp"
#include "application/AuthInterceptor.hpp"
#include "application/SleepSessionService.hpp"
#include "application/MetricsService.hpp"
#include "adapters/secondary/HmacJwtAdapter.hpp"

#include "mocks/InMemoryAccountRepository.hpp"
#include "mocks/InMemorySleepSessionRepository.hpp"
#include "mocks/StaticSigningKeyStore.hpp"
#include "mocks/FakeClock.hpp"

#include "SimpleRequest.hpp"
#include "SimpleResponse.hpp"

#include <nlohmann/json.hpp>
#include <cstdlib>

using namespace identity;
using namespace identity::tests::mocks;
using namespace identity::adapters::primary;

// ============================================
// TEST FIXTURE
// ============================================

class IdentityEndpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("IDENTITY_ENVIRONMENT");
        unsetenv("IDENTITY_ALLOW_DEV_ACCOUNT_HEADER");
        unsetenv("IDENTITY_TOKEN_TTL_SECONDS");
        unsetenv("IDENTITY_TOKEN_CLOCK_SKEW_SECONDS");

        accountRepo_ = std::make_shared<InMemoryAccountRepository>();
        sessionRepo_ = std::make_shared<InMemorySleepSessionRepository>();
        clock_ = std::make_shared<FakeClock>();
        metrics_ = std::make_shared<application::MetricsService>(std::make_shared<settings::MetricsSettings>());

        issuer_ = std::make_shared<application::IdentityIssuer>(accountRepo_, clock_, metrics_);
        tokenService_ = std::make_shared<application::TokenService>(
            std::make_shared<settings::TokenSettings>(),
            accountRepo_,
            std::make_shared<adapters::secondary::HmacJwtAdapter>(std::make_shared<StaticSigningKeyStore>()),
            clock_,
            metrics_);
        interceptor_ = std::make_shared<application::AuthInterceptor>(
            tokenService_, std::make_shared<settings::InterceptorSettings>(), metrics_);
        sleepService_ = std::make_shared<application::SleepSessionService>(sessionRepo_);

        sleepChain_ = std::make_shared<ChainHandler>(
            std::make_shared<AuthInterceptorMiddleware>(interceptor_),
            std::make_shared<SleepSessionHandler>(sleepService_));
    }

    void TearDown() override {
        accountRepo_->clear();
        sessionRepo_->clear();
    }

    static SimpleRequest post(const std::string& path, const std::string& body) {
        return SimpleRequest("POST", path, body, "127.0.0.1", 8080);
    }

    static nlohmann::json parse(const SimpleResponse& res) {
        return nlohmann::json::parse(res.getBody());
    }

    // device fingerprint -> (accountId, access_token)
    std::pair<std::string, std::string> login(const std::string& fingerprint) {
        IssueTokenHandler handler(issuer_, tokenService_);
        auto req = post("/api/v1/auth/token", nlohmann::json{{"device_fingerprint", fingerprint}}.dump());
        SimpleResponse res;
        handler.handle(req, res);
        auto json = parse(res);
        return {json["account_id"].get<std::string>(), json["access_token"].get<std::string>()};
    }

    SimpleResponse callSleep(const std::string& method, const std::string& authorization,
                             const std::string& body = "") {
        SimpleRequest req(method, "/api/v1/sleep/sessions", body, "127.0.0.1", 8080);
        if (!authorization.empty()) {
            req.setHeader("Authorization", authorization);
        }
        SimpleResponse res;
        sleepChain_->handle(req, res);
        return res;
    }

    static std::string nightBody(const std::string& extra = "") {
        std::string body = R"({"started_at": "2026-10-17T23:00:00Z", "ended_at": "2026-10-18T07:00:00Z", "quality": 75)";
        return body + extra + "}";
    }

    std::shared_ptr<InMemoryAccountRepository> accountRepo_;
    std::shared_ptr<InMemorySleepSessionRepository> sessionRepo_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<application::MetricsService> metrics_;
    std::shared_ptr<application::IdentityIssuer> issuer_;
    std::shared_ptr<application::TokenService> tokenService_;
    std::shared_ptr<application::AuthInterceptor> interceptor_;
    std::shared_ptr<application::SleepSessionService> sleepService_;
    std::shared_ptr<ChainHandler> sleepChain_;
};

// ============================================
// ACCOUNTS
// ============================================

TEST_F(IdentityEndpointTest, CreateAccount_Returns201ThenSameId200) {
    CreateOrGetAccountHandler handler(issuer_);

    auto req1 = post("/api/v1/identity/accounts", R"({"device_fingerprint": "device-A"})");
    SimpleResponse res1;
    handler.handle(req1, res1);

    auto req2 = post("/api/v1/identity/accounts", R"({"device_fingerprint": "device-A"})");
    SimpleResponse res2;
    handler.handle(req2, res2);

    EXPECT_EQ(res1.getStatus(), 201);
    EXPECT_EQ(res2.getStatus(), 200);
    EXPECT_TRUE(parse(res1)["created"].get<bool>());
    EXPECT_FALSE(parse(res2)["created"].get<bool>());
    EXPECT_EQ(parse(res1)["account_id"], parse(res2)["account_id"]);
}

TEST_F(IdentityEndpointTest, CreateAccount_MissingFingerprint_Returns400) {
    CreateOrGetAccountHandler handler(issuer_);
    auto req = post("/api/v1/identity/accounts", R"({"fingerprint": "device-A"})");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parse(res)["error"], "INVALID_ARGUMENT");
    EXPECT_EQ(res.getHeader("grpc-status").value_or(""), "3");
}

TEST_F(IdentityEndpointTest, CreateAccount_InvalidJson_Returns400) {
    CreateOrGetAccountHandler handler(issuer_);
    auto req = post("/api/v1/identity/accounts", "{not json");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(IdentityEndpointTest, CreateAccount_StorageDown_Returns503) {
    accountRepo_->setFailure(InMemoryAccountRepository::Failure::UNAVAILABLE);
    CreateOrGetAccountHandler handler(issuer_);
    auto req = post("/api/v1/identity/accounts", R"({"device_fingerprint": "device-A"})");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 503);
    EXPECT_EQ(parse(res)["error"], "UNAVAILABLE");
}

TEST_F(IdentityEndpointTest, CreateAccount_StorageTimeout_Returns504) {
    accountRepo_->setFailure(InMemoryAccountRepository::Failure::TIMEOUT);
    CreateOrGetAccountHandler handler(issuer_);
    auto req = post("/api/v1/identity/accounts", R"({"device_fingerprint": "device-A"})");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 504);
    EXPECT_EQ(res.getHeader("grpc-status").value_or(""), "4");
}

// ============================================
// TOKENS
// ============================================

TEST_F(IdentityEndpointTest, IssueToken_ReturnsBearerToken) {
    IssueTokenHandler handler(issuer_, tokenService_);
    auto req = post("/api/v1/auth/token", R"({"device_fingerprint": "device-A"})");
    SimpleResponse res;

    handler.handle(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    auto json = parse(res);
    EXPECT_EQ(json["token_type"], "Bearer");
    EXPECT_EQ(json["expires_in"].get<int64_t>(), 1800);
    EXPECT_FALSE(json["access_token"].get<std::string>().empty());
    EXPECT_EQ(res.getHeader("Cache-Control").value_or(""), "no-store");
}

TEST_F(IdentityEndpointTest, IssueToken_SameDeviceSameAccount) {
    auto first = login("device-A");
    auto second = login("device-A");

    EXPECT_EQ(first.first, second.first);
    EXPECT_EQ(accountRepo_->size(), 1u);
}

TEST_F(IdentityEndpointTest, IssueToken_IgnoresAccountIdInBody) {
    IssueTokenHandler handler(issuer_, tokenService_);
    auto req = post("/api/v1/auth/token", R"({"device_fingerprint": "device-A", "account_id": "acc-victim"})");
    SimpleResponse res;

    handler.handle(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    EXPECT_NE(parse(res)["account_id"], "acc-victim");
}

TEST_F(IdentityEndpointTest, ValidateToken_ValidAndExpired) {
    auto [accountId, token] = login("device-A");
    ValidateTokenHandler handler(tokenService_);

    auto req = post("/api/v1/auth/validate", nlohmann::json{{"token", token}}.dump());
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_TRUE(parse(res)["valid"].get<bool>());
    EXPECT_EQ(parse(res)["account_id"], accountId);

    clock_->advance(std::chrono::seconds(1800));
    auto req2 = post("/api/v1/auth/validate", nlohmann::json{{"token", token}}.dump());
    SimpleResponse res2;
    handler.handle(req2, res2);

    EXPECT_EQ(res2.getStatus(), 200);
    EXPECT_FALSE(parse(res2)["valid"].get<bool>());
    EXPECT_EQ(parse(res2)["error"], "UNAUTHENTICATED");
    EXPECT_EQ(parse(res2)["message"], "Token expired");
}

TEST_F(IdentityEndpointTest, ValidateToken_MissingToken_Returns400) {
    ValidateTokenHandler handler(tokenService_);
    auto req = post("/api/v1/auth/validate", "{}");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================
// USER DATA BEHIND THE INTERCEPTOR
// ============================================

TEST_F(IdentityEndpointTest, SleepSessions_RecordAndListForCaller) {
    auto [accountId, token] = login("device-A");

    auto created = callSleep("POST", "Bearer " + token, nightBody(R"(, "notes": "good night")"));
    ASSERT_EQ(created.getStatus(), 201);
    EXPECT_EQ(parse(created)["account_id"], accountId);
    EXPECT_EQ(parse(created)["duration_minutes"].get<int64_t>(), 480);

    auto listed = callSleep("GET", "Bearer " + token);
    ASSERT_EQ(listed.getStatus(), 200);
    auto json = parse(listed);
    EXPECT_EQ(json["account_id"], accountId);
    ASSERT_EQ(json["sessions"].size(), 1u);
    EXPECT_EQ(json["sessions"][0]["notes"], "good night");
    EXPECT_EQ(json["sessions"][0]["started_at"], "2026-10-17T23:00:00Z");
}

TEST_F(IdentityEndpointTest, SleepSessions_BodyAccountIdIsIgnored) {
    auto [accountA, tokenA] = login("device-A");
    auto [accountB, tokenB] = login("device-B");

    auto res = callSleep("POST", "Bearer " + tokenA,
                         nightBody(R"(, "account_id": ")" + accountB + R"(", "user_id": ")" + accountB + "\""));

    ASSERT_EQ(res.getStatus(), 201);
    auto stored = sessionRepo_->all();
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].accountId, accountA);
    EXPECT_TRUE(sessionRepo_->findByAccountId(accountB).empty());
}

TEST_F(IdentityEndpointTest, SleepSessions_OtherAccountDataInvisible) {
    auto [accountA, tokenA] = login("device-A");
    auto [accountB, tokenB] = login("device-B");
    callSleep("POST", "Bearer " + tokenA, nightBody());

    auto res = callSleep("GET", "Bearer " + tokenB);

    ASSERT_EQ(res.getStatus(), 200);
    EXPECT_TRUE(parse(res)["sessions"].empty());
}

TEST_F(IdentityEndpointTest, SleepSessions_NoCredential_Returns401AndStoresNothing) {
    auto res = callSleep("POST", "", nightBody());

    EXPECT_EQ(res.getStatus(), 401);
    EXPECT_EQ(parse(res)["error"], "UNAUTHENTICATED");
    EXPECT_EQ(res.getHeader("grpc-status").value_or(""), "16");
    EXPECT_EQ(sessionRepo_->size(), 0u);
}

TEST_F(IdentityEndpointTest, SleepSessions_ExpiredToken_Returns401) {
    auto [accountId, token] = login("device-A");
    clock_->advance(std::chrono::seconds(1800));

    auto res = callSleep("POST", "Bearer " + token, nightBody());

    EXPECT_EQ(res.getStatus(), 401);
    EXPECT_EQ(sessionRepo_->size(), 0u);
}

TEST_F(IdentityEndpointTest, SleepSessions_DevHeaderIgnoredInProduction) {
    SimpleRequest req("GET", "/api/v1/sleep/sessions", "", "127.0.0.1", 8080);
    req.setHeader("x-dev-account-id-insecure", "acc-A");
    SimpleResponse res;

    sleepChain_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
}

TEST_F(IdentityEndpointTest, SleepSessions_InvalidPayload_Returns400) {
    auto [accountId, token] = login("device-A");

    auto badTime = callSleep("POST", "Bearer " + token,
                             R"({"started_at": "yesterday", "ended_at": "2026-10-18T07:00:00Z"})");
    auto reversed = callSleep("POST", "Bearer " + token,
                              R"({"started_at": "2026-10-18T07:00:00Z", "ended_at": "2026-10-17T23:00:00Z"})");
    auto missing = callSleep("POST", "Bearer " + token, R"({"quality": 10})");

    EXPECT_EQ(badTime.getStatus(), 400);
    EXPECT_EQ(reversed.getStatus(), 400);
    EXPECT_EQ(missing.getStatus(), 400);
    EXPECT_EQ(sessionRepo_->size(), 0u);
}

TEST_F(IdentityEndpointTest, SleepSessions_DevHeaderUnknownAccount_Returns400) {
    setenv("IDENTITY_ENVIRONMENT", "development", 1);
    setenv("IDENTITY_ALLOW_DEV_ACCOUNT_HEADER", "true", 1);
    auto devInterceptor = std::make_shared<application::AuthInterceptor>(
        tokenService_, std::make_shared<settings::InterceptorSettings>(), metrics_);
    ChainHandler devChain(
        std::make_shared<AuthInterceptorMiddleware>(devInterceptor),
        std::make_shared<SleepSessionHandler>(sleepService_));
    unsetenv("IDENTITY_ENVIRONMENT");
    unsetenv("IDENTITY_ALLOW_DEV_ACCOUNT_HEADER");

    auto [accountId, token] = login("device-A");
    sessionRepo_->restrictToAccounts({accountId});

    SimpleRequest ghost("POST", "/api/v1/sleep/sessions", nightBody(), "127.0.0.1", 8080);
    ghost.setHeader("x-dev-account-id-insecure", "acc-does-not-exist");
    SimpleResponse ghostRes;
    devChain.handle(ghost, ghostRes);

    EXPECT_EQ(ghostRes.getStatus(), 400);
    EXPECT_EQ(parse(ghostRes)["error"], "INVALID_ARGUMENT");
    EXPECT_EQ(ghostRes.getHeader("grpc-status").value_or(""), "3");
    EXPECT_EQ(sessionRepo_->size(), 0u);

    SimpleRequest known("POST", "/api/v1/sleep/sessions", nightBody(), "127.0.0.1", 8080);
    known.setHeader("x-dev-account-id-insecure", accountId);
    SimpleResponse knownRes;
    devChain.handle(known, knownRes);

    EXPECT_EQ(knownRes.getStatus(), 201);
    EXPECT_EQ(sessionRepo_->size(), 1u);
}

TEST_F(IdentityEndpointTest, SleepHandler_WithoutMiddleware_Returns401) {
    SleepSessionHandler handler(sleepService_);
    SimpleRequest req("GET", "/api/v1/sleep/sessions", "", "127.0.0.1", 8080);
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
}

// ============================================
// HEALTH & METRICS
// ============================================

TEST_F(IdentityEndpointTest, Health_ReportsSigningKey) {
    HealthHandler handler(std::make_shared<StaticSigningKeyStore>());
    SimpleRequest req("GET", "/health", "", "127.0.0.1", 8080);
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parse(res);
    EXPECT_EQ(json["status"], "healthy");
    EXPECT_EQ(json["signing_key"]["ready"], true);
    EXPECT_EQ(json["signing_key"]["kid"], "k1");
}

TEST_F(IdentityEndpointTest, Health_NoSigningKey_Returns503) {
    HealthHandler handler(std::make_shared<StaticSigningKeyStore>(std::vector<ports::output::SigningKey>{}));
    SimpleRequest req("GET", "/health", "", "127.0.0.1", 8080);
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 503);
    auto json = parse(res);
    EXPECT_EQ(json["status"], "unhealthy");
    EXPECT_EQ(json["signing_key"]["ready"], false);
}

TEST_F(IdentityEndpointTest, Metrics_ReflectsTraffic) {
    auto [accountId, token] = login("device-A");
    callSleep("GET", "Bearer " + token);
    callSleep("GET", "");

    MetricsHandler handler(metrics_);
    SimpleRequest req("GET", "/metrics", "", "127.0.0.1", 8080);
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    const auto& body = res.getBody();
    EXPECT_NE(body.find("accounts_created_total 1"), std::string::npos);
    EXPECT_NE(body.find("tokens_issued_total 1"), std::string::npos);
    EXPECT_NE(body.find("auth_requests_total{result=\"authorized\"} 1"), std::string::npos);
    EXPECT_NE(body.find("auth_requests_total{result=\"unauthenticated\"} 1"), std::string::npos);
}
