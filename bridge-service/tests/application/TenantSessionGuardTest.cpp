/**
 * @file TenantSessionGuardTest.cpp
 * @brief Unit-тесты guard'а доменов тенантов: простой, привязка к хосту
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/TenantSessionGuard.hpp"
#include "adapters/secondary/InMemorySessionRepository.hpp"
#include "application/AuthService.hpp"
#include "application/HandoffTokenService.hpp"
#include "adapters/secondary/InMemoryHandoffTokenRepository.hpp"
#include "adapters/secondary/InMemoryUserDirectory.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/SequenceTokenGenerator.hpp"
#include "mocks/MockSessionRepository.hpp"
#include "mocks/TestFixtures.hpp"

#include <atomic>
#include <functional>
#include <thread>
#include <vector>

using namespace bridge;
using namespace bridge::tests;
using domain::AuthError;
using domain::GuardOutcome;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class TenantSessionGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::BridgeSettings>();
        clock_ = std::make_shared<mocks::FakeClock>();
        router_ = std::make_shared<application::DomainRouter>(settings_);
        repo_ = std::make_shared<adapters::secondary::InMemorySessionRepository>(clock_);
        guard_ = std::make_shared<application::TenantSessionGuard>(settings_, repo_, clock_, router_);
    }

    domain::SessionContext tenantContext(const std::string& host, const std::string& tenantId) {
        auto ctx = makeContext(*router_, host);
        auto session = makeTenantSession(*ctx.scope, "sid-1", tenantId, clock_->now());
        repo_->save(session);
        ctx.session = session;
        return ctx;
    }

    std::shared_ptr<settings::BridgeSettings> settings_;
    std::shared_ptr<mocks::FakeClock> clock_;
    std::shared_ptr<application::DomainRouter> router_;
    std::shared_ptr<adapters::secondary::InMemorySessionRepository> repo_;
    std::shared_ptr<application::TenantSessionGuard> guard_;
};

TEST_F(TenantSessionGuardTest, MatchingTenant_Allows) {
    auto result = guard_->authorize(tenantContext("acme.lvh.me", "acme"));

    EXPECT_EQ(result.outcome, GuardOutcome::ALLOW);
    ASSERT_TRUE(result.principal.has_value());
    EXPECT_EQ(result.principal->principalId, "1");
    EXPECT_EQ(result.principal->tenantId, "acme");
}

TEST_F(TenantSessionGuardTest, NoSession_Rejects) {
    auto result = guard_->authorize(makeContext(*router_, "acme.lvh.me"));

    EXPECT_EQ(result.outcome, GuardOutcome::REJECT);
    EXPECT_EQ(result.error, AuthError::NO_SESSION);
    EXPECT_TRUE(domain::isUnauthorized(result.error));
}

TEST_F(TenantSessionGuardTest, UnboundSession_NotAuthenticated) {
    auto ctx = makeContext(*router_, "acme.lvh.me");
    ctx.session = domain::Session("sid-1", *ctx.scope, clock_->now(), std::chrono::hours(1));

    auto result = guard_->authorize(ctx);

    EXPECT_EQ(result.error, AuthError::NOT_AUTHENTICATED);
}

TEST_F(TenantSessionGuardTest, Allow_RefreshesLastActivity) {
    auto ctx = tenantContext("acme.lvh.me", "acme");
    clock_->advance(std::chrono::minutes(5));

    auto result = guard_->authorize(ctx);

    ASSERT_TRUE(result.allowed());
    auto stored = repo_->findById(*ctx.scope, "sid-1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->lastActivity(), clock_->now());
    EXPECT_EQ(result.context.session->lastActivity(), clock_->now());
}

TEST_F(TenantSessionGuardTest, IdleExactlyAtLimit_StillAllowed) {
    auto ctx = tenantContext("acme.lvh.me", "acme");
    clock_->advance(std::chrono::milliseconds(1200000));

    EXPECT_TRUE(guard_->authorize(ctx).allowed());
}

TEST_F(TenantSessionGuardTest, IdleBeyondLimit_DestroysSessionAndRejects) {
    auto ctx = tenantContext("acme.lvh.me", "acme");
    clock_->advance(std::chrono::milliseconds(1200001));

    auto result = guard_->authorize(ctx);

    EXPECT_EQ(result.outcome, GuardOutcome::REJECT);
    EXPECT_EQ(result.error, AuthError::SESSION_EXPIRED);
    EXPECT_TRUE(domain::isUnauthorized(result.error));
    EXPECT_FALSE(result.context.session.has_value());
    EXPECT_FALSE(repo_->findById(*ctx.scope, "sid-1").has_value());

    // Следующий запрос с тем же контекстом: сессии уже нет
    auto next = guard_->authorize(ctx);
    EXPECT_EQ(next.error, AuthError::NO_SESSION);
}

TEST_F(TenantSessionGuardTest, PingsWithinTimeout_KeepSessionAlive) {
    auto ctx = tenantContext("acme.lvh.me", "acme");

    for (int i = 0; i < 3; ++i) {
        clock_->advance(std::chrono::minutes(15));
        ASSERT_TRUE(guard_->authorize(ctx).allowed()) << "ping " << i;
    }
}

TEST_F(TenantSessionGuardTest, MissingLastActivity_TreatedAsZeroIdle) {
    auto ctx = makeContext(*router_, "acme.lvh.me");
    domain::Session session("sid-1", *ctx.scope, clock_->now(), std::chrono::hours(1));
    session.binding = domain::TenantSession{"1", "acme", "john@example.com", std::nullopt};
    repo_->save(session);
    ctx.session = session;

    clock_->advance(std::chrono::minutes(30));

    EXPECT_TRUE(guard_->authorize(ctx).allowed());
}

TEST_F(TenantSessionGuardTest, WrongTenantHost_TenantMismatch) {
    auto ctx = makeContext(*router_, "globex.lvh.me");
    auto session = makeTenantSession(*ctx.scope, "sid-1", "acme", clock_->now());
    repo_->save(session);
    ctx.session = session;

    auto result = guard_->authorize(ctx);

    EXPECT_EQ(result.error, AuthError::TENANT_MISMATCH);
    EXPECT_TRUE(domain::isUnauthorized(result.error));
    EXPECT_EQ(result.message, "Invalid tenant access");
}

TEST_F(TenantSessionGuardTest, EmptyTenant_TenantMismatch) {
    auto result = guard_->authorize(tenantContext("acme.lvh.me", ""));

    EXPECT_EQ(result.error, AuthError::TENANT_MISMATCH);
    EXPECT_EQ(result.message, "No tenant specified");
}

TEST_F(TenantSessionGuardTest, LoginHost_AllowsWithoutTenant) {
    auto ctx = makeContext(*router_, "login.lvh.me");
    auto session = makeLoginSession(*ctx.scope, "sid-1", clock_->now());
    repo_->save(session);
    ctx.session = session;

    auto result = guard_->authorize(ctx);

    ASSERT_TRUE(result.allowed());
    EXPECT_EQ(result.principal->principalId, "1");
    EXPECT_TRUE(result.principal->tenantId.empty());
}

TEST_F(TenantSessionGuardTest, StrictMode_CompositeHostRejected) {
    auto ctx = makeContext(*router_, "tenanta.lvh.me");
    auto session = makeTenantSession(*ctx.scope, "sid-1", "a", clock_->now());
    repo_->save(session);
    ctx.session = session;

    EXPECT_EQ(guard_->authorize(ctx).error, AuthError::TENANT_MISMATCH);

    settings_->setStrictTenantMatch(false);
    EXPECT_TRUE(guard_->authorize(ctx).allowed());
}

TEST_F(TenantSessionGuardTest, ConcurrentRequestsAfterIdle_AllRejected) {
    auto ctx = tenantContext("acme.lvh.me", "acme");
    clock_->advance(std::chrono::minutes(21));

    std::atomic<int> expired{0};
    std::atomic<int> noSession{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            auto r = guard_->authorize(ctx);
            if (r.error == AuthError::SESSION_EXPIRED) ++expired;
            if (r.error == AuthError::NO_SESSION) ++noSession;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(expired.load(), 1);
    EXPECT_EQ(noSession.load(), 7);
}

// ============================================
// Logout between read and refresh
// ============================================

namespace {

/**
 * @brief Хранилище, выполняющее действие сразу после чтения сессии
 *
 * Моделирует параллельный запрос, попавший между findById и записью guard'а.
 */
class InterleavingSessionRepository : public ports::output::ISessionRepository {
public:
    explicit InterleavingSessionRepository(std::shared_ptr<ports::output::ISessionRepository> inner)
        : inner_(std::move(inner)) {}

    void afterNextRead(std::function<void()> action) {
        afterRead_ = std::move(action);
    }

    void save(const domain::Session& session) override { inner_->save(session); }

    bool update(const domain::Session& session) override { return inner_->update(session); }

    std::optional<domain::Session> findById(
        const domain::CookieScope& scope,
        const std::string& sessionId
    ) override {
        auto found = inner_->findById(scope, sessionId);
        if (afterRead_) {
            auto action = std::move(afterRead_);
            afterRead_ = nullptr;
            action();
        }
        return found;
    }

    bool deleteById(const domain::CookieScope& scope, const std::string& sessionId) override {
        return inner_->deleteById(scope, sessionId);
    }

    size_t deleteExpired(std::chrono::system_clock::time_point now) override {
        return inner_->deleteExpired(now);
    }

private:
    std::shared_ptr<ports::output::ISessionRepository> inner_;
    std::function<void()> afterRead_;
};

} // namespace

TEST_F(TenantSessionGuardTest, LogoutDuringRefresh_SessionStaysDestroyed) {
    auto ctx = tenantContext("acme.lvh.me", "acme");
    auto interleaving = std::make_shared<InterleavingSessionRepository>(repo_);
    application::TenantSessionGuard guard(settings_, interleaving, clock_, router_);

    auto users = std::make_shared<adapters::secondary::InMemoryUserDirectory>();
    auto tokens = std::make_shared<application::HandoffTokenService>(
        settings_, std::make_shared<adapters::secondary::InMemoryHandoffTokenRepository>(),
        std::make_shared<mocks::SequenceTokenGenerator>(), clock_, router_);
    application::AuthService auth(settings_, users, repo_, tokens,
                                  std::make_shared<mocks::SequenceTokenGenerator>(), clock_, router_);

    bool loggedOut = false;
    interleaving->afterNextRead([&]() {
        loggedOut = auth.logout(ctx).success;
    });

    clock_->advance(std::chrono::minutes(1));
    auto result = guard.authorize(ctx);

    EXPECT_TRUE(loggedOut);
    EXPECT_EQ(result.outcome, GuardOutcome::REJECT);
    EXPECT_EQ(result.error, AuthError::NO_SESSION);
    EXPECT_FALSE(result.context.session.has_value());
    EXPECT_FALSE(repo_->findById(*ctx.scope, "sid-1").has_value());

    // Повторный запрос со старым cookie: сессия не воскресла
    EXPECT_EQ(guard.authorize(ctx).error, AuthError::NO_SESSION);
    EXPECT_EQ(repo_->size(), 0u);
}

// ============================================
// Persistence failures
// ============================================

class TenantSessionGuardFailureTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::BridgeSettings>();
        clock_ = std::make_shared<mocks::FakeClock>();
        router_ = std::make_shared<application::DomainRouter>(settings_);
        repo_ = std::make_shared<mocks::MockSessionRepository>();
        guard_ = std::make_shared<application::TenantSessionGuard>(settings_, repo_, clock_, router_);

        ctx_ = makeContext(*router_, "acme.lvh.me");
        ctx_.session = makeTenantSession(*ctx_.scope, "sid-1", "acme", clock_->now());
    }

    std::shared_ptr<settings::BridgeSettings> settings_;
    std::shared_ptr<mocks::FakeClock> clock_;
    std::shared_ptr<application::DomainRouter> router_;
    std::shared_ptr<mocks::MockSessionRepository> repo_;
    std::shared_ptr<application::TenantSessionGuard> guard_;
    domain::SessionContext ctx_;
};

TEST_F(TenantSessionGuardFailureTest, RefreshWriteFails_PersistenceError) {
    EXPECT_CALL(*repo_, findById(_, "sid-1")).WillOnce(Return(ctx_.session));
    EXPECT_CALL(*repo_, update(_))
        .WillOnce(Throw(ports::output::SessionPersistenceError("disk full")));

    auto result = guard_->authorize(ctx_);

    EXPECT_EQ(result.outcome, GuardOutcome::REJECT);
    EXPECT_EQ(result.error, AuthError::SESSION_PERSISTENCE_FAILED);
}

TEST_F(TenantSessionGuardFailureTest, IdleDestroyFails_PersistenceError) {
    clock_->advance(std::chrono::minutes(21));
    EXPECT_CALL(*repo_, findById(_, "sid-1")).WillOnce(Return(ctx_.session));
    EXPECT_CALL(*repo_, deleteById(_, "sid-1"))
        .WillOnce(Throw(ports::output::SessionPersistenceError("store down")));
    EXPECT_CALL(*repo_, update(_)).Times(0);

    auto result = guard_->authorize(ctx_);

    EXPECT_EQ(result.error, AuthError::SESSION_PERSISTENCE_FAILED);
}

TEST_F(TenantSessionGuardFailureTest, IdleDestroy_CompletesBeforeReject) {
    clock_->advance(std::chrono::minutes(21));
    EXPECT_CALL(*repo_, findById(_, "sid-1")).WillOnce(Return(ctx_.session));
    EXPECT_CALL(*repo_, deleteById(_, "sid-1")).WillOnce(Return(true));

    auto result = guard_->authorize(ctx_);

    EXPECT_EQ(result.error, AuthError::SESSION_EXPIRED);
}
