#include <gtest/gtest.h>

#include "application/DomainRouter.hpp"

using namespace bridge;
using application::DomainRouter;

class DomainRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::BridgeSettings>();
        router_ = std::make_shared<DomainRouter>(settings_);
    }

    std::shared_ptr<settings::BridgeSettings> settings_;
    std::shared_ptr<DomainRouter> router_;
};

TEST_F(DomainRouterTest, LoginHost_ResolvesLoginScope) {
    auto scope = router_->resolveScope("login.lvh.me");

    ASSERT_TRUE(scope.has_value());
    EXPECT_TRUE(scope->isLogin());
    EXPECT_EQ(scope->cookieName, "login.sid");
    EXPECT_EQ(scope->cookieDomain, "login.lvh.me");
}

TEST_F(DomainRouterTest, TenantHost_ResolvesTenantScope) {
    auto scope = router_->resolveScope("acme.lvh.me");

    ASSERT_TRUE(scope.has_value());
    EXPECT_TRUE(scope->isTenant());
    EXPECT_EQ(scope->cookieName, "acme_lvh_me.sid");
    EXPECT_EQ(scope->cookieDomain, "acme.lvh.me");
    EXPECT_EQ(scope->tenantLabel, "acme");
}

TEST_F(DomainRouterTest, TenantScopes_NeverOverlap) {
    auto acme = router_->resolveScope("acme.lvh.me");
    auto globex = router_->resolveScope("globex.lvh.me");
    auto login = router_->resolveScope("login.lvh.me");

    EXPECT_FALSE(*acme == *globex);
    EXPECT_FALSE(*acme == *login);
}

TEST_F(DomainRouterTest, HostIsCaseInsensitive) {
    auto scope = router_->resolveScope("ACME.LVH.ME");

    ASSERT_TRUE(scope.has_value());
    EXPECT_EQ(scope->tenantLabel, "acme");
}

TEST_F(DomainRouterTest, UnknownHosts_NoScope) {
    EXPECT_FALSE(router_->resolveScope("").has_value());
    EXPECT_FALSE(router_->resolveScope("lvh.me").has_value());
    EXPECT_FALSE(router_->resolveScope("example.com").has_value());
    EXPECT_FALSE(router_->resolveScope("a.b.lvh.me").has_value());
    EXPECT_FALSE(router_->resolveScope("evil_host.lvh.me").has_value());
    EXPECT_FALSE(router_->resolveScope("acme.lvh.me.evil.com").has_value());
}

TEST_F(DomainRouterTest, HostHeaderParsing) {
    EXPECT_EQ(DomainRouter::hostnameOf("acme.lvh.me:5173"), "acme.lvh.me");
    EXPECT_EQ(DomainRouter::hostnameOf("Login.lvh.me"), "login.lvh.me");
    EXPECT_EQ(DomainRouter::portOf("acme.lvh.me:5173"), "5173");
    EXPECT_EQ(DomainRouter::portOf("acme.lvh.me"), "");
}

TEST_F(DomainRouterTest, StrictTenantMatch_ExactLabelOnly) {
    EXPECT_TRUE(router_->hostMatchesTenant("acme.lvh.me", "acme"));
    EXPECT_FALSE(router_->hostMatchesTenant("acme2.lvh.me", "acme"));
    EXPECT_FALSE(router_->hostMatchesTenant("tenanta.lvh.me", "a"));
    EXPECT_FALSE(router_->hostMatchesTenant("acme.example.com", "acme"));
    EXPECT_FALSE(router_->hostMatchesTenant("acme.lvh.me", ""));
}

TEST_F(DomainRouterTest, LooseTenantMatch_SubdomainContainsTenant) {
    settings_->setStrictTenantMatch(false);

    EXPECT_TRUE(router_->hostMatchesTenant("acme.lvh.me", "acme"));
    EXPECT_TRUE(router_->hostMatchesTenant("tenanta.lvh.me", "a"));
    EXPECT_FALSE(router_->hostMatchesTenant("globex.lvh.me", "acme"));
}

TEST_F(DomainRouterTest, LoginDomainHost_StrictVsLoose) {
    EXPECT_TRUE(router_->isLoginDomainHost("login.lvh.me"));
    EXPECT_FALSE(router_->isLoginDomainHost("acme.lvh.me"));

    settings_->setStrictTenantMatch(false);
    EXPECT_TRUE(router_->isLoginDomainHost("acme.lvh.me"));
    EXPECT_FALSE(router_->isLoginDomainHost("example.com"));
}

TEST_F(DomainRouterTest, TenantHost) {
    EXPECT_EQ(router_->tenantHost("acme"), "acme.lvh.me");
}
