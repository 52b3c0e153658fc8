#include "Core/Forward/SyncEngine.hpp"
#include "FakeHost.hpp"

#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using testing::ElementsAre;

TEST(SyncEngineTest, RewritesStaleRuleOnSameEndpoint)
{
    FakeHost host;
    host.proxy.push_back(ForwardingRule{ 80, "0.0.0.0", "172.20.1.5" });

    SyncEngine engine(host);
    const SyncReport r = engine.Sync(std::vector<ForwardingRule>(host.proxy), "172.20.1.9");

    EXPECT_TRUE(r.changed);
    EXPECT_EQ(r.rewritten, 1u);
    EXPECT_EQ(r.failed, 0u);
    EXPECT_THAT(host.proxy, ElementsAre(ForwardingRule{ 80, "0.0.0.0", "172.20.1.9" }));
    EXPECT_THAT(host.calls, ElementsAre("forward delete 0.0.0.0:80",
                                        "forward add 0.0.0.0:80 172.20.1.9"));
}

TEST(SyncEngineTest, SecondRunIsNoOp)
{
    FakeHost host;
    host.proxy.push_back(ForwardingRule{ 80, "0.0.0.0", "172.20.1.5" });
    host.proxy.push_back(ForwardingRule{ 443, "127.0.0.1", "172.20.1.5" });

    SyncEngine engine(host);
    engine.Sync(std::vector<ForwardingRule>(host.proxy), "172.20.1.9");
    const std::size_t after_first = host.MutationCount();

    const SyncReport r = engine.Sync(std::vector<ForwardingRule>(host.proxy), "172.20.1.9");
    EXPECT_FALSE(r.changed);
    EXPECT_EQ(r.rewritten, 0u);
    EXPECT_EQ(host.MutationCount(), after_first);
}

TEST(SyncEngineTest, UpToDateRulesAreUntouched)
{
    FakeHost host;
    host.proxy.push_back(ForwardingRule{ 22, "0.0.0.0", "172.20.1.9" });
    host.proxy.push_back(ForwardingRule{ 80, "0.0.0.0", "172.20.1.5" });

    SyncEngine engine(host);
    const SyncReport r = engine.Sync(std::vector<ForwardingRule>(host.proxy), "172.20.1.9");

    EXPECT_EQ(r.rewritten, 1u);
    EXPECT_EQ(host.calls.size(), 2u);
    for (const auto &c : host.calls) EXPECT_NE(c.find(":80"), std::string::npos) << c;
}

TEST(SyncEngineTest, FirewallIsNotTouched)
{
    FakeHost host;
    host.proxy.push_back(ForwardingRule{ 80, "0.0.0.0", "172.20.1.5" });
    for (const auto &fw : FirewallRule::PairFor(80, "PortForge")) host.firewall.push_back(fw);
    const auto firewall_before = host.firewall;

    SyncEngine engine(host);
    engine.Sync(std::vector<ForwardingRule>(host.proxy), "172.20.1.9");

    EXPECT_EQ(host.firewall, firewall_before);
    for (const auto &c : host.calls) EXPECT_EQ(c.rfind("firewall", 0), std::string::npos) << c;
}

TEST(SyncEngineTest, FailedRewriteIsReported)
{
    FakeHost host;
    host.proxy.push_back(ForwardingRule{ 80, "0.0.0.0", "172.20.1.5" });
    host.fail_forward.insert(80);

    SyncEngine engine(host);
    const SyncReport r = engine.Sync(std::vector<ForwardingRule>(host.proxy), "172.20.1.9");
    EXPECT_TRUE(r.changed);
    EXPECT_EQ(r.failed, 1u);
}

TEST(SyncEngineTest, EmptyTableIsNoOp)
{
    FakeHost host;
    SyncEngine engine(host);
    const SyncReport r = engine.Sync({}, "172.20.1.9");
    EXPECT_FALSE(r.changed);
    EXPECT_EQ(host.MutationCount(), 0u);
}
