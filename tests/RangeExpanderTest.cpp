#include "Core/Forward/RangeExpander.hpp"
#include "FakeHost.hpp"

#include <tuple>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using testing::ElementsAre;
using testing::IsEmpty;

namespace
{
    void Seed(FakeHost &host, std::uint16_t port, const std::string &target)
    {
        host.proxy.push_back(ForwardingRule{ port, "0.0.0.0", target });
    }
}

TEST(RangeExpanderTest, SinglePort)
{
    FakeHost host;
    RangeExpander ex(host);
    EXPECT_THAT(ex.Expand("8080", Mode::Add), ElementsAre(8080));
    EXPECT_THAT(ex.Expand(" 22 ", Mode::Delete), ElementsAre(22));
}

TEST(RangeExpanderTest, InclusiveRangeAscending)
{
    FakeHost host;
    RangeExpander ex(host);
    EXPECT_THAT(ex.Expand("8000-8002", Mode::Add), ElementsAre(8000, 8001, 8002));
    EXPECT_THAT(ex.Expand("443-443", Mode::Add), ElementsAre(443));
    EXPECT_EQ(ex.Expand("1-65535", Mode::Add).size(), 65535u);
}

TEST(RangeExpanderTest, RejectsMalformedSpecs)
{
    FakeHost host;
    RangeExpander ex(host);
    EXPECT_THROW(ex.Expand("70000", Mode::Add), InvalidPortSpecError);
    EXPECT_THROW(ex.Expand("0", Mode::Add), InvalidPortSpecError);
    EXPECT_THROW(ex.Expand("500-100", Mode::Add), InvalidPortSpecError);
    EXPECT_THROW(ex.Expand("80-", Mode::Add), InvalidPortSpecError);
    EXPECT_THROW(ex.Expand("-80", Mode::Add), InvalidPortSpecError);
    EXPECT_THROW(ex.Expand("http", Mode::Add), InvalidPortSpecError);
    EXPECT_THROW(ex.Expand("", Mode::Delete), InvalidPortSpecError);
}

TEST(RangeExpanderTest, AllExpandsToCurrentlyForwardedPorts)
{
    FakeHost host;
    Seed(host, 8080, "172.20.1.5");
    Seed(host, 22, "172.20.1.5");

    RangeExpander ex(host);
    EXPECT_THAT(ex.Expand("all", Mode::Delete), ElementsAre(22, 8080));
}

TEST(RangeExpanderTest, AllIsDeleteOnly)
{
    FakeHost host;
    Seed(host, 22, "172.20.1.5");

    RangeExpander ex(host);
    EXPECT_THROW(ex.Expand("all", Mode::Add), InvalidPortSpecError);
}

TEST(RangeExpanderTest, AllOnEmptyTableIsEmpty)
{
    FakeHost host;
    RangeExpander ex(host);
    EXPECT_THAT(ex.Expand("all", Mode::Delete), IsEmpty());
}

TEST(RangeExpanderTest, InvalidSpecMutatesNothing)
{
    FakeHost host;
    RangeExpander ex(host);
    EXPECT_THROW(ex.Apply(Mode::Add, "9-1", "0.0.0.0", "172.20.1.5", "PortForge", host),
                 InvalidPortSpecError);
    EXPECT_EQ(host.MutationCount(), 0u);
}

TEST(RangeExpanderTest, EachPortForwardThenFirewall)
{
    FakeHost host;
    RangeExpander ex(host);
    const BatchReport r = ex.Apply(Mode::Add, "80-81", "0.0.0.0", "172.20.1.5", "PortForge", host);

    EXPECT_EQ(r.total, 2u);
    EXPECT_EQ(r.forward_failures, 0u);
    EXPECT_EQ(r.firewall_failures, 0u);
    EXPECT_THAT(host.calls, ElementsAre("forward add 0.0.0.0:80 172.20.1.5",
                                        "firewall add PortForge 80 Inbound",
                                        "firewall add PortForge 80 Outbound",
                                        "forward add 0.0.0.0:81 172.20.1.5",
                                        "firewall add PortForge 81 Inbound",
                                        "firewall add PortForge 81 Outbound"));
}

TEST(RangeExpanderTest, ProgressOnlyForMultiPortBatches)
{
    FakeHost host;
    RangeExpander ex(host);

    std::vector<std::tuple<std::size_t, std::size_t, std::uint16_t>> events;
    auto progress = [&](std::size_t i, std::size_t n, std::uint16_t p) { events.emplace_back(i, n, p); };

    ex.Apply(Mode::Add, "8080", "0.0.0.0", "172.20.1.5", "PortForge", host, progress);
    EXPECT_TRUE(events.empty());

    ex.Apply(Mode::Add, "8000-8002", "0.0.0.0", "172.20.1.5", "PortForge", host, progress);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0], std::make_tuple(std::size_t{ 1 }, std::size_t{ 3 }, std::uint16_t{ 8000 }));
    EXPECT_EQ(events[2], std::make_tuple(std::size_t{ 3 }, std::size_t{ 3 }, std::uint16_t{ 8002 }));
}

TEST(RangeExpanderTest, FailuresAreCountedAndBatchContinues)
{
    FakeHost host;
    host.fail_forward.insert(8001);
    host.fail_firewall.insert(8002);

    RangeExpander ex(host);
    const BatchReport r = ex.Apply(Mode::Add, "8000-8002", "0.0.0.0", "172.20.1.5", "PortForge", host);

    EXPECT_EQ(r.total, 3u);
    EXPECT_EQ(r.forward_failures, 1u);
    EXPECT_EQ(r.firewall_failures, 1u);
    EXPECT_EQ(host.proxy.size(), 2u);
}

TEST(RangeExpanderTest, AddThenDeleteRestoresHostState)
{
    FakeHost host;
    Seed(host, 22, "172.20.1.5");
    host.firewall.push_back(FirewallRule{ "Other", 3389, Direction::Inbound });
    const auto proxy_before    = host.proxy;
    const auto firewall_before = host.firewall;

    RangeExpander ex(host);
    ex.Apply(Mode::Add, "9000-9003", "0.0.0.0", "172.20.1.5", "PortForge", host);
    EXPECT_EQ(host.proxy.size(), 5u);
    EXPECT_EQ(host.firewall.size(), 9u);

    ex.Apply(Mode::Delete, "9000-9003", "0.0.0.0", "172.20.1.5", "PortForge", host);
    EXPECT_EQ(host.proxy, proxy_before);
    EXPECT_EQ(host.firewall, firewall_before);
}

TEST(RangeExpanderTest, DeleteAllRemovesEveryForwardedPort)
{
    FakeHost host;
    Seed(host, 22, "172.20.1.5");
    Seed(host, 8080, "172.20.1.5");

    RangeExpander ex(host);
    const BatchReport r = ex.Apply(Mode::Delete, "all", "0.0.0.0", "172.20.1.5", "PortForge", host);
    EXPECT_EQ(r.total, 2u);
    EXPECT_TRUE(host.proxy.empty());
}

TEST(RangeExpanderTest, AllWithFailedQueryThrowsBeforeMutating)
{
    FakeHost host;
    Seed(host, 22, "172.20.1.5");
    host.ports_query_fails = true;

    RangeExpander ex(host);
    EXPECT_THROW(ex.Expand("all", Mode::Delete), HostQueryError);
    EXPECT_THROW(ex.Apply(Mode::Delete, "all", "0.0.0.0", "172.20.1.5", "PortForge", host), HostQueryError);
    EXPECT_EQ(host.MutationCount(), 0u);
}

TEST(RangeExpanderTest, DeleteAllUsesEachRuleListenAddress)
{
    FakeHost host;
    host.proxy.push_back(ForwardingRule{ 22, "0.0.0.0", "172.20.1.5" });
    host.proxy.push_back(ForwardingRule{ 22, "127.0.0.1", "172.20.1.5" });
    host.proxy.push_back(ForwardingRule{ 80, "192.168.1.10", "172.20.1.5" });

    RangeExpander ex(host);
    const BatchReport r = ex.Apply(Mode::Delete, "all", "0.0.0.0", "172.20.1.5", "PortForge", host);

    EXPECT_EQ(r.total, 3u);
    EXPECT_TRUE(host.proxy.empty());
    EXPECT_THAT(host.calls, ElementsAre("forward delete 0.0.0.0:22",
                                        "forward delete 127.0.0.1:22",
                                        "firewall delete PortForge 22 Inbound",
                                        "firewall delete PortForge 22 Outbound",
                                        "forward delete 192.168.1.10:80",
                                        "firewall delete PortForge 80 Inbound",
                                        "firewall delete PortForge 80 Outbound"));
}
