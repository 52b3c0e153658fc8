#include "Core/Config.hpp"
#include "Core/Forward/ForwardConfig.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <gtest/gtest.h>

TEST(ConfigTest, RequireHelpersCheckPresenceAndType)
{
    const boost::json::object o = Config::ParseObject(R"({"s":"x","i":-5,"b":true,"o":{}})");

    EXPECT_EQ(Config::RequireString(o, "s"), "x");
    EXPECT_EQ(Config::RequireInt(o, "i"), -5);
    EXPECT_TRUE(Config::RequireBool(o, "b"));
    EXPECT_TRUE(Config::RequireObject(o, "o").empty());

    EXPECT_THROW(Config::RequireString(o, "missing"), std::runtime_error);
    EXPECT_THROW(Config::RequireString(o, "i"), std::runtime_error);
    EXPECT_THROW(Config::RequireInt(o, "s"), std::runtime_error);
    EXPECT_THROW(Config::RequireBool(o, "i"), std::runtime_error);
    EXPECT_THROW(Config::RequireObject(o, "s"), std::runtime_error);
}

TEST(ConfigTest, OptionalHelpersFallBackToDefault)
{
    const boost::json::object o = Config::ParseObject(R"({"i":7})");
    EXPECT_EQ(Config::OptionalInt(o, "i", 1), 7);
    EXPECT_EQ(Config::OptionalInt(o, "j", 1), 1);
    EXPECT_EQ(Config::OptionalString(o, "s", "def"), "def");
    EXPECT_FALSE(Config::OptionalBool(o, "b", false));
}

TEST(ConfigTest, IntOutOfRangeIsRejected)
{
    const boost::json::object o = Config::ParseObject(R"({"big":9999999999})");
    EXPECT_THROW(Config::RequireInt(o, "big"), std::runtime_error);
}

TEST(ConfigTest, ParseObjectRejectsBadInput)
{
    EXPECT_THROW(Config::ParseObject("{not json"), std::runtime_error);
    EXPECT_THROW(Config::ParseObject("[1,2]"), std::runtime_error);
}

TEST(ForwardConfigTest, EmptyObjectGivesDefaults)
{
    const ForwardConfig cfg = ParseForwardConfig("{}");
    EXPECT_EQ(cfg.backend, Backend::Shell);
    EXPECT_EQ(cfg.owner_tag, "PortForge");
    EXPECT_EQ(cfg.listen_address, "0.0.0.0");
    EXPECT_FALSE(cfg.dry_run);
    EXPECT_EQ(cfg.commands.resolve_guest, "hostname -I");
    EXPECT_EQ(cfg.nft_table, "portforge");
    EXPECT_EQ(cfg.nft_dnat_priority, -100);
}

TEST(ForwardConfigTest, DefaultTemplatesAreValid)
{
    ForwardConfig cfg;
    EXPECT_NO_THROW(ValidateForwardConfig(cfg));
}

TEST(ForwardConfigTest, OverridesAreApplied)
{
    const ForwardConfig cfg = ParseForwardConfig(R"({
        "backend": "nftables",
        "owner_tag": "WSL Forward",
        "listen_address": "192.168.1.10",
        "dry_run": true,
        "commands": { "resolve_guest": "ip -4 -o addr show eth0" },
        "nft": { "table": "wsl_fwd", "dnat_priority": -150 }
    })");

    EXPECT_EQ(cfg.backend, Backend::Nftables);
    EXPECT_EQ(cfg.owner_tag, "WSL Forward");
    EXPECT_EQ(cfg.listen_address, "192.168.1.10");
    EXPECT_TRUE(cfg.dry_run);
    EXPECT_EQ(cfg.commands.resolve_guest, "ip -4 -o addr show eth0");
    EXPECT_EQ(cfg.commands.add_proxy, CommandTemplates::Defaults().add_proxy);
    EXPECT_EQ(cfg.nft_table, "wsl_fwd");
    EXPECT_EQ(cfg.nft_dnat_priority, -150);
    EXPECT_EQ(cfg.nft_filter_priority, 0);
}

TEST(ForwardConfigTest, RejectsInvalidValues)
{
    EXPECT_THROW(ParseForwardConfig(R"({"backend":"iptables"})"), std::runtime_error);
    EXPECT_THROW(ParseForwardConfig(R"({"owner_tag":""})"), std::runtime_error);
    EXPECT_THROW(ParseForwardConfig(R"({"owner_tag":"it's"})"), std::runtime_error);
    EXPECT_THROW(ParseForwardConfig(R"({"owner_tag":"a:b"})"), std::runtime_error);
    EXPECT_THROW(ParseForwardConfig(R"({"owner_tag":" PortForge"})"), std::runtime_error);
    EXPECT_THROW(ParseForwardConfig(R"({"listen_address":"any"})"), std::runtime_error);
    EXPECT_THROW(ParseForwardConfig(R"({"dry_run":"yes"})"), std::runtime_error);
    EXPECT_THROW(ParseForwardConfig(R"({"backend":"nftables","nft":{"table":"bad-name"}})"),
                 std::runtime_error);
}

TEST(ForwardConfigTest, RejectsBrokenTemplates)
{
    EXPECT_THROW(ParseForwardConfig(R"({"commands":{"add_proxy":"netsh {nope}"}})"), std::runtime_error);
    EXPECT_THROW(ParseForwardConfig(R"({"commands":{"delete_proxy":"netsh {port"}})"), std::runtime_error);
    EXPECT_THROW(ParseForwardConfig(R"({"commands":{"list_ports":""}})"), std::runtime_error);
}

TEST(ForwardConfigTest, NftBackendIgnoresShellTemplates)
{
    EXPECT_NO_THROW(ParseForwardConfig(R"({"backend":"nftables","commands":{"add_proxy":"x {nope}"}})"));
}

TEST(ForwardConfigTest, LoadFromFile)
{
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "portforge_config_test.json";
    {
        std::ofstream f(path);
        f << R"({"owner_tag":"FromFile"})";
    }

    const ForwardConfig cfg = LoadForwardConfig(path.string());
    EXPECT_EQ(cfg.owner_tag, "FromFile");
    std::filesystem::remove(path);

    EXPECT_THROW(LoadForwardConfig(path.string()), std::runtime_error);
}
