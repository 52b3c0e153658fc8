#include "ForwardConfig.hpp"
#include "Rules.hpp"
#include "Core/Command.hpp"
#include "Core/Config.hpp"
#include "Core/Logger.hpp"

#include <cctype>
#include <stdexcept>

namespace
{
    void CheckTemplate_(const char *name, const std::string &tmpl, const Command::Vars &vars)
    {
        if (tmpl.empty())
            throw std::runtime_error(std::string("commands.") + name + " is empty");
        try
        {
            (void) Command::Render(tmpl, vars);
        }
        catch (const std::invalid_argument &e)
        {
            throw std::runtime_error(std::string("commands.") + name + ": " + e.what());
        }
    }

    bool IsNftIdentifier_(const std::string &s)
    {
        if (s.empty()) return false;
        for (unsigned char c : s)
        {
            if (!std::isalnum(c) && c != '_') return false;
        }
        return true;
    }
}

const char *ToString(Backend b)
{
    return b == Backend::Shell ? "shell" : "nftables";
}

CommandTemplates CommandTemplates::Defaults()
{
    CommandTemplates t;
    t.resolve_guest = "hostname -I";
    t.list_rules =
        "netsh.exe interface portproxy show v4tov4 | tr -d '\\r' | "
        "awk -v tag='{owner}' '$1 ~ /^[0-9.]+$/ && NF == 4 {{ print tag \" \" $1 \":\" $2 \":\" $3 \":\" $4 }}'";
    t.list_ports = "netsh.exe interface portproxy show v4tov4";
    t.list_firewall =
        "powershell.exe -NoProfile -Command \"Get-NetFirewallRule -DisplayName '{owner} *' "
        "-ErrorAction SilentlyContinue | Select-Object -ExpandProperty DisplayName\"";
    t.add_proxy =
        "netsh.exe interface portproxy add v4tov4 listenport={port} listenaddress={listen} "
        "connectport={connect_port} connectaddress={connect}";
    t.delete_proxy =
        "netsh.exe interface portproxy delete v4tov4 listenport={port} listenaddress={listen}";
    t.add_firewall =
        "powershell.exe -NoProfile -Command \"New-NetFirewallRule -DisplayName '{name}' "
        "-Direction {direction} -LocalPort {port} -Action Allow -Protocol TCP | Out-Null\"";
    t.delete_firewall =
        "powershell.exe -NoProfile -Command \"Remove-NetFirewallRule -DisplayName '{name}'\"";
    return t;
}

void ValidateForwardConfig(const ForwardConfig &cfg)
{
    if (cfg.owner_tag.empty())
        throw std::runtime_error("'owner_tag' cannot be empty");
    if (!Command::IsSafeValue(cfg.owner_tag) || cfg.owner_tag.find(':') != std::string::npos)
        throw std::runtime_error("'owner_tag' contains forbidden characters: " + cfg.owner_tag);
    if (Trim(cfg.owner_tag) != cfg.owner_tag)
        throw std::runtime_error("'owner_tag' must not start or end with whitespace");

    if (!IsIPv4Literal(cfg.listen_address))
        throw std::runtime_error("'listen_address' must be an IPv4 literal: " + cfg.listen_address);

    const CommandTemplates &c = cfg.commands;
    CheckTemplate_("resolve_guest", c.resolve_guest, {});

    if (cfg.backend == Backend::Nftables)
    {
        if (!IsNftIdentifier_(cfg.nft_table))
            throw std::runtime_error("'nft.table' must be [A-Za-z0-9_]+: " + cfg.nft_table);
        return;
    }

    const std::string sample_ip   = "192.0.2.1";
    const std::string sample_port = "8080";
    const std::string sample_name = cfg.owner_tag + " 8080 Inbound";

    CheckTemplate_("list_rules",    c.list_rules,    { { "owner", cfg.owner_tag } });
    CheckTemplate_("list_ports",    c.list_ports,    {});
    CheckTemplate_("list_firewall", c.list_firewall, { { "owner", cfg.owner_tag } });
    CheckTemplate_("add_proxy",     c.add_proxy,     { { "port", sample_port }, { "listen", sample_ip },
                                                       { "connect_port", sample_port }, { "connect", sample_ip } });
    CheckTemplate_("delete_proxy",  c.delete_proxy,  { { "port", sample_port }, { "listen", sample_ip } });
    CheckTemplate_("add_firewall",  c.add_firewall,  { { "name", sample_name }, { "direction", "Inbound" },
                                                       { "port", sample_port } });
    CheckTemplate_("delete_firewall", c.delete_firewall, { { "name", sample_name } });
}

ForwardConfig ParseForwardConfig(const std::string &json_text)
{
    const boost::json::object o = Config::ParseObject(json_text);
    ForwardConfig cfg;

    const std::string backend = Config::OptionalString(o, "backend", ToString(cfg.backend));
    if (backend == "shell")         cfg.backend = Backend::Shell;
    else if (backend == "nftables") cfg.backend = Backend::Nftables;
    else throw std::runtime_error("'backend' must be \"shell\" or \"nftables\": " + backend);

    cfg.owner_tag      = Config::OptionalString(o, "owner_tag",      cfg.owner_tag);
    cfg.listen_address = Config::OptionalString(o, "listen_address", cfg.listen_address);
    cfg.log_dir        = Config::OptionalString(o, "log_dir",        cfg.log_dir);
    cfg.dry_run        = Config::OptionalBool(o,   "dry_run",        cfg.dry_run);

    if (o.if_contains("commands"))
    {
        const boost::json::object &c = Config::RequireObject(o, "commands");
        CommandTemplates &t = cfg.commands;
        t.resolve_guest   = Config::OptionalString(c, "resolve_guest",   t.resolve_guest);
        t.list_rules      = Config::OptionalString(c, "list_rules",      t.list_rules);
        t.list_ports      = Config::OptionalString(c, "list_ports",      t.list_ports);
        t.list_firewall   = Config::OptionalString(c, "list_firewall",   t.list_firewall);
        t.add_proxy       = Config::OptionalString(c, "add_proxy",       t.add_proxy);
        t.delete_proxy    = Config::OptionalString(c, "delete_proxy",    t.delete_proxy);
        t.add_firewall    = Config::OptionalString(c, "add_firewall",    t.add_firewall);
        t.delete_firewall = Config::OptionalString(c, "delete_firewall", t.delete_firewall);
    }

    if (o.if_contains("nft"))
    {
        const boost::json::object &n = Config::RequireObject(o, "nft");
        cfg.nft_table           = Config::OptionalString(n, "table",           cfg.nft_table);
        cfg.nft_dnat_priority   = Config::OptionalInt(n,    "dnat_priority",   cfg.nft_dnat_priority);
        cfg.nft_filter_priority = Config::OptionalInt(n,    "filter_priority", cfg.nft_filter_priority);
    }

    ValidateForwardConfig(cfg);

    LOGD("config") << "backend=" << ToString(cfg.backend)
                   << " owner=" << cfg.owner_tag
                   << " listen=" << cfg.listen_address
                   << " dry_run=" << (cfg.dry_run ? "1" : "0");
    return cfg;
}

ForwardConfig LoadForwardConfig(const std::string &path)
{
    LOGD("config") << "Loading " << path;
    return ParseForwardConfig(Config::ReadFile(path));
}
