#include "RuleStore.hpp"
#include "Core/Logger.hpp"

#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace
{
    constexpr std::size_t kRuleFields = 4;

    std::vector<std::string> SplitFields(const std::string &line, char delim)
    {
        std::vector<std::string> out;
        std::size_t start = 0;
        for (;;)
        {
            const std::size_t pos = line.find(delim, start);
            if (pos == std::string::npos)
            {
                out.push_back(line.substr(start));
                return out;
            }
            out.push_back(line.substr(start, pos - start));
            start = pos + 1;
        }
    }

    std::string LastToken(const std::string &s)
    {
        std::istringstream ss(s);
        std::string tok, last;
        while (ss >> tok) last = tok;
        return last;
    }
}

CommandRuleStore::CommandRuleStore(CommandRunner &runner, Params params)
    : runner_(runner)
    , p_(std::move(params))
{
    if (!IsIPv4Literal(p_.default_listen))
        throw std::invalid_argument("CommandRuleStore: default listen address is not IPv4: " + p_.default_listen);
}

ForwardListing CommandRuleStore::ParseForwardingRules(const std::string &text,
                                                      const std::string &owner_tag,
                                                      const std::string &default_listen)
{
    ForwardListing listing;
    for (const std::string &raw : Command::SplitLines(text))
    {
        const std::string line = Trim(raw);
        if (line.empty()) continue;
        if (!HasOwnerTag(line, owner_tag)) continue; // чужая строка

        const std::vector<std::string> f = SplitFields(line, ':');
        if (f.size() != kRuleFields)
        {
            LOGD("store") << "skip (fields=" << f.size() << "): " << line;
            listing.skipped.push_back(line);
            continue;
        }

        const auto        port   = ParsePort(Trim(f[1]));
        const std::string target = Trim(f[2]);
        if (!port || !IsIPv4Literal(target))
        {
            LOGD("store") << "skip (port/target): " << line;
            listing.skipped.push_back(line);
            continue;
        }

        ForwardingRule r;
        r.port           = *port;
        r.target_address = target;

        const std::string listen = LastToken(f[0]);
        r.listen_address = IsIPv4Literal(listen) ? listen : default_listen;

        listing.rules.push_back(std::move(r));
    }
    return listing;
}

PortListing CommandRuleStore::ParseForwardedPorts(const std::string &text)
{
    static const std::regex kLine(R"(^\s*(\d{1,3}(?:\.\d{1,3}){3})\s+(\d+)\b)");

    PortListing listing;
    for (const std::string &line : Command::SplitLines(text))
    {
        std::smatch m;
        if (!std::regex_search(line, m, kLine)) continue;
        if (!IsIPv4Literal(m[1].str())) continue;

        if (auto port = ParsePort(m[2].str()))
            listing.entries.insert(ForwardedPort{ *port, m[1].str() });
    }
    return listing;
}

FirewallListing CommandRuleStore::ParseFirewallRules(const std::string &text,
                                                     const std::string &owner_tag)
{
    FirewallListing listing;
    for (const std::string &raw : Command::SplitLines(text))
    {
        const std::string line = Trim(raw);
        if (line.empty()) continue;
        if (!HasOwnerTag(line, owner_tag)) continue;

        if (auto r = FirewallRule::Parse(line, owner_tag))
        {
            listing.rules.push_back(*r);
        }
        else
        {
            LOGD("store") << "skip firewall name: " << line;
            listing.skipped.push_back(line);
        }
    }
    return listing;
}

ForwardListing CommandRuleStore::ListForwardingRules(const std::string &owner_tag)
{
    const std::string cmd = Command::Render(p_.list_rules, { { "owner", owner_tag } });
    const CommandResult r = runner_.Run(cmd);

    ForwardListing listing = ParseForwardingRules(r.output, owner_tag, p_.default_listen);
    listing.ok = r.Ok();
    if (!listing.ok)
        LOGW("store") << "list rules command failed, exit=" << r.exit_code;

    // наш порт = есть наше правило файрвола на этот порт
    const FirewallListing fw = ListFirewallRules(owner_tag);
    if (!fw.ok)
    {
        LOGW("store") << "cannot tell managed rules apart without the firewall listing";
        listing.ok = false;
        listing.rules.clear();
        return listing;
    }

    std::set<std::uint16_t> owned;
    for (const FirewallRule &f : fw.rules) owned.insert(f.port);

    std::vector<ForwardingRule> managed;
    for (ForwardingRule &rule : listing.rules)
    {
        if (owned.count(rule.port))
            managed.push_back(std::move(rule));
        else
            LOGD("store") << "not managed (no firewall rule): " << rule.listen_address << ":" << rule.port;
    }
    listing.rules = std::move(managed);

    LOGD("store") << "forwarding rules: " << listing.rules.size()
                  << " skipped=" << listing.skipped.size();
    return listing;
}

PortListing CommandRuleStore::ListForwardedPorts()
{
    const CommandResult r = runner_.Run(Command::Render(p_.list_ports, {}));

    PortListing listing = ParseForwardedPorts(r.output);
    listing.ok = r.Ok();
    if (!listing.ok)
        LOGW("store") << "list ports command failed, exit=" << r.exit_code;

    LOGD("store") << "forwarded endpoints: " << listing.entries.size();
    return listing;
}

FirewallListing CommandRuleStore::ListFirewallRules(const std::string &owner_tag)
{
    const std::string cmd = Command::Render(p_.list_firewall, { { "owner", owner_tag } });
    const CommandResult r = runner_.Run(cmd);

    FirewallListing listing = ParseFirewallRules(r.output, owner_tag);
    listing.ok = r.Ok();
    if (!listing.ok)
        LOGW("store") << "list firewall command failed, exit=" << r.exit_code;
    return listing;
}
