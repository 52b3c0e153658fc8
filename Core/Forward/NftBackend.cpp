#include "NftBackend.hpp"
#include "Core/Logger.hpp"

#include <regex>
#include <stdexcept>
#include <utility>

namespace
{
    const char *kAnyAddress = "0.0.0.0";

    std::optional<std::uint16_t> MatchPort(const std::string &body, const std::regex &re)
    {
        std::smatch m;
        if (!std::regex_search(body, m, re)) return std::nullopt;
        return ParsePort(m[1].str());
    }

    std::string ListenOf(const NftRuleLine &r)
    {
        return r.daddr.empty() ? std::string(kAnyAddress) : r.daddr;
    }
}

NftBackend::NftBackend(CommandRunner &query, CommandRunner &apply, Params params)
    : query_(query)
    , apply_(apply)
    , p_(std::move(params))
{
    if (p_.table.empty()) throw std::invalid_argument("NftBackend: table name is empty");
    if (p_.owner_tag.empty()) throw std::invalid_argument("NftBackend: owner tag is empty");
}

std::vector<NftRuleLine> NftBackend::ParseChain(const std::string &text)
{
    static const std::regex kHandle (R"(#\s*handle\s+(\d+)\s*$)");
    static const std::regex kComment(R"re(comment\s+"([^"]*)")re");
    static const std::regex kDaddr  (R"(\bip daddr (\d{1,3}(?:\.\d{1,3}){3})\b)");
    static const std::regex kDport  (R"(\btcp dport (\d+)\b)");
    static const std::regex kSport  (R"(\btcp sport (\d+)\b)");
    static const std::regex kDnat   (R"(\bdnat (?:ip )?to (\d{1,3}(?:\.\d{1,3}){3})(?::(\d+))?)");
    static const std::regex kAccept (R"(\baccept\b)");

    std::vector<NftRuleLine> rules;
    for (const std::string &raw : Command::SplitLines(text))
    {
        const std::string line = Trim(raw);
        // заголовки table/chain тоже несут "# handle", но у них есть '{'
        if (line.find('{') != std::string::npos) continue;

        std::smatch hm;
        if (!std::regex_search(line, hm, kHandle)) continue;

        NftRuleLine r;
        r.text   = line;
        r.handle = std::stoull(hm[1].str());

        // тело правила — до комментария, чтобы текст комментария не матчился
        std::string body = line.substr(0, static_cast<std::size_t>(hm.position(0)));

        std::smatch cm;
        if (std::regex_search(body, cm, kComment))
        {
            r.comment = cm[1].str();
            body = body.substr(0, static_cast<std::size_t>(cm.position(0)));
        }

        std::smatch am;
        if (std::regex_search(body, am, kDaddr)) r.daddr = am[1].str();

        r.dport = MatchPort(body, kDport);
        r.sport = MatchPort(body, kSport);

        std::smatch dm;
        if (std::regex_search(body, dm, kDnat))
        {
            r.dnat_addr = dm[1].str();
            if (dm[2].matched) r.dnat_port = ParsePort(dm[2].str());
        }

        r.accept = std::regex_search(body, kAccept);
        rules.push_back(std::move(r));
    }
    return rules;
}

bool NftBackend::RunCmd_(const std::string &cmd)
{
    const CommandResult r = apply_.Run(cmd);
    if (!r.Ok())
    {
        LOGW("nft") << "apply failed: " << cmd;
        return false;
    }
    LOGT("nft") << "apply ok: " << cmd;
    return true;
}

bool NftBackend::EnsureTable_()
{
    if (ensured_) return true;

    const std::string t = p_.table;
    std::string cmd;
    cmd  = "add table ip " + t + "\n";
    cmd += "add chain ip " + t + " prerouting { type nat hook prerouting priority "
           + std::to_string(p_.dnat_priority) + "; policy accept; }\n";
    cmd += "add chain ip " + t + " forward { type filter hook forward priority "
           + std::to_string(p_.filter_priority) + "; policy accept; }\n";

    ensured_ = RunCmd_(cmd);
    if (!ensured_) LOGE("nft") << "cannot create table ip " << t;
    return ensured_;
}

std::vector<NftRuleLine> NftBackend::ListChain_(const std::string &chain, bool *ok)
{
    const CommandResult r = query_.Run("list chain ip " + p_.table + " " + chain);
    if (ok) *ok = r.Ok();
    if (!r.Ok())
    {
        LOGD("nft") << "list chain " << chain << " failed (table missing?)";
        return {};
    }
    return ParseChain(r.output);
}

bool NftBackend::DeleteHandles_(const std::string &chain, const std::vector<std::uint64_t> &handles)
{
    bool ok = true;
    for (std::uint64_t h : handles)
    {
        ok = RunCmd_("delete rule ip " + p_.table + " " + chain + " handle " + std::to_string(h)) && ok;
    }
    return ok;
}

ForwardListing NftBackend::ListForwardingRules(const std::string &owner_tag)
{
    ForwardListing listing;
    for (const NftRuleLine &l : ListChain_("prerouting", &listing.ok))
    {
        if (!HasOwnerTag(l.comment, owner_tag)) continue;

        if (l.dnat_addr.empty() || !l.dport)
        {
            LOGD("nft") << "skip (not a dnat rule): " << l.text;
            listing.skipped.push_back(l.text);
            continue;
        }

        ForwardingRule r;
        r.port           = *l.dport;
        r.listen_address = ListenOf(l);
        r.target_address = l.dnat_addr;
        listing.rules.push_back(std::move(r));
    }
    return listing;
}

PortListing NftBackend::ListForwardedPorts()
{
    PortListing listing;
    for (const NftRuleLine &l : ListChain_("prerouting", &listing.ok))
    {
        if (!l.dnat_addr.empty() && l.dport) listing.entries.insert(ForwardedPort{ *l.dport, ListenOf(l) });
    }
    return listing;
}

FirewallListing NftBackend::ListFirewallRules(const std::string &owner_tag)
{
    FirewallListing listing;
    for (const NftRuleLine &l : ListChain_("forward", &listing.ok))
    {
        if (!HasOwnerTag(l.comment, owner_tag)) continue;

        if (auto fw = FirewallRule::Parse(l.comment, owner_tag))
            listing.rules.push_back(*fw);
        else
            listing.skipped.push_back(l.text);
    }
    return listing;
}

bool NftBackend::ApplyForward(Mode mode,
                              std::uint16_t port,
                              const std::string &listen_address,
                              const std::string &target_address)
{
    const std::string p = std::to_string(port);

    if (mode == Mode::Add)
    {
        if (!EnsureTable_()) return false;

        std::string cmd = "add rule ip " + p_.table + " prerouting ";
        if (listen_address != kAnyAddress) cmd += "ip daddr " + listen_address + " ";
        cmd += "tcp dport " + p + " dnat to " + target_address + ":" + p;
        cmd += " comment \"" + p_.owner_tag + " " + listen_address + ":" + p + "\"";

        LOGD("nft") << "dnat add " << listen_address << ":" << port << " -> " << target_address << ":" << port;
        return RunCmd_(cmd);
    }

    std::vector<std::uint64_t> handles;
    for (const NftRuleLine &l : ListChain_("prerouting"))
    {
        if (l.dnat_addr.empty() || l.dport != port) continue;
        if (ListenOf(l) != listen_address) continue;
        handles.push_back(l.handle);
    }

    if (handles.empty())
    {
        LOGW("nft") << "dnat delete: no rule for " << listen_address << ":" << port;
        return false;
    }
    LOGD("nft") << "dnat delete " << listen_address << ":" << port << " handles=" << handles.size();
    return DeleteHandles_("prerouting", handles);
}

bool NftBackend::ApplyFirewall(Mode mode, std::uint16_t port, const std::string &owner)
{
    const auto pair = FirewallRule::PairFor(port, owner);
    const std::string p = std::to_string(port);
    bool ok = true;

    if (mode == Mode::Add)
    {
        if (!EnsureTable_()) return false;

        for (const FirewallRule &fw : pair)
        {
            const char *match = (fw.direction == Direction::Inbound) ? "tcp dport " : "tcp sport ";
            ok = RunCmd_("add rule ip " + p_.table + " forward " + match + p
                         + " accept comment \"" + fw.DisplayName() + "\"") && ok;
        }
        return ok;
    }

    const std::vector<NftRuleLine> lines = ListChain_("forward");
    for (const FirewallRule &fw : pair)
    {
        std::vector<std::uint64_t> handles;
        for (const NftRuleLine &l : lines)
        {
            if (l.comment == fw.DisplayName()) handles.push_back(l.handle);
        }

        if (handles.empty())
        {
            LOGW("nft") << "firewall delete: no rule '" << fw.DisplayName() << "'";
            ok = false;
            continue;
        }
        ok = DeleteHandles_("forward", handles) && ok;
    }
    return ok;
}
