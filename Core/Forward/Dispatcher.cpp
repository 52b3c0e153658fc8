#include "Dispatcher.hpp"
#include "RangeExpander.hpp"
#include "SyncEngine.hpp"
#include "Core/Logger.hpp"

#include <map>
#include <utility>

const char *ToString(Action a)
{
    switch (a)
    {
        case Action::Add:    return "add";
        case Action::Delete: return "delete";
        case Action::List:   return "list";
        case Action::Sync:   return "sync";
    }
    return "?";
}

Dispatcher::Dispatcher(Params params,
                       AddressResolver &resolver,
                       RuleStore &store,
                       RuleMutator &mutator,
                       std::ostream &out)
    : p_(std::move(params))
    , resolver_(resolver)
    , store_(store)
    , mutator_(mutator)
    , out_(out)
{
}

int Dispatcher::Run(const Request &request)
{
    LOGI("dispatcher") << "Run: " << ToString(request.action)
                       << (request.port_spec.empty() ? "" : " ") << request.port_spec;

    std::string guest;
    try
    {
        guest = resolver_.Resolve();
    }
    catch (const NoAddressError &e)
    {
        LOGE("dispatcher") << "Fatal: " << e.what();
        out_ << "Cannot resolve guest address: " << e.what() << "\n";
        return kExitFatal;
    }

    switch (request.action)
    {
        case Action::Add:
        case Action::Delete: return RunBatch_(request, guest);
        case Action::List:   return RunList_(guest);
        case Action::Sync:   return RunSync_(guest);
    }
    return kExitFatal;
}

int Dispatcher::RunBatch_(const Request &request, const std::string &guest)
{
    const Mode mode = (request.action == Action::Add) ? Mode::Add : Mode::Delete;
    RangeExpander expander(store_);

    auto progress = [this](std::size_t index, std::size_t total, std::uint16_t port)
    {
        out_ << "[" << index << "/" << total << "] port " << port << "\n";
    };

    BatchReport report;
    try
    {
        report = expander.Apply(mode, request.port_spec, p_.listen_address, guest,
                                p_.owner_tag, mutator_, progress);
    }
    catch (const InvalidPortSpecError &e)
    {
        LOGE("dispatcher") << "Rejected port spec '" << request.port_spec << "': " << e.what();
        out_ << "Invalid port spec: " << e.what() << "\n";
        return kExitInvalidSpec;
    }
    catch (const HostQueryError &e)
    {
        LOGE("dispatcher") << "Host query failed: " << e.what();
        out_ << "Host query failed: " << e.what() << "; nothing was changed\n";
        return kExitFatal;
    }

    if (report.total == 0)
    {
        out_ << "No forwarded ports to " << ToString(mode) << "\n";
        return kExitOk;
    }

    out_ << (mode == Mode::Add ? "Added " : "Deleted ") << report.total << " port(s)";
    if (mode == Mode::Add) out_ << " -> " << guest;
    out_ << "\n";

    if (report.forward_failures || report.firewall_failures)
    {
        out_ << "Some host commands failed (forward: " << report.forward_failures
             << ", firewall: " << report.firewall_failures << "); run 'list' to inspect\n";
    }
    return kExitOk;
}

int Dispatcher::RunList_(const std::string &guest)
{
    const ForwardListing  fwd = store_.ListForwardingRules(p_.owner_tag);
    const FirewallListing fw  = store_.ListFirewallRules(p_.owner_tag);

    out_ << "Guest address: " << guest << "\n";
    out_ << "Forwarding rules (" << p_.owner_tag << "): " << fwd.rules.size() << "\n";
    for (const ForwardingRule &r : fwd.rules)
    {
        out_ << "  " << r.listen_address << ":" << r.port
             << " -> " << r.target_address << ":" << r.port;
        if (r.target_address != guest) out_ << "  [stale]";
        out_ << "\n";
    }
    if (!fwd.ok)               out_ << "  warning: forwarding table query failed\n";
    if (!fwd.skipped.empty())  out_ << "  skipped " << fwd.skipped.size() << " unrecognized line(s)\n";

    // port -> (inbound, outbound)
    std::map<std::uint16_t, std::pair<bool, bool>> pairs;
    out_ << "Firewall rules (" << p_.owner_tag << "): " << fw.rules.size() << "\n";
    for (const FirewallRule &r : fw.rules)
    {
        out_ << "  " << r.DisplayName() << "\n";
        auto &slot = pairs[r.port];
        if (r.direction == Direction::Inbound) slot.first = true;
        else                                   slot.second = true;
    }
    if (!fw.ok) out_ << "  warning: firewall query failed\n";

    for (const ForwardingRule &r : fwd.rules)
    {
        auto it = pairs.find(r.port);
        if (it == pairs.end() || !it->second.first || !it->second.second)
        {
            out_ << "  warning: port " << r.port << " has no complete Inbound/Outbound firewall pair\n";
            LOGW("dispatcher") << "port " << r.port << " lacks firewall pair";
        }
    }
    return kExitOk;
}

int Dispatcher::RunSync_(const std::string &guest)
{
    const ForwardListing fwd = store_.ListForwardingRules(p_.owner_tag);
    if (!fwd.ok)
        out_ << "warning: forwarding table query failed\n";

    SyncEngine engine(mutator_);
    const SyncReport report = engine.Sync(fwd.rules, guest);

    if (!report.changed)
    {
        out_ << "Already in sync: " << fwd.rules.size() << " rule(s) point to " << guest << "\n";
        return kExitOk;
    }

    out_ << "Rewrote " << report.rewritten << " rule(s) -> " << guest << "\n";
    if (report.failed)
        out_ << "Some rewrites failed: " << report.failed << "; run 'list' to inspect\n";
    return kExitOk;
}
