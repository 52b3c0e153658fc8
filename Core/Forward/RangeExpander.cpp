#include "RangeExpander.hpp"
#include "Core/Logger.hpp"

RangeExpander::RangeExpander(RuleStore &store)
    : store_(store)
{
}

PortListing RangeExpander::ForwardedPorts_()
{
    PortListing listing = store_.ListForwardedPorts();
    if (!listing.ok)
        throw HostQueryError("cannot list forwarded ports");

    LOGD("expander") << "all -> " << listing.entries.size() << " endpoint(s)";
    return listing;
}

std::vector<std::uint16_t> RangeExpander::Expand(const std::string &raw, Mode mode)
{
    const std::string spec = Trim(raw);
    if (spec.empty())
        throw InvalidPortSpecError("port spec is empty");

    if (spec == "all")
    {
        if (mode != Mode::Delete)
            throw InvalidPortSpecError("'all' is only valid for delete");

        const std::set<std::uint16_t> ports = ForwardedPorts_().Ports();
        return { ports.begin(), ports.end() };
    }

    const std::size_t dash = spec.find('-');
    if (dash == std::string::npos)
    {
        auto port = ParsePort(spec);
        if (!port)
            throw InvalidPortSpecError("invalid port '" + spec + "' (expected 1-65535)");
        return { *port };
    }

    auto first = ParsePort(Trim(spec.substr(0, dash)));
    auto last  = ParsePort(Trim(spec.substr(dash + 1)));
    if (!first || !last)
        throw InvalidPortSpecError("invalid range '" + spec + "' (expected start-end within 1-65535)");
    if (*first > *last)
        throw InvalidPortSpecError("invalid range '" + spec + "' (start is greater than end)");

    std::vector<std::uint16_t> ports;
    ports.reserve(static_cast<std::size_t>(*last - *first) + 1);
    for (unsigned p = *first; p <= *last; ++p)
        ports.push_back(static_cast<std::uint16_t>(p));

    LOGD("expander") << spec << " -> " << ports.size() << " port(s)";
    return ports;
}

BatchReport RangeExpander::Apply(Mode mode,
                                 const std::string &spec,
                                 const std::string &listen_address,
                                 const std::string &guest_address,
                                 const std::string &owner,
                                 RuleMutator &mutator,
                                 const ProgressFn &progress)
{
    // (port, listen) по возрастанию порта
    std::vector<ForwardedPort> work;
    if (mode == Mode::Delete && Trim(spec) == "all")
    {
        const PortListing listing = ForwardedPorts_();
        work.assign(listing.entries.begin(), listing.entries.end());
    }
    else
    {
        for (std::uint16_t port : Expand(spec, mode))
            work.push_back({ port, listen_address });
    }

    BatchReport report;
    report.total = work.size();

    LOGI("expander") << ToString(mode) << " " << work.size() << " rule(s)"
                     << " listen=" << listen_address << " guest=" << guest_address;

    for (std::size_t i = 0; i < work.size(); ++i)
    {
        const ForwardedPort &item = work[i];
        if (progress && work.size() > 1)
            progress(i + 1, work.size(), item.port);

        if (!mutator.ApplyForward(mode, item.port, item.listen_address, guest_address))
        {
            ++report.forward_failures;
            LOGW("expander") << "forward " << ToString(mode) << " failed for "
                             << item.listen_address << ":" << item.port;
        }

        // пара файрвола одна на порт, даже если порт слушается на нескольких адресах
        const bool last_for_port = (i + 1 == work.size()) || (work[i + 1].port != item.port);
        if (!last_for_port) continue;

        if (!mutator.ApplyFirewall(mode, item.port, owner))
        {
            ++report.firewall_failures;
            LOGW("expander") << "firewall " << ToString(mode) << " failed for port " << item.port;
        }
    }

    LOGI("expander") << ToString(mode) << " done: rules=" << report.total
                     << " forward_failures=" << report.forward_failures
                     << " firewall_failures=" << report.firewall_failures;
    return report;
}
