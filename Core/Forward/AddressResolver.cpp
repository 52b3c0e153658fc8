#include "AddressResolver.hpp"
#include "Rules.hpp"
#include "Core/Logger.hpp"

#include <sstream>
#include <utility>

AddressResolver::AddressResolver(CommandRunner &runner, std::string command)
    : runner_(runner)
    , command_(std::move(command))
{
    if (command_.empty())
        throw std::invalid_argument("AddressResolver: command is empty");
}

std::string AddressResolver::Resolve()
{
    LOGD("resolver") << "Resolve: " << command_;
    const CommandResult r = runner_.Run(command_);
    if (!r.Ok())
    {
        LOGE("resolver") << "Guest address command failed, exit=" << r.exit_code;
        throw NoAddressError("guest address command failed (exit " + std::to_string(r.exit_code) + ")");
    }

    std::istringstream ss(r.output);
    std::string first;
    if (!(ss >> first))
    {
        LOGE("resolver") << "Guest address command printed nothing";
        throw NoAddressError("guest address is empty");
    }

    if (!IsIPv4Literal(first))
    {
        LOGE("resolver") << "Not an IPv4 address: '" << first << "'";
        throw NoAddressError("guest address is not an IPv4 literal: " + first);
    }

    LOGI("resolver") << "Guest address: " << first;
    return first;
}
