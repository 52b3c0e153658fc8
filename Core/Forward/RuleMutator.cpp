#include "RuleMutator.hpp"
#include "Core/Logger.hpp"

#include <utility>

CommandRuleMutator::CommandRuleMutator(CommandRunner &runner, Params params)
    : runner_(runner)
    , p_(std::move(params))
{
}

bool CommandRuleMutator::RunCmd_(const std::string &cmd)
{
    const CommandResult r = runner_.Run(cmd);
    if (!r.Ok())
    {
        LOGW("mutator") << "command failed, exit=" << r.exit_code << ": " << cmd;
        return false;
    }
    LOGT("mutator") << "ok: " << cmd;
    return true;
}

bool CommandRuleMutator::ApplyForward(Mode mode,
                                      std::uint16_t port,
                                      const std::string &listen_address,
                                      const std::string &target_address)
{
    const std::string p = std::to_string(port);
    std::string cmd;

    if (mode == Mode::Add)
    {
        // connect_port == port: перенаправление порта не поддерживается
        cmd = Command::Render(p_.add_proxy, {
            { "port",         p },
            { "listen",       listen_address },
            { "connect_port", p },
            { "connect",      target_address },
        });
        LOGD("mutator") << "proxy add " << listen_address << ":" << port << " -> " << target_address << ":" << port;
    }
    else
    {
        cmd = Command::Render(p_.delete_proxy, {
            { "port",   p },
            { "listen", listen_address },
        });
        LOGD("mutator") << "proxy delete " << listen_address << ":" << port;
    }

    return RunCmd_(cmd);
}

bool CommandRuleMutator::ApplyFirewall(Mode mode, std::uint16_t port, const std::string &owner)
{
    bool ok = true;
    for (const FirewallRule &fw : FirewallRule::PairFor(port, owner))
    {
        std::string cmd;
        if (mode == Mode::Add)
        {
            cmd = Command::Render(p_.add_firewall, {
                { "name",      fw.DisplayName() },
                { "direction", ToString(fw.direction) },
                { "port",      std::to_string(fw.port) },
            });
        }
        else
        {
            cmd = Command::Render(p_.delete_firewall, { { "name", fw.DisplayName() } });
        }

        LOGD("mutator") << "firewall " << ToString(mode) << " '" << fw.DisplayName() << "'";
        // вторая половина пары выполняется даже если первая не прошла
        ok = RunCmd_(cmd) && ok;
    }
    return ok;
}
