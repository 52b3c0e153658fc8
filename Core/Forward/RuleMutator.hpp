#pragma once

// RuleMutator.hpp — изменения таблицы проброса и файрвола хоста.
// Best-effort: без отката и повторов. Результат — true, если все примитивы
// отчитались об успехе; вызывающий решает, что с этим делать.

#include "Rules.hpp"
#include "Core/Command.hpp"

#include <cstdint>
#include <string>

class RuleMutator
{
public:
    virtual ~RuleMutator() = default;

    // Add: listen_address:port -> target_address:port. Delete: по (listen_address, port).
    virtual bool ApplyForward(Mode mode,
                              std::uint16_t port,
                              const std::string &listen_address,
                              const std::string &target_address) = 0;

    // Пара Inbound/Outbound с display name "<owner> <port> <direction>".
    virtual bool ApplyFirewall(Mode mode, std::uint16_t port, const std::string &owner) = 0;
};

/**
 * @brief RuleMutator поверх шаблонов внешних команд.
 *
 * Плейсхолдеры:
 *  add_proxy       {port} {listen} {connect_port} {connect}
 *  delete_proxy    {port} {listen}
 *  add_firewall    {name} {direction} {port}
 *  delete_firewall {name}
 */
class CommandRuleMutator final : public RuleMutator
{
public:
    struct Params
    {
        std::string add_proxy;
        std::string delete_proxy;
        std::string add_firewall;
        std::string delete_firewall;
    };

    CommandRuleMutator(CommandRunner &runner, Params params);

    bool ApplyForward(Mode mode,
                      std::uint16_t port,
                      const std::string &listen_address,
                      const std::string &target_address) override;

    bool ApplyFirewall(Mode mode, std::uint16_t port, const std::string &owner) override;

private:
    bool RunCmd_(const std::string &cmd);

private:
    CommandRunner &runner_;
    Params         p_;
};
