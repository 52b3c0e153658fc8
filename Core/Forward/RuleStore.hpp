#pragma once

// RuleStore.hpp — наблюдаемое состояние хоста: таблица проброса и правила файрвола.
// Ядро работает только через этот интерфейс и не знает текстовых форматов.

#include "Rules.hpp"
#include "Core/Command.hpp"

#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

struct ForwardListing
{
    std::vector<ForwardingRule> rules;
    std::vector<std::string>    skipped;  // наши строки, не подошедшие по форме
    bool                        ok = true; // false — сам запрос к хосту не удался
};

struct FirewallListing
{
    std::vector<FirewallRule> rules;
    std::vector<std::string>  skipped;
    bool                      ok = true;
};

// Порт в таблице проброса и адрес, на котором он слушает.
struct ForwardedPort
{
    std::uint16_t port = 0;
    std::string   listen_address;

    bool operator==(const ForwardedPort &o) const = default;
    bool operator<(const ForwardedPort &o) const
    {
        return std::tie(port, listen_address) < std::tie(o.port, o.listen_address);
    }
};

struct PortListing
{
    std::set<ForwardedPort> entries;   // по возрастанию порта
    bool                    ok = true; // false — запрос к хосту не удался

    std::set<std::uint16_t> Ports() const
    {
        std::set<std::uint16_t> ports;
        for (const ForwardedPort &e : entries) ports.insert(e.port);
        return ports;
    }
};

// Запрос состояния хоста не удался: решение "что менять" принять нельзя.
class HostQueryError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class RuleStore
{
public:
    virtual ~RuleStore() = default;

    // Правила проброса, принадлежащие owner_tag.
    virtual ForwardListing ListForwardingRules(const std::string &owner_tag) = 0;

    // Все endpoint'ы таблицы v4-to-v4, включая чужие (для "all" при удалении).
    virtual PortListing ListForwardedPorts() = 0;

    // Наши правила файрвола (по префиксу display name).
    virtual FirewallListing ListFirewallRules(const std::string &owner_tag) = 0;
};

/**
 * @brief RuleStore поверх внешних команд с разбором текстового вывода.
 *
 * list_rules:    строки "<desc>:<port>:<target>:<extra>", наши начинаются с "<owner_tag> ";
 *                listen-адрес — последний токен <desc>, если это IPv4.
 *                Управляемыми считаются только порты, у которых есть наше
 *                правило файрвола: netsh не хранит описаний, и тег в строке
 *                не отличает наши правила от чужих.
 * list_ports:    строки "<IPv4> <port> ...": listen-адрес и порт.
 * list_firewall: по display name на строку.
 * В шаблонах list_rules/list_firewall доступен плейсхолдер {owner}.
 */
class CommandRuleStore final : public RuleStore
{
public:
    struct Params
    {
        std::string list_rules;
        std::string list_ports;
        std::string list_firewall;
        std::string default_listen = "0.0.0.0";
    };

    CommandRuleStore(CommandRunner &runner, Params params);

    ForwardListing  ListForwardingRules(const std::string &owner_tag) override;
    PortListing     ListForwardedPorts() override;
    FirewallListing ListFirewallRules(const std::string &owner_tag) override;

    static ForwardListing ParseForwardingRules(const std::string &text,
                                               const std::string &owner_tag,
                                               const std::string &default_listen);
    static PortListing ParseForwardedPorts(const std::string &text);
    static FirewallListing ParseFirewallRules(const std::string &text,
                                              const std::string &owner_tag);

private:
    CommandRunner &runner_;
    Params         p_;
};
