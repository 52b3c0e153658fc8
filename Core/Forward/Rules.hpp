#pragma once

// Rules.hpp — модель данных: правила проброса (port proxy) и правила файрвола.
// Только TCP и IPv4.

#include <array>
#include <cstdint>
#include <optional>
#include <string>

enum class Protocol
{
    Tcp
};

enum class Direction
{
    Inbound,
    Outbound
};

enum class Mode
{
    Add,
    Delete
};

const char *ToString(Direction d);
const char *ToString(Mode m);

/**
 * @brief Правило проброса listen_address:port -> target_address:port.
 *
 * Порт назначения всегда равен порту прослушивания. В таблице прокси хоста
 * не больше одного правила на endpoint (listen_address, port).
 */
struct ForwardingRule
{
    std::uint16_t port = 0;
    std::string   listen_address;
    std::string   target_address;
    Protocol      protocol = Protocol::Tcp;

    bool SameEndpoint(const ForwardingRule &o) const
    {
        return port == o.port && listen_address == o.listen_address;
    }

    bool operator==(const ForwardingRule &o) const = default;
};

/**
 * @brief Разрешающее (Allow) TCP-правило файрвола на локальный порт.
 *
 * Владение явное: поле owner. Во внешнем мире правило видно по display name
 * "<owner> <port> <direction>", по нему же и удаляется.
 */
struct FirewallRule
{
    std::string   owner;
    std::uint16_t port      = 0;
    Direction     direction = Direction::Inbound;
    Protocol      protocol  = Protocol::Tcp;

    std::string DisplayName() const;

    bool operator==(const FirewallRule &o) const = default;

    // Разобрать display name; чужой owner или другая форма — std::nullopt.
    static std::optional<FirewallRule> Parse(const std::string &display_name,
                                             const std::string &owner);

    // Пара Inbound + Outbound для порта.
    static std::array<FirewallRule, 2> PairFor(std::uint16_t port, const std::string &owner);
};

bool IsIPv4Literal(const std::string &s);

// Строго десятичное число 1..65535, без знака и пробелов.
std::optional<std::uint16_t> ParsePort(const std::string &s);

std::string Trim(const std::string &s);

// text начинается с "<owner> ": наш тег, а не его префикс ("PortForgeOld ...").
bool HasOwnerTag(const std::string &text, const std::string &owner);
