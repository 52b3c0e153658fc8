#include "Rules.hpp"

#include <cctype>
#include <sstream>
#include <vector>

#include <arpa/inet.h>

const char *ToString(Direction d)
{
    return d == Direction::Inbound ? "Inbound" : "Outbound";
}

const char *ToString(Mode m)
{
    return m == Mode::Add ? "add" : "delete";
}

std::string FirewallRule::DisplayName() const
{
    return owner + " " + std::to_string(port) + " " + ToString(direction);
}

std::optional<FirewallRule> FirewallRule::Parse(const std::string &display_name,
                                                const std::string &owner)
{
    const std::string name = Trim(display_name);
    if (!HasOwnerTag(name, owner)) return std::nullopt;

    std::istringstream ss(name.substr(owner.size() + 1));
    std::vector<std::string> tok;
    for (std::string t; ss >> t;) tok.push_back(t);
    if (tok.size() != 2) return std::nullopt;

    auto port = ParsePort(tok[0]);
    if (!port) return std::nullopt;

    FirewallRule r;
    r.owner = owner;
    r.port  = *port;
    if (tok[1] == "Inbound")       r.direction = Direction::Inbound;
    else if (tok[1] == "Outbound") r.direction = Direction::Outbound;
    else return std::nullopt;

    return r;
}

std::array<FirewallRule, 2> FirewallRule::PairFor(std::uint16_t port, const std::string &owner)
{
    FirewallRule in;
    in.owner     = owner;
    in.port      = port;
    in.direction = Direction::Inbound;

    FirewallRule out = in;
    out.direction = Direction::Outbound;

    return { in, out };
}

bool IsIPv4Literal(const std::string &s)
{
    in_addr a4{};
    return ::inet_pton(AF_INET, s.c_str(), &a4) == 1;
}

std::optional<std::uint16_t> ParsePort(const std::string &s)
{
    if (s.empty() || s.size() > 5) return std::nullopt;

    unsigned value = 0;
    for (unsigned char c : s)
    {
        if (!std::isdigit(c)) return std::nullopt;
        value = value * 10 + (c - '0');
    }
    if (value < 1 || value > 65535) return std::nullopt;
    return static_cast<std::uint16_t>(value);
}

std::string Trim(const std::string &s)
{
    const std::size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    const std::size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool HasOwnerTag(const std::string &text, const std::string &owner)
{
    return !owner.empty()
           && text.size() > owner.size() + 1
           && text.compare(0, owner.size(), owner) == 0
           && text[owner.size()] == ' ';
}
