#pragma once

// NftBackend.hpp — Linux-хост: проброс и файрвол в собственной таблице nftables.
//
//   table ip <table> {
//       chain prerouting { type nat hook prerouting priority -100; policy accept; }
//           [ip daddr L] tcp dport P dnat to T:P comment "<owner> L:P"
//       chain forward    { type filter hook forward priority 0; policy accept; }
//           tcp dport P accept comment "<owner> P Inbound"
//           tcp sport P accept comment "<owner> P Outbound"
//   }
//
// Удаление — по handle'ам из листинга (NftSession печатает их).

#include "RuleStore.hpp"
#include "RuleMutator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Одно правило из "list chain" с handle'ом.
struct NftRuleLine
{
    std::uint64_t                handle = 0;
    std::string                  comment;
    std::string                  daddr;       // пусто — без фильтра по адресу
    std::optional<std::uint16_t> dport;
    std::optional<std::uint16_t> sport;
    std::string                  dnat_addr;   // пусто — не DNAT
    std::optional<std::uint16_t> dnat_port;
    bool                         accept = false;
    std::string                  text;        // исходная строка
};

class NftBackend final : public RuleStore, public RuleMutator
{
public:
    struct Params
    {
        std::string table     = "portforge";
        std::string owner_tag = "PortForge";
        int dnat_priority     = -100;
        int filter_priority   = 0;
    };

    /**
     * @param query Исполнитель для list-запросов.
     * @param apply Исполнитель для изменений (для --dry-run — DryRunRunner).
     * Обычно оба — одна и та же NftSession.
     */
    NftBackend(CommandRunner &query, CommandRunner &apply, Params params);

    ForwardListing  ListForwardingRules(const std::string &owner_tag) override;
    PortListing     ListForwardedPorts() override;
    FirewallListing ListFirewallRules(const std::string &owner_tag) override;

    bool ApplyForward(Mode mode,
                      std::uint16_t port,
                      const std::string &listen_address,
                      const std::string &target_address) override;

    bool ApplyFirewall(Mode mode, std::uint16_t port, const std::string &owner) override;

    // Разбор вывода "list chain ..." (строки с "# handle N").
    static std::vector<NftRuleLine> ParseChain(const std::string &text);

private:
    bool EnsureTable_();
    std::vector<NftRuleLine> ListChain_(const std::string &chain, bool *ok = nullptr);
    bool RunCmd_(const std::string &cmd);
    bool DeleteHandles_(const std::string &chain, const std::vector<std::uint64_t> &handles);

private:
    CommandRunner &query_;
    CommandRunner &apply_;
    Params         p_;
    bool           ensured_ = false;
};
