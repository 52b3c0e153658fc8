#pragma once

// RangeExpander.hpp — port spec -> список портов и пакетное применение по портам.
//
// Грамматика port spec:
//   "<p>"        1 <= p <= 65535
//   "<a>-<b>"    1 <= a <= b <= 65535, все порты [a, b] по возрастанию
//   "all"        только для Delete: порты, которые сейчас есть в таблице проброса;
//                каждое правило удаляется на своём listen-адресе

#include "Rules.hpp"
#include "RuleStore.hpp"
#include "RuleMutator.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

class InvalidPortSpecError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

struct BatchReport
{
    std::size_t total             = 0;
    std::size_t forward_failures  = 0;
    std::size_t firewall_failures = 0;
};

class RangeExpander
{
public:
    // (index с 1, total, port) — только для многопортовых операций
    using ProgressFn = std::function<void(std::size_t, std::size_t, std::uint16_t)>;

    explicit RangeExpander(RuleStore &store);

    /**
     * @brief Развернуть port spec.
     * @throws InvalidPortSpecError Неверная форма, выход за границы или "all" в режиме Add.
     * @throws HostQueryError       "all", а таблицу проброса прочитать не удалось.
     */
    std::vector<std::uint16_t> Expand(const std::string &spec, Mode mode);

    /**
     * @brief Развернуть spec и для каждого порта выполнить проброс, затем файрвол.
     * Ошибки валидации и HostQueryError бросаются до первой мутации.
     * Для "all" проброс удаляется на listen-адресе каждого найденного правила,
     * пара файрвола удаляется один раз на порт.
     */
    BatchReport Apply(Mode mode,
                      const std::string &spec,
                      const std::string &listen_address,
                      const std::string &guest_address,
                      const std::string &owner,
                      RuleMutator &mutator,
                      const ProgressFn &progress = {});

private:
    PortListing ForwardedPorts_();

private:
    RuleStore &store_;
};
