#pragma once

// SyncEngine.hpp — перепривязка правил проброса к текущему адресу гостя.

#include "Rules.hpp"
#include "RuleMutator.hpp"

#include <cstddef>
#include <string>
#include <vector>

struct SyncReport
{
    bool        changed   = false; // хотя бы одно правило переписано
    std::size_t rewritten = 0;
    std::size_t failed    = 0;     // delete или add отчитались об ошибке
};

class SyncEngine
{
public:
    explicit SyncEngine(RuleMutator &mutator);

    /**
     * @brief Для каждого правила с target != current_address: delete + add
     *        на том же (listen, port) с новым target и connect_port == port.
     *
     * Правила файрвола не трогаются: они привязаны к локальному порту.
     * Совпадающие правила не трогаются; повторный вызов без внешних
     * изменений не делает ни одной мутации.
     */
    SyncReport Sync(const std::vector<ForwardingRule> &observed, const std::string &current_address);

private:
    RuleMutator &mutator_;
};
