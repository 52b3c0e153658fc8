#pragma once

// Dispatcher.hpp — команда {action, port_spec} -> вызов движка.

#include "AddressResolver.hpp"
#include "RuleStore.hpp"
#include "RuleMutator.hpp"

#include <ostream>
#include <string>

enum class Action
{
    Add,
    Delete,
    List,
    Sync
};

const char *ToString(Action a);

// Явный объект команды вместо глобального "текущего режима".
struct Request
{
    Action      action = Action::List;
    std::string port_spec;   // только для Add/Delete
};

constexpr int kExitOk          = 0;
constexpr int kExitFatal       = 1;  // нет адреса гостя, неизвестный режим, конфиг, сбой запроса к хосту
constexpr int kExitInvalidSpec = 2;  // неверный port spec

class Dispatcher
{
public:
    struct Params
    {
        std::string owner_tag      = "PortForge";
        std::string listen_address = "0.0.0.0";
    };

    Dispatcher(Params params,
               AddressResolver &resolver,
               RuleStore &store,
               RuleMutator &mutator,
               std::ostream &out);

    /**
     * @brief Выполнить команду.
     *
     * Сначала всегда резолвится адрес гостя: без него ничего не меняется.
     * Ошибки отдельных правил код возврата не меняют.
     * @return kExitOk, kExitFatal или kExitInvalidSpec.
     */
    int Run(const Request &request);

private:
    int RunBatch_(const Request &request, const std::string &guest);
    int RunList_(const std::string &guest);
    int RunSync_(const std::string &guest);

private:
    Params           p_;
    AddressResolver &resolver_;
    RuleStore       &store_;
    RuleMutator     &mutator_;
    std::ostream    &out_;
};
