#pragma once

// Prompt.hpp — интерактивный ввод режима и port spec.
// Тонкий слой: на выходе обычный Request, ядро о терминале не знает.

#include "Dispatcher.hpp"

#include <istream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

class UnknownModeError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

namespace Prompt
{
    // "add" | "delete" | "list" | "sync", регистр не важен.
    Action ParseAction(const std::string &text);

    /**
     * @brief Собрать Request: недостающее спрашивается у пользователя.
     * @param preset_action Режим из командной строки (если был).
     * @param preset_spec   Port spec из командной строки (если был).
     * @throws UnknownModeError  Нераспознанный режим.
     * @throws std::runtime_error Ввод закончился (EOF) до ответа.
     */
    Request ReadRequest(std::istream &in,
                        std::ostream &out,
                        const std::optional<std::string> &preset_action,
                        const std::optional<std::string> &preset_spec);
}
