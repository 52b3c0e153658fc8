#pragma once

// AddressResolver.hpp — текущий IPv4-адрес гостевой VM.
// Адрес не кэшируется: каждый запуск спрашивает его заново.

#include "Core/Command.hpp"

#include <stdexcept>
#include <string>

// Адрес гостя не получен. Фатально: без адреса ничего не меняем.
class NoAddressError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class AddressResolver
{
public:
    /**
     * @param runner  Исполнитель внешних команд.
     * @param command Команда, печатающая адреса гостя через пробелы/переводы строк.
     */
    AddressResolver(CommandRunner &runner, std::string command);

    /**
     * @brief Первый токен вывода команды.
     * @throws NoAddressError Команда упала, вывод пуст или первый токен не IPv4.
     */
    std::string Resolve();

private:
    CommandRunner &runner_;
    std::string    command_;
};
