#pragma once

// Command.hpp — внешний исполнитель команд.
// Для ядра это чёрный ящик: текст команды на входе, код возврата и stdout на выходе.

#include <map>
#include <string>
#include <vector>

struct CommandResult
{
    int         exit_code = -1;  // -1 — команду не удалось запустить
    std::string output;          // stdout целиком

    bool Ok() const { return exit_code == 0; }
};

class CommandRunner
{
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult Run(const std::string &command) = 0;
};

// /bin/sh через popen(); stderr команды уходит в наш stderr.
class ShellRunner final : public CommandRunner
{
public:
    CommandResult Run(const std::string &command) override;
};

// --dry-run: команда только логируется, результат всегда успешный и пустой.
class DryRunRunner final : public CommandRunner
{
public:
    CommandResult Run(const std::string &command) override;

    const std::vector<std::string> &Issued() const { return issued_; }

private:
    std::vector<std::string> issued_;
};

namespace Command
{
    using Vars = std::map<std::string, std::string>;

    /**
     * @brief Подставить {name} из vars в шаблон команды; {{ и }} дают литеральные скобки.
     * @throws std::invalid_argument Неизвестный плейсхолдер, незакрытая скобка
     *         или значение с кавычками/метасимволами shell.
     */
    std::string Render(const std::string &tmpl, const Vars &vars);

    // Значение можно подставлять в шаблон без экранирования.
    bool IsSafeValue(const std::string &value);

    // Разбить вывод на строки; '\r' в конце строки отбрасывается.
    std::vector<std::string> SplitLines(const std::string &text);
}
