#pragma once

// ForwardConfig.hpp — настройки PortForge из JSON-файла.
// Любое поле можно опустить: действуют значения по умолчанию ниже.
//
// {
//   "backend":        "shell" | "nftables",
//   "owner_tag":      "PortForge",
//   "listen_address": "0.0.0.0",
//   "log_dir":        "",
//   "dry_run":        false,
//   "commands":       { "resolve_guest": "...", "list_rules": "...", ... },
//   "nft":            { "table": "portforge", "dnat_priority": -100, "filter_priority": 0 }
// }

#include <string>

enum class Backend
{
    Shell,
    Nftables
};

struct CommandTemplates
{
    std::string resolve_guest;
    std::string list_rules;
    std::string list_ports;
    std::string list_firewall;
    std::string add_proxy;
    std::string delete_proxy;
    std::string add_firewall;
    std::string delete_firewall;

    // WSL: гость — этот Linux, хост — Windows через interop (netsh.exe, powershell.exe).
    static CommandTemplates Defaults();
};

struct ForwardConfig
{
    Backend          backend        = Backend::Shell;
    std::string      owner_tag      = "PortForge";
    std::string      listen_address = "0.0.0.0";
    std::string      log_dir;
    bool             dry_run        = false;
    CommandTemplates commands       = CommandTemplates::Defaults();
    std::string      nft_table      = "portforge";
    int              nft_dnat_priority   = -100;
    int              nft_filter_priority = 0;
};

/**
 * @brief Разобрать JSON-текст конфига и проверить значения.
 * @throws std::runtime_error Ошибка разбора, типа поля или недопустимое значение.
 */
ForwardConfig ParseForwardConfig(const std::string &json_text);

// Прочитать файл и ParseForwardConfig().
ForwardConfig LoadForwardConfig(const std::string &path);

// Проверка значений: owner_tag, listen_address, имя таблицы, шаблоны команд.
void ValidateForwardConfig(const ForwardConfig &cfg);

const char *ToString(Backend b);
