#pragma once

// Config.hpp — чтение полей JSON-конфига (Boost.JSON).
// Require* бросают std::runtime_error при отсутствии поля или неверном типе,
// Optional* возвращают значение по умолчанию, если поля нет.

#include <string>

#include <boost/json.hpp>

namespace Config
{
    std::string RequireString(const boost::json::object &o, const char *key);
    int         RequireInt(const boost::json::object &o, const char *key);
    bool        RequireBool(const boost::json::object &o, const char *key);
    const boost::json::object &RequireObject(const boost::json::object &o, const char *key);

    std::string OptionalString(const boost::json::object &o, const char *key, const std::string &def);
    int         OptionalInt(const boost::json::object &o, const char *key, int def);
    bool        OptionalBool(const boost::json::object &o, const char *key, bool def);

    // Разбор текста; корень обязан быть объектом.
    boost::json::object ParseObject(const std::string &text);

    // Прочитать файл целиком. std::runtime_error, если не открылся.
    std::string ReadFile(const std::string &path);
}
