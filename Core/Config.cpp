#include "Core/Config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace Config
{
    namespace
    {
        const boost::json::value &Require_(const boost::json::object &o, const char *key)
        {
            const boost::json::value *v = o.if_contains(key);
            if (!v)
            {
                throw std::runtime_error(std::string("missing required field '") + key + "'");
            }
            return *v;
        }

        int ToInt_(const boost::json::value &v, const char *key)
        {
            std::int64_t n = 0;
            if (v.is_int64())
            {
                n = v.as_int64();
            }
            else if (v.is_uint64() && v.as_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            {
                n = static_cast<std::int64_t>(v.as_uint64());
            }
            else
            {
                throw std::runtime_error(std::string("field '") + key + "' must be an integer");
            }

            if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max())
            {
                throw std::runtime_error(std::string("field '") + key + "' is out of range");
            }
            return static_cast<int>(n);
        }
    }

    std::string RequireString(const boost::json::object &o, const char *key)
    {
        const boost::json::value &v = Require_(o, key);
        if (!v.is_string())
        {
            throw std::runtime_error(std::string("field '") + key + "' must be a string");
        }
        return boost::json::value_to<std::string>(v);
    }

    int RequireInt(const boost::json::object &o, const char *key)
    {
        return ToInt_(Require_(o, key), key);
    }

    bool RequireBool(const boost::json::object &o, const char *key)
    {
        const boost::json::value &v = Require_(o, key);
        if (!v.is_bool())
        {
            throw std::runtime_error(std::string("field '") + key + "' must be a boolean");
        }
        return v.as_bool();
    }

    const boost::json::object &RequireObject(const boost::json::object &o, const char *key)
    {
        const boost::json::value &v = Require_(o, key);
        if (!v.is_object())
        {
            throw std::runtime_error(std::string("field '") + key + "' must be an object");
        }
        return v.as_object();
    }

    std::string OptionalString(const boost::json::object &o, const char *key, const std::string &def)
    {
        if (!o.if_contains(key)) return def;
        return RequireString(o, key);
    }

    int OptionalInt(const boost::json::object &o, const char *key, int def)
    {
        if (!o.if_contains(key)) return def;
        return RequireInt(o, key);
    }

    bool OptionalBool(const boost::json::object &o, const char *key, bool def)
    {
        if (!o.if_contains(key)) return def;
        return RequireBool(o, key);
    }

    boost::json::object ParseObject(const std::string &text)
    {
        boost::json::error_code ec;
        boost::json::value jv = boost::json::parse(text, ec);
        if (ec)
        {
            throw std::runtime_error("config parse error: " + ec.message());
        }
        if (!jv.is_object())
        {
            throw std::runtime_error("config root must be an object");
        }
        return std::move(jv.as_object());
    }

    std::string ReadFile(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            throw std::runtime_error("cannot open config file: " + path);
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
}
