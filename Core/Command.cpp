#include "Core/Command.hpp"
#include "Core/Logger.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>

#include <sys/wait.h>

CommandResult ShellRunner::Run(const std::string &command)
{
    CommandResult res;
    LOGT("command") << "exec: " << command;

    FILE *stream = ::popen(command.c_str(), "r");
    if (!stream)
    {
        LOGE("command") << "popen failed: " << std::strerror(errno) << " cmd=" << command;
        return res;
    }

    std::array<char, 4096> buf{};
    while (std::fgets(buf.data(), static_cast<int>(buf.size()), stream) != nullptr)
    {
        res.output += buf.data();
    }

    const int status = ::pclose(stream);
    if (status == -1)
    {
        LOGE("command") << "pclose failed: " << std::strerror(errno);
        return res;
    }

    if (WIFEXITED(status))
    {
        res.exit_code = WEXITSTATUS(status);
    }
    else
    {
        LOGW("command") << "command terminated abnormally, status=" << status;
    }

    LOGT("command") << "exit=" << res.exit_code << " bytes=" << res.output.size();
    return res;
}

CommandResult DryRunRunner::Run(const std::string &command)
{
    LOGI("command") << "dry-run: " << command;
    issued_.push_back(command);

    CommandResult res;
    res.exit_code = 0;
    return res;
}

namespace Command
{
    bool IsSafeValue(const std::string &value)
    {
        static const char kForbidden[] = "'\"`$\\;&|<>(){}*?!#\n\r";
        return value.find_first_of(kForbidden, 0, sizeof(kForbidden) - 1) == std::string::npos;
    }

    std::string Render(const std::string &tmpl, const Vars &vars)
    {
        std::string out;
        out.reserve(tmpl.size() + 64);

        std::size_t pos = 0;
        while (pos < tmpl.size())
        {
            const char c = tmpl[pos];

            // {{ и }} — литеральные скобки (awk, PowerShell-блоки)
            if ((c == '{' || c == '}') && pos + 1 < tmpl.size() && tmpl[pos + 1] == c)
            {
                out += c;
                pos += 2;
                continue;
            }
            if (c != '{')
            {
                out += c;
                ++pos;
                continue;
            }

            const std::size_t close = tmpl.find('}', pos + 1);
            if (close == std::string::npos)
            {
                throw std::invalid_argument("command template: unterminated placeholder in '" + tmpl + "'");
            }

            const std::string name = tmpl.substr(pos + 1, close - pos - 1);
            auto it = vars.find(name);
            if (it == vars.end())
            {
                throw std::invalid_argument("command template: unknown placeholder {" + name + "}");
            }
            if (!IsSafeValue(it->second))
            {
                throw std::invalid_argument("command template: unsafe value for {" + name + "}: " + it->second);
            }

            out += it->second;
            pos = close + 1;
        }
        return out;
    }

    std::vector<std::string> SplitLines(const std::string &text)
    {
        std::vector<std::string> lines;
        std::size_t start = 0;
        while (start < text.size())
        {
            std::size_t end = text.find('\n', start);
            if (end == std::string::npos) end = text.size();

            std::string line = text.substr(start, end - start);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(std::move(line));

            start = end + 1;
        }
        return lines;
    }
}
