#include "Prompt.hpp"
#include "Rules.hpp"

#include <algorithm>
#include <cctype>

namespace
{
    std::string Ask_(std::istream &in, std::ostream &out, const char *question)
    {
        out << question << std::flush;
        std::string line;
        if (!std::getline(in, line))
            throw std::runtime_error("input closed");
        return Trim(line);
    }
}

namespace Prompt
{
    Action ParseAction(const std::string &text)
    {
        std::string s = Trim(text);
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (s == "add")    return Action::Add;
        if (s == "delete") return Action::Delete;
        if (s == "list")   return Action::List;
        if (s == "sync")   return Action::Sync;
        throw UnknownModeError("unknown mode '" + Trim(text) + "' (expected add, delete, list or sync)");
    }

    Request ReadRequest(std::istream &in,
                        std::ostream &out,
                        const std::optional<std::string> &preset_action,
                        const std::optional<std::string> &preset_spec)
    {
        Request req;
        req.action = ParseAction(preset_action ? *preset_action
                                               : Ask_(in, out, "Mode (add/delete/list/sync): "));

        if (req.action == Action::Add)
        {
            req.port_spec = preset_spec ? *preset_spec
                                        : Ask_(in, out, "Port(s) to add (e.g. 8080 or 8000-8010): ");
        }
        else if (req.action == Action::Delete)
        {
            req.port_spec = preset_spec ? *preset_spec
                                        : Ask_(in, out, "Port(s) to delete (e.g. 8080, 8000-8010 or all): ");
        }
        return req;
    }
}
