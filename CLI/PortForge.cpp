// PortForge.cpp — CLI: проброс TCP-портов хоста на гостевую VM.
//
//   portforge [-c config.json] [-n|--dry-run] [-v] [add|delete|list|sync [portspec]]
//
// Недостающий режим / port spec спрашиваются интерактивно.

#include "Core/Logger.hpp"
#include "Core/Command.hpp"
#include "Core/Nft.hpp"
#include "Core/Forward/ForwardConfig.hpp"
#include "Core/Forward/AddressResolver.hpp"
#include "Core/Forward/RuleStore.hpp"
#include "Core/Forward/RuleMutator.hpp"
#include "Core/Forward/NftBackend.hpp"
#include "Core/Forward/Dispatcher.hpp"
#include "Core/Forward/Prompt.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

namespace
{
    struct CliArgs
    {
        std::string                config_path;
        bool                       dry_run = false;
        bool                       verbose = false;
        std::optional<std::string> mode;
        std::optional<std::string> port_spec;
    };

    void PrintUsage(const char *argv0)
    {
        std::cout << "Usage: " << argv0
                  << " [-c config.json] [-n|--dry-run] [-v] [add|delete|list|sync [portspec]]\n"
                  << "  portspec: <port> | <start>-<end> | all (delete only)\n";
    }

    // false — показать usage и выйти
    bool ParseArgs(int argc, char **argv, CliArgs &a)
    {
        std::vector<std::string> positional;
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "-h" || arg == "--help")
            {
                return false;
            }
            if (arg == "-c" || arg == "--config")
            {
                if (i + 1 >= argc) throw std::runtime_error(arg + " requires a path");
                a.config_path = argv[++i];
            }
            else if (arg == "-n" || arg == "--dry-run")
            {
                a.dry_run = true;
            }
            else if (arg == "-v" || arg == "--verbose")
            {
                a.verbose = true;
            }
            else if (!arg.empty() && arg[0] == '-' && positional.empty())
            {
                throw std::runtime_error("unknown option " + arg);
            }
            else
            {
                positional.push_back(arg);
            }
        }

        if (positional.size() > 2) throw std::runtime_error("too many arguments");
        if (!positional.empty())   a.mode = positional[0];
        if (positional.size() > 1) a.port_spec = positional[1];
        return true;
    }
}

int main(int argc, char **argv)
{
    CliArgs args;
    try
    {
        if (!ParseArgs(argc, argv, args))
        {
            PrintUsage(argv[0]);
            return kExitOk;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "portforge: " << e.what() << "\n";
        PrintUsage(argv[0]);
        return kExitFatal;
    }

    Logger::Options log_opts;
    log_opts.app_name             = "PortForge";
    log_opts.base_filename        = "portforge";
    log_opts.file_min_severity    = boost::log::trivial::info;
    log_opts.console_min_severity = args.verbose ? boost::log::trivial::debug
                                                 : boost::log::trivial::warning;

    // сначала только консоль: каталог логов известен лишь после чтения конфига
    std::optional<Logger::Guard> lg;
    lg.emplace(log_opts);

    ForwardConfig cfg;
    try
    {
        if (!args.config_path.empty())
            cfg = LoadForwardConfig(args.config_path);
    }
    catch (const std::exception &e)
    {
        LOGE("config") << e.what();
        return kExitFatal;
    }
    if (args.dry_run) cfg.dry_run = true;

    if (!cfg.log_dir.empty())
    {
        log_opts.directory = cfg.log_dir;
        lg.reset();
        lg.emplace(log_opts);
    }

    LOGI("cli") << "Starting PortForge backend=" << ToString(cfg.backend)
                << " owner=" << cfg.owner_tag << (cfg.dry_run ? " (dry-run)" : "");

    try
    {
        Request request = Prompt::ReadRequest(std::cin, std::cout, args.mode, args.port_spec);

        ShellRunner  shell;
        DryRunRunner dry;

        AddressResolver resolver(shell, cfg.commands.resolve_guest);

        std::unique_ptr<NftSession>         nft;
        std::unique_ptr<CommandRuleStore>   cmd_store;
        std::unique_ptr<CommandRuleMutator> cmd_mutator;
        std::unique_ptr<NftBackend>         nft_backend;
        RuleStore   *store   = nullptr;
        RuleMutator *mutator = nullptr;

        if (cfg.backend == Backend::Nftables)
        {
            if (::geteuid() != 0 && !cfg.dry_run)
            {
                LOGE("cli") << "nftables backend requires root";
                return kExitFatal;
            }

            nft = std::make_unique<NftSession>();
            if (!nft->Probe())
            {
                LOGE("cli") << "nftables is not available on this host";
                return kExitFatal;
            }

            NftBackend::Params np;
            np.table     = cfg.nft_table;
            np.owner_tag = cfg.owner_tag;
            np.dnat_priority   = cfg.nft_dnat_priority;
            np.filter_priority = cfg.nft_filter_priority;
            CommandRunner &apply = cfg.dry_run ? static_cast<CommandRunner&>(dry) : *nft;
            nft_backend = std::make_unique<NftBackend>(*nft, apply, np);
            store   = nft_backend.get();
            mutator = nft_backend.get();
        }
        else
        {
            CommandRuleStore::Params sp;
            sp.list_rules     = cfg.commands.list_rules;
            sp.list_ports     = cfg.commands.list_ports;
            sp.list_firewall  = cfg.commands.list_firewall;
            sp.default_listen = cfg.listen_address;
            cmd_store = std::make_unique<CommandRuleStore>(shell, sp);

            CommandRuleMutator::Params mp;
            mp.add_proxy       = cfg.commands.add_proxy;
            mp.delete_proxy    = cfg.commands.delete_proxy;
            mp.add_firewall    = cfg.commands.add_firewall;
            mp.delete_firewall = cfg.commands.delete_firewall;
            CommandRunner &apply = cfg.dry_run ? static_cast<CommandRunner&>(dry) : shell;
            cmd_mutator = std::make_unique<CommandRuleMutator>(apply, mp);

            store   = cmd_store.get();
            mutator = cmd_mutator.get();
        }

        Dispatcher::Params dp;
        dp.owner_tag      = cfg.owner_tag;
        dp.listen_address = cfg.listen_address;

        Dispatcher dispatcher(dp, resolver, *store, *mutator, std::cout);
        const int rc = dispatcher.Run(request);

        LOGI("cli") << "Done rc=" << rc;
        return rc;
    }
    catch (const UnknownModeError &e)
    {
        LOGE("cli") << e.what();
        return kExitFatal;
    }
    catch (const std::exception &e)
    {
        LOGE("cli") << "Fatal: " << e.what();
        return kExitFatal;
    }
}
