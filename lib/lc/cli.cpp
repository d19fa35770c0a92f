/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cli.hpp>

namespace ledger_core::cli {
    struct command_meta {
        std::shared_ptr<command> cmd {};
        config cfg {};
    };

    parse_result command::parse(const config &cfg, const arguments &args) const
    {
        parse_result pr {};
        for (const auto &arg: args) {
            if (arg.substr(0, 2) == "--") {
                std::string name = arg.substr(2);
                std::optional<std::string> val {};
                if (const auto eq_pos = arg.find('=', 2); eq_pos != arg.npos) {
                    val = arg.substr(eq_pos + 1);
                    name = arg.substr(2, eq_pos - 2);
                }
                if (!cfg.opts.contains(name))
                    throw error(fmt::format("unknown option '--{}'", name));
                if (const auto [opt_it, opt_created] = pr.opts.try_emplace(name, std::move(val)); !opt_created)
                    throw error(fmt::format("duplicate option specification '{}'", arg));
            } else {
                pr.args.emplace_back(arg);
            }
        }
        for (const auto &[name, opt_cfg]: cfg.opts) {
            if (opt_cfg.default_value && !pr.opts.contains(name))
                pr.opts.emplace(name, *opt_cfg.default_value);
            if (const auto val_it = pr.opts.find(name); opt_cfg.validator && val_it != pr.opts.end()) {
                if (const auto val_err = (*opt_cfg.validator)(val_it->second); val_err)
                    throw error(fmt::format("value {} is invalid for '--{}': {}", val_it->second, name, *val_err));
            }
        }
        if (cfg.args.min && pr.args.size() < *cfg.args.min)
            _throw_usage(cfg);
        if (cfg.args.max && pr.args.size() > *cfg.args.max)
            _throw_usage(cfg);
        return pr;
    }

    void command::_throw_usage(const config &cmd) const
    {
        std::string usage = fmt::format("usage: {} {}", cmd.name, cmd.make_usage());
        if (!cmd.opts.empty()) {
            usage += fmt::format("\n{} supports the following options:", cmd.name);
            for (const auto &[name, opt_cfg]: cmd.opts) {
                if (opt_cfg.default_value)
                    usage += fmt::format("\n    --{} ({} by default) - {}", name, *opt_cfg.default_value, opt_cfg.desc);
                else
                    usage += fmt::format("\n    --{} - {}", name, opt_cfg.desc);
            }
        }
        throw error(usage);
    }

    int run(const int argc, const char **argv, const command::command_list &command_list)
    {
        std::ios_base::sync_with_stdio(false);
        map<std::string, command_meta> commands {};
        for (const auto &cmd: command_list) {
            command_meta meta { cmd };
            cmd->configure(meta.cfg);
            const auto name = meta.cfg.name;
            if (const auto [it, created] = commands.try_emplace(name, std::move(meta)); !created) [[unlikely]]
                throw error(fmt::format("multiple definitions for {}", name));
        }
        if (argc < 2) {
            std::cerr << "Usage: <command> [<arg> ...], where <command> is one of:\n" ;
            for (const auto &[name, meta]: commands)
                std::cerr << fmt::format("    {} {}\n", name, meta.cfg.make_usage());
            return 1;
        }

        const std::string cmd { argv[1] };
        logger::debug("run {}", cmd);
        const auto cmd_it = commands.find(cmd);
        if (cmd_it == commands.end()) {
            logger::error("Unknown command {}", cmd);
            return 1;
        }

        arguments args {};
        for (int i = 2; i < argc; ++i)
            args.emplace_back(argv[i]);
        const auto ex = logger::run_log_errors([&] {
            const auto &meta = cmd_it->second;
            timer t { fmt::format("run {}", cmd), logger::level::info };
            const auto pr = meta.cmd->parse(meta.cfg, args);
            meta.cmd->run(pr.args, pr.opts);
        });
        return ex ? 1 : 0;
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
