/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include "cli.hpp"

namespace solkit::cli {
    void argument_config::validate(const arguments &args) const
    {
        if (args.size() < _min || args.size() > _max) [[unlikely]]
            throw error(fmt::format("expected {} but got {} argument(s)", usage(), args.size()));
    }

    std::string argument_config::usage() const
    {
        std::string res {};
        for (const auto &n: _names) {
            if (!res.empty())
                res += ' ';
            res += n;
        }
        return res;
    }

    static command::command_list &mutable_registry()
    {
        static command::command_list cmds {};
        return cmds;
    }

    std::shared_ptr<command> command::reg(std::shared_ptr<command> cmd)
    {
        config cfg {};
        cmd->configure(cfg);
        if (cfg.name.empty()) [[unlikely]]
            throw error("a command must have a non-empty name!");
        const auto [it, created] = mutable_registry().try_emplace(cfg.name, cmd);
        if (!created) [[unlikely]]
            throw error(fmt::format("duplicate command name: {}", cfg.name));
        return cmd;
    }

    const command::command_list &command::registry()
    {
        return mutable_registry();
    }

    void print_usage(std::ostream &os)
    {
        os << "usage: solkit <command> [<arg> ...] [--<option>=<value> ...]\n";
        os << "commands:\n";
        for (const auto &[name, cmd]: command::registry()) {
            config cfg {};
            cmd->configure(cfg);
            os << fmt::format("  {} {}\n      {}\n", cfg.name, cfg.args.usage(), cfg.desc);
            for (const auto &[opt_name, opt]: cfg.opts) {
                if (opt.default_value)
                    os << fmt::format("      --{}: {} (default: {})\n", opt_name, opt.desc, *opt.default_value);
                else
                    os << fmt::format("      --{}: {}\n", opt_name, opt.desc);
            }
        }
    }

    static void parse(const config &cfg, const int argc, const char **argv, arguments &args, options &opts)
    {
        for (const auto &[name, opt]: cfg.opts)
            opts.try_emplace(name, opt.default_value);
        for (int i = 2; i < argc; ++i) {
            const std::string_view arg { argv[i] };
            if (arg.starts_with("--")) {
                const auto body = arg.substr(2);
                const auto eq_pos = body.find('=');
                const std::string name { body.substr(0, eq_pos) };
                if (!cfg.opts.contains(name)) [[unlikely]]
                    throw error(fmt::format("unsupported option --{} for command {}", name, cfg.name));
                if (eq_pos != std::string_view::npos)
                    opts[name] = std::string { body.substr(eq_pos + 1) };
                else
                    opts[name] = std::string {};
            } else {
                args.emplace_back(arg);
            }
        }
        cfg.args.validate(args);
    }

    int run(const int argc, const char **argv)
    {
        try {
            if (argc < 2) {
                print_usage(std::cerr);
                return 1;
            }
            const std::string cmd_name { argv[1] };
            const auto it = command::registry().find(cmd_name);
            if (it == command::registry().end()) {
                std::cerr << fmt::format("unsupported command: '{}'\n", cmd_name);
                print_usage(std::cerr);
                return 1;
            }
            config cfg {};
            it->second->configure(cfg);
            arguments args {};
            options opts {};
            parse(cfg, argc, argv, args, opts);
            logger::debug("running command {} with {} argument(s)", cmd_name, args.size());
            it->second->run(args, opts);
            return 0;
        } catch (const std::exception &ex) {
            logger::error("Terminating due to an exception: {}", ex.what());
            return 1;
        } catch (...) {
            logger::error("Terminating due to an unknown exception");
            return 2;
        }
    }
}
