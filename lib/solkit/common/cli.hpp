#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cerrno>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "error.hpp"
#include "logger.hpp"
#include "numeric-cast.hpp"

namespace solkit::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::optional<std::string>>;

    struct argument_config {
        void expect(const std::initializer_list<std::string> names)
        {
            _names = names;
            _min = 0;
            _max = 0;
            for (const auto &n: _names) {
                if (n.find("...") != std::string::npos) {
                    _max = std::numeric_limits<size_t>::max();
                } else if (n.starts_with('[')) {
                    if (_max != std::numeric_limits<size_t>::max())
                        ++_max;
                } else {
                    ++_min;
                    if (_max != std::numeric_limits<size_t>::max())
                        ++_max;
                }
            }
        }

        void validate(const arguments &args) const;
        [[nodiscard]] std::string usage() const;
    private:
        std::vector<std::string> _names {};
        size_t _min = 0;
        size_t _max = 0;
    };

    struct option_config {
        std::string desc;
        std::optional<std::string> default_value {};

        option_config(std::string d, std::optional<std::string> def={}):
            desc { std::move(d) },
            default_value { std::move(def) }
        {
        }
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
        std::map<std::string, option_config> opts {};
    };

    struct command {
        using command_list = std::map<std::string, std::shared_ptr<command>>;

        static std::shared_ptr<command> reg(std::shared_ptr<command> cmd);
        static const command_list &registry();

        virtual ~command() =default;
        virtual void configure(config &cmd) const =0;

        virtual void run(const arguments &) const
        {
            throw error("this command must override one of the run methods!");
        }

        virtual void run(const arguments &args, const options &) const
        {
            run(args);
        }
    };

    template<typename T>
    T from_str(const std::string &str)
    {
        char *end;
        errno = 0;
        const long long val = std::strtoll(str.c_str(), &end, 10);
        if (errno || end == str.c_str() || *end != '\0') [[unlikely]]
            throw error_sys(fmt::format("failed to parse an integer from '{}'", str));
        return numeric_cast<T>(val);
    }

    extern void print_usage(std::ostream &os);
    extern int run(int argc, const char **argv);
}
