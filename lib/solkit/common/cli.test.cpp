/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <vector>
#include "cli.hpp"
#include "test.hpp"

namespace {
    using namespace solkit;

    cli::arguments recorded_args {};
    cli::options recorded_opts {};

    struct record_cmd: cli::command {
        void configure(cli::config &cmd) const override
        {
            cmd.name = "test-record";
            cmd.desc = "Remember the arguments and options it was called with";
            cmd.args.expect({ "<first>", "[<second>]" });
            cmd.opts.try_emplace("level", "an option with a default", "3");
        }

        void run(const cli::arguments &args, const cli::options &opts) const override
        {
            recorded_args = args;
            recorded_opts = opts;
            if (args.at(0) == "fail") [[unlikely]]
                throw error("failed as requested");
        }
    };
    auto instance = cli::command::reg(std::make_shared<record_cmd>());

    int run_cli(std::vector<const char *> argv)
    {
        argv.insert(argv.begin(), "solkit");
        return cli::run(static_cast<int>(argv.size()), argv.data());
    }
}

suite solkit_common_cli_suite = [] {
    "solkit::common::cli"_test = [] {
        "registry"_test = [] {
            expect(cli::command::registry().contains("test-record"));
            expect(throws<error>([] { cli::command::reg(std::make_shared<record_cmd>()); }));
        };
        "no command or an unknown one"_test = [] {
            expect_equal(1, run_cli({}));
            expect_equal(1, run_cli({ "no-such-command" }));
        };
        "arguments and options"_test = [] {
            expect_equal(0, run_cli({ "test-record", "a" }));
            expect(recorded_args == cli::arguments { "a" });
            expect(recorded_opts.at("level") == std::optional<std::string> { "3" });
            expect_equal(0, run_cli({ "test-record", "a", "--level=7", "b" }));
            expect(recorded_args == cli::arguments { "a", "b" });
            expect(recorded_opts.at("level") == std::optional<std::string> { "7" });
        };
        "failures"_test = [] {
            expect_equal(1, run_cli({ "test-record" }));
            expect_equal(1, run_cli({ "test-record", "a", "b", "c" }));
            expect_equal(1, run_cli({ "test-record", "a", "--unknown=1" }));
            expect_equal(1, run_cli({ "test-record", "fail" }));
        };
        "from_str"_test = [] {
            expect_equal(uint16_t { 3000 }, cli::from_str<uint16_t>("3000"));
            expect(throws<error>([] { cli::from_str<uint16_t>("65536"); }));
            expect(throws<error>([] { cli::from_str<size_t>("12abc"); }));
            expect(throws<error>([] { cli::from_str<size_t>("-1"); }));
        };
    };
};
