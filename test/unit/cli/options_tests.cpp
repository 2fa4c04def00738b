// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for command-line parsing

#include <catch2/catch_test_macros.hpp>

#include "cli/options.hpp"
#include "network/server_address.hpp"

#include <string>
#include <vector>

using namespace nvr;
using namespace nvr::cli;

namespace {

Options Parse(const std::vector<std::string>& args, const char* env = nullptr) {
    return ParseArguments(args, env);
}

}  // namespace

TEST_CASE("Options: Server address resolution", "[cli][options]") {
    SECTION("Default path when neither flag nor environment is set") {
        auto options = Parse({"--serverlist"});
        REQUIRE_FALSE(options.servername.has_value());
        REQUIRE(options.server_address == network::DEFAULT_SERVER_ADDRESS);
        REQUIRE(options.server_address == "/tmp/nvimsocket");
    }

    SECTION("Environment variable is used when --servername is absent") {
        auto options = Parse({"--serverlist"}, "/run/user/1000/nvim.sock");
        REQUIRE(options.server_address == "/run/user/1000/nvim.sock");
    }

    SECTION("Empty environment variable falls back to default") {
        auto options = Parse({"--serverlist"}, "");
        REQUIRE(options.server_address == "/tmp/nvimsocket");
    }

    SECTION("--servername overrides the environment") {
        auto options = Parse({"--servername", "foo", "--serverlist"}, "/tmp/other");
        REQUIRE(options.servername == std::optional<std::string>("foo"));
        REQUIRE(options.server_address == "foo");
        REQUIRE(options.serverlist);
    }

    SECTION("--servername=value form") {
        auto options = Parse({"--servername=127.0.0.1:6666"});
        REQUIRE(options.server_address == "127.0.0.1:6666");
    }

    SECTION("Last --servername wins") {
        auto options = Parse({"--servername", "a", "--servername", "b"});
        REQUIRE(options.server_address == "b");
    }
}

TEST_CASE("Options: Bare arguments", "[cli][options]") {
    SECTION("Bare file names are collected in order") {
        auto options = Parse({"a.txt", "b.txt", "c d.txt"});
        REQUIRE(options.bare_files == std::vector<std::string>{"a.txt", "b.txt", "c d.txt"});
        REQUIRE(options.remote_silent.empty());
    }

    SECTION("A lone dash is a file name") {
        auto options = Parse({"-"});
        REQUIRE(options.bare_files == std::vector<std::string>{"-"});
    }

    SECTION("Everything after -- is a file name") {
        auto options = Parse({"--", "--remote", "-o"});
        REQUIRE(options.bare_files == std::vector<std::string>{"--remote", "-o"});
        REQUIRE(options.remote.empty());
        REQUIRE(options.split.empty());
    }

    SECTION("Bare names before a list flag stay bare") {
        auto options = Parse({"first", "--remote", "second", "third"});
        REQUIRE(options.bare_files == std::vector<std::string>{"first"});
        REQUIRE(options.remote == std::vector<std::string>{"second", "third"});
    }
}

TEST_CASE("Options: List flags", "[cli][options]") {
    SECTION("A list flag consumes values up to the next option") {
        auto options = Parse({"--remote-wait", "a", "b", "-o", "c", "--remote-expr", "1+1", "&ft"});
        REQUIRE(options.remote_wait == std::vector<std::string>{"a", "b"});
        REQUIRE(options.split == std::vector<std::string>{"c"});
        REQUIRE(options.remote_expr == std::vector<std::string>{"1+1", "&ft"});
    }

    SECTION("Repeated flags accumulate") {
        auto options = Parse({"--remote-send", "ihello", "--remote-send", "<Esc>"});
        REQUIRE(options.remote_send == std::vector<std::string>{"ihello", "<Esc>"});
    }

    SECTION("-p and --remote-tab share one list") {
        auto options = Parse({"-p", "one", "--remote-tab", "two"});
        REQUIRE(options.remote_tab == std::vector<std::string>{"one", "two"});
    }

    SECTION("Every list flag maps to its own field") {
        auto options = Parse({"--remote", "r", "--remote-wait", "rw", "--remote-silent", "rs",
                              "--remote-wait-silent", "rws", "-O", "v"});
        REQUIRE(options.remote == std::vector<std::string>{"r"});
        REQUIRE(options.remote_wait == std::vector<std::string>{"rw"});
        REQUIRE(options.remote_silent == std::vector<std::string>{"rs"});
        REQUIRE(options.remote_wait_silent == std::vector<std::string>{"rws"});
        REQUIRE(options.vsplit == std::vector<std::string>{"v"});
    }

    SECTION("--flag=value supplies exactly one value") {
        auto options = Parse({"--remote=a", "b"});
        REQUIRE(options.remote == std::vector<std::string>{"a"});
        REQUIRE(options.bare_files == std::vector<std::string>{"b"});
    }

    SECTION("Short flag with attached value") {
        auto options = Parse({"-ofile.txt"});
        REQUIRE(options.split == std::vector<std::string>{"file.txt"});
    }

    SECTION("-l is a switch") {
        auto options = Parse({"-l", "file.txt"});
        REQUIRE(options.focus_previous_window);
        REQUIRE(options.bare_files == std::vector<std::string>{"file.txt"});
    }
}

TEST_CASE("Options: Dash-prefixed values", "[cli][options]") {
    SECTION("Negative numbers are values") {
        auto options = Parse({"--remote-expr", "-1", "-.5", "-3.25"});
        REQUIRE(options.remote_expr == std::vector<std::string>{"-1", "-.5", "-3.25"});
    }

    SECTION("A negative number is a bare file name") {
        auto options = Parse({"-42"});
        REQUIRE(options.bare_files == std::vector<std::string>{"-42"});
    }

    SECTION("Tokens with a space are values") {
        auto options = Parse({"--remote-expr", "-1 + 2", "--remote-send", "-x y"});
        REQUIRE(options.remote_expr == std::vector<std::string>{"-1 + 2"});
        REQUIRE(options.remote_send == std::vector<std::string>{"-x y"});
    }

    SECTION("Malformed numbers are still options") {
        REQUIRE_THROWS_AS(Parse({"--remote-expr", "-1."}), UsageError);
        REQUIRE_THROWS_AS(Parse({"-1a"}), UsageError);
    }
}

TEST_CASE("Options: Abbreviations and clusters", "[cli][options]") {
    SECTION("Unique long prefixes select the flag") {
        auto options = Parse({"--remote-ex", "1", "--servern", "sock", "--serverl"});
        REQUIRE(options.remote_expr == std::vector<std::string>{"1"});
        REQUIRE(options.server_address == "sock");
        REQUIRE(options.serverlist);
    }

    SECTION("Prefix with an attached value") {
        auto options = Parse({"--remote-t=tab.txt"});
        REQUIRE(options.remote_tab == std::vector<std::string>{"tab.txt"});
    }

    SECTION("Exact names win over longer flags") {
        auto options = Parse({"--remote", "x"});
        REQUIRE(options.remote == std::vector<std::string>{"x"});
        REQUIRE(options.remote_wait.empty());
    }

    SECTION("Ambiguous prefixes are rejected") {
        try {
            Parse({"--remote-s", "x"});
            FAIL("expected UsageError");
        } catch (const UsageError& e) {
            std::string message = e.what();
            REQUIRE(message.find("ambiguous option: --remote-s") != std::string::npos);
            REQUIRE(message.find("--remote-silent") != std::string::npos);
            REQUIRE(message.find("--remote-send") != std::string::npos);
        }
    }

    SECTION("Switches cluster with a trailing list flag") {
        auto options = Parse({"-lo", "f"});
        REQUIRE(options.focus_previous_window);
        REQUIRE(options.split == std::vector<std::string>{"f"});
    }

    SECTION("Clustered list flag takes the remainder as its value") {
        auto options = Parse({"-lOfile.txt"});
        REQUIRE(options.focus_previous_window);
        REQUIRE(options.vsplit == std::vector<std::string>{"file.txt"});
    }

    SECTION("Unknown letter after a switch") {
        try {
            Parse({"-lx"});
            FAIL("expected UsageError");
        } catch (const UsageError& e) {
            REQUIRE(std::string(e.what()) == "argument -l: ignored explicit argument 'x'");
        }
    }
}

TEST_CASE("Options: Client behaviour flags", "[cli][options]") {
    SECTION("Help and version") {
        REQUIRE(Parse({"-h"}).show_help);
        REQUIRE(Parse({"--help"}).show_help);
        REQUIRE(Parse({"-v"}).show_version);
        REQUIRE(Parse({"--version"}).show_version);
    }

    SECTION("Log level defaults to off") {
        REQUIRE(Parse({"file"}).log_level == "off");
        REQUIRE(Parse({"--loglevel", "debug"}).log_level == "debug");
    }

    SECTION("Invalid log level is a usage error") {
        REQUIRE_THROWS_AS(Parse({"--loglevel", "loud"}), UsageError);
    }
}

TEST_CASE("Options: Malformed command lines", "[cli][options]") {
    SECTION("Unknown long flag") {
        try {
            Parse({"--remote-bogus", "x"});
            FAIL("expected UsageError");
        } catch (const UsageError& e) {
            REQUIRE(std::string(e.what()).find("--remote-bogus") != std::string::npos);
        }
    }

    SECTION("Unknown short flag") {
        REQUIRE_THROWS_AS(Parse({"-x"}), UsageError);
    }

    SECTION("List flag without values") {
        REQUIRE_THROWS_AS(Parse({"--remote"}), UsageError);
        REQUIRE_THROWS_AS(Parse({"--remote-expr", "--serverlist"}), UsageError);
    }

    SECTION("--servername without value") {
        REQUIRE_THROWS_AS(Parse({"--servername"}), UsageError);
        REQUIRE_THROWS_AS(Parse({"--servername", "--remote", "x"}), UsageError);
    }

    SECTION("Switch given a value") {
        REQUIRE_THROWS_AS(Parse({"--serverlist=yes"}), UsageError);
    }
}

TEST_CASE("Options: Usage text", "[cli][options]") {
    std::string usage = GetUsage("nvr");
    REQUIRE(usage.find("Usage: nvr") != std::string::npos);
    REQUIRE(usage.find("--remote-wait-silent") != std::string::npos);
    REQUIRE(usage.find("NVIM_LISTEN_ADDRESS") != std::string::npos);
    REQUIRE(usage.find("/tmp/nvimsocket") != std::string::npos);
}
