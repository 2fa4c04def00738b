// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// End-to-end client runs against a fake editor

#include <catch2/catch_test_macros.hpp>

#include "../../infra/fake_editor.hpp"
#include "cli/runner.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace nvr;
using nvr::test::FakeEditor;

namespace {

struct RunResult {
    int status;
    std::string out;
    std::string err;
};

RunResult Run(FakeEditor& editor, const std::vector<std::string>& args, const char* env = nullptr) {
    std::ostringstream out, err;
    int status = cli::RunClient(args, env, editor.connector(), out, err);
    return RunResult{status, out.str(), err.str()};
}

}  // namespace

TEST_CASE("Runner: --serverlist", "[cli][runner]") {
    FakeEditor editor;

    SECTION("Prints exactly the --servername value") {
        auto result = Run(editor, {"--serverlist", "--servername", "foo"});
        REQUIRE(result.status == 0);
        REQUIRE(result.out == "foo\n");
        REQUIRE(editor.state().connect_attempts == 0);
    }

    SECTION("Prints the default path without flag or environment") {
        auto result = Run(editor, {"--serverlist"});
        REQUIRE(result.status == 0);
        REQUIRE(result.out == "/tmp/nvimsocket\n");
    }

    SECTION("Prints the environment address") {
        auto result = Run(editor, {"--serverlist"}, "/tmp/from-env");
        REQUIRE(result.out == "/tmp/from-env\n");
    }
}

TEST_CASE("Runner: Bare files match --remote-silent", "[cli][runner]") {
    FakeEditor bare_editor;
    FakeEditor flag_editor;

    auto bare = Run(bare_editor, {"a.txt", "b c.txt"});
    auto flagged = Run(flag_editor, {"--remote-silent", "a.txt", "b c.txt"});

    REQUIRE(bare.status == flagged.status);
    REQUIRE(bare.out == flagged.out);
    REQUIRE(bare_editor.calls().size() == 2);
    REQUIRE(flag_editor.calls().size() == 2);
    for (size_t i = 0; i < 2; ++i) {
        REQUIRE(bare_editor.calls()[i].notification == flag_editor.calls()[i].notification);
        REQUIRE(bare_editor.calls()[i].method == flag_editor.calls()[i].method);
        REQUIRE(bare_editor.calls()[i].params == flag_editor.calls()[i].params);
    }
    REQUIRE(bare_editor.calls()[1].params == std::vector<std::string>{"edit b\\ c.txt"});
}

TEST_CASE("Runner: Unreachable server", "[cli][runner]") {
    FakeEditor editor;
    editor.state().reachable = false;

    SECTION("Only silent actions: exit 0 and no output") {
        auto result = Run(editor, {"a.txt", "--remote-silent", "b.txt", "--remote-wait-silent", "c.txt"},
                          "/tmp/gone.sock");
        REQUIRE(result.status == 0);
        REQUIRE(result.out.empty());
        REQUIRE(result.err.empty());
    }

    SECTION("--remote: non-zero exit and the target is named") {
        auto result = Run(editor, {"--remote", "a.txt"}, "/tmp/gone.sock");
        REQUIRE(result.status != 0);
        REQUIRE(result.out.empty());
        REQUIRE(result.err.find("/tmp/gone.sock") != std::string::npos);
    }
}

TEST_CASE("Runner: Expression batch", "[cli][runner]") {
    FakeEditor editor;
    editor.state().eval_results["g:dict"] = remote::RemoteValue::Map(
        {{remote::RemoteValue::Bytes("key"), remote::RemoteValue::Bytes("value")}});
    editor.state().eval_results["1+2"] = remote::RemoteValue::Integer(3);

    auto result = Run(editor, {"--remote-expr", "g:dict", "bad(", "1+2", "-o", "later.txt"});
    REQUIRE(result.status == 0);
    REQUIRE(result.out == "{\"key\":\"value\"}\n3\n");
    REQUIRE(result.err == "No valid expression: bad(\n");
    REQUIRE(editor.calls().back().params == std::vector<std::string>{"split later.txt"});
}

TEST_CASE("Runner: Usage and errors", "[cli][runner]") {
    FakeEditor editor;

    SECTION("No arguments prints usage and fails") {
        auto result = Run(editor, {});
        REQUIRE(result.status != 0);
        REQUIRE(result.err.find("Usage:") != std::string::npos);
    }

    SECTION("--help succeeds") {
        auto result = Run(editor, {"--help"});
        REQUIRE(result.status == 0);
        REQUIRE(result.out.find("Usage:") != std::string::npos);
    }

    SECTION("--version succeeds") {
        auto result = Run(editor, {"--version"});
        REQUIRE(result.status == 0);
        REQUIRE(result.out.find("nvr version") != std::string::npos);
    }

    SECTION("Unknown flag fails before any connection") {
        auto result = Run(editor, {"--bogus", "file"});
        REQUIRE(result.status != 0);
        REQUIRE(result.err.find("unrecognized arguments: --bogus") != std::string::npos);
        REQUIRE(editor.state().connect_attempts == 0);
    }

    SECTION("Remote error on a blocking command fails the run") {
        editor.state().command_errors["tabedit x"] = "E37: No write since last change";
        auto result = Run(editor, {"--remote-tab", "x"});
        REQUIRE(result.status != 0);
        REQUIRE(result.err.find("E37") != std::string::npos);
    }
}
