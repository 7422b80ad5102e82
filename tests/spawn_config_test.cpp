/**
 * @file spawn_config_test.cpp
 * @brief Tests for the server-harness command line builder
 */

#include <gtest/gtest.h>
#include "devui/spawn_config.hpp"
#include "test_support.hpp"

#include <cmath>
#include <limits>
#include <sys/stat.h>

using namespace devui;

namespace {

    RuntimeIdentity node_identity(PlatformFamily family = PlatformFamily::POSIX) {
        RuntimeIdentity identity;
        identity.kind = RuntimeKind::INTERPRETED_PRIMARY;
        identity.executable_path = "/usr/bin/node";
        identity.script_path = "/lib/genkit.js";
        identity.platform_family = family;
        return identity;
    }

    RuntimeIdentity binary_identity() {
        RuntimeIdentity identity;
        identity.kind = RuntimeKind::COMPILED_BINARY;
        identity.executable_path = "/usr/local/bin/devui";
        identity.platform_family = PlatformFamily::POSIX;
        return identity;
    }

} // namespace

// Test: interpreted runtime with a script on POSIX passes tokens through unquoted
TEST(SpawnConfigTest, InterpretedPosixPrependsScript) {
    SpawnConfig config = build_server_harness_spawn_config(node_identity(), 4000, "/x/devui.log");

    EXPECT_EQ(config.command, "/usr/bin/node");
    std::vector<std::string> expected = {"/lib/genkit.js", "server-harness", "4000", "/x/devui.log"};
    EXPECT_EQ(config.args, expected);
    EXPECT_FALSE(config.options.use_shell);
    EXPECT_FALSE(config.options.detached);
    for (StdioMode mode : config.options.stdio) {
        EXPECT_EQ(mode, StdioMode::IGNORE);
    }
}

// Test: Windows quotes the command and every argument once and uses the shell
TEST(SpawnConfigTest, WindowsQuotesEveryToken) {
    RuntimeIdentity identity = node_identity(PlatformFamily::WINDOWS);
    identity.executable_path = "C:\\nodejs\\node.exe";
    identity.script_path = "C:\\Program Files\\genkit\\cli.js";

    SpawnConfig config = build_server_harness_spawn_config(identity, 4000, "C:\\logs dir\\devui.log");

    EXPECT_EQ(config.command, "\"C:\\nodejs\\node.exe\"");
    std::vector<std::string> expected = {
        "\"C:\\Program Files\\genkit\\cli.js\"",
        "\"server-harness\"",
        "\"4000\"",
        "\"C:\\logs dir\\devui.log\""
    };
    EXPECT_EQ(config.args, expected);
    EXPECT_TRUE(config.options.use_shell);
    EXPECT_FALSE(config.options.detached);
}

// Test: every Windows token is wrapped in exactly one pair of quotes
TEST(SpawnConfigTest, WindowsTokensHaveExactlyOnePairOfQuotes) {
    SpawnConfig config = build_server_harness_spawn_config(node_identity(PlatformFamily::WINDOWS),
                                                           8080, "/tmp/devui.log");
    std::vector<std::string> tokens = config.args;
    tokens.push_back(config.command);
    for (const auto& token : tokens) {
        ASSERT_GE(token.size(), 2u);
        EXPECT_EQ(token.front(), '"') << token;
        EXPECT_EQ(token.back(), '"') << token;
        EXPECT_EQ(token.find('"', 1), token.size() - 1) << token;
    }
}

// Test: POSIX tokens never carry quotes
TEST(SpawnConfigTest, PosixTokensAreUnquoted) {
    RuntimeIdentity identity = node_identity();
    identity.script_path = "/path with spaces/cli.js";
    SpawnConfig config = build_server_harness_spawn_config(identity, 4000, "/log dir/devui.log");

    EXPECT_EQ(config.args.front(), "/path with spaces/cli.js");
    for (const auto& arg : config.args) {
        EXPECT_EQ(arg.find('"'), std::string::npos);
    }
}

// Test: compiled binary starts directly with the sub-command
TEST(SpawnConfigTest, CompiledBinaryWithPortZero) {
    SpawnConfig config = build_server_harness_spawn_config(binary_identity(), 0, "/x/devui.log");

    EXPECT_EQ(config.command, "/usr/local/bin/devui");
    std::vector<std::string> expected = {"server-harness", "0", "/x/devui.log"};
    EXPECT_EQ(config.args, expected);
}

// Test: interpreted runtime launched without a script behaves like a binary
TEST(SpawnConfigTest, InterpretedWithoutScript) {
    RuntimeIdentity identity = node_identity();
    identity.kind = RuntimeKind::INTERPRETED_ALTERNATE;
    identity.executable_path = "/usr/local/bin/bun";
    identity.script_path.reset();

    SpawnConfig config = build_server_harness_spawn_config(identity, 4001, "/x/devui.log");
    std::vector<std::string> expected = {"server-harness", "4001", "/x/devui.log"};
    EXPECT_EQ(config.command, "/usr/local/bin/bun");
    EXPECT_EQ(config.args, expected);
}

// Test: boundary ports are accepted
TEST(SpawnConfigTest, AcceptsPortRangeBoundaries) {
    EXPECT_NO_THROW(build_server_harness_spawn_config(binary_identity(), 0, "/x.log"));
    EXPECT_NO_THROW(build_server_harness_spawn_config(binary_identity(), 65535, "/x.log"));
}

// Test: out of range, fractional and NaN ports are rejected with a field-specific message
TEST(SpawnConfigTest, RejectsInvalidPorts) {
    const double bad_ports[] = {-1, 65536, 3.14, std::numeric_limits<double>::quiet_NaN(),
                                std::numeric_limits<double>::infinity()};
    for (double port : bad_ports) {
        try {
            build_server_harness_spawn_config(binary_identity(), port, "/x.log");
            FAIL() << "port " << port << " was accepted";
        } catch (const SpawnConfigError& e) {
            EXPECT_NE(std::string(e.what()).find("Invalid port number"), std::string::npos);
            EXPECT_NE(std::string(e.what()).find("Must be between 0 and 65535"), std::string::npos);
        }
    }
}

// Test: the rejected value is named in the message
TEST(SpawnConfigTest, PortMessageNamesValue) {
    try {
        build_server_harness_spawn_config(binary_identity(), std::nan(""), "/x.log");
        FAIL();
    } catch (const SpawnConfigError& e) {
        EXPECT_STREQ(e.what(), "Invalid port number: NaN. Must be between 0 and 65535");
    }
    try {
        build_server_harness_spawn_config(binary_identity(), 3.14, "/x.log");
        FAIL();
    } catch (const SpawnConfigError& e) {
        EXPECT_STREQ(e.what(), "Invalid port number: 3.14. Must be between 0 and 65535");
    }
}

// Test: missing identity, executable or log path are configuration errors
TEST(SpawnConfigTest, RejectsMissingInputs) {
    EXPECT_THROW(build_server_harness_spawn_config(std::optional<RuntimeIdentity>{}, 4000, "/x.log"),
                 SpawnConfigError);

    RuntimeIdentity blank = binary_identity();
    blank.executable_path = "   ";
    EXPECT_THROW(build_server_harness_spawn_config(blank, 4000, "/x.log"), SpawnConfigError);

    EXPECT_THROW(build_server_harness_spawn_config(binary_identity(), 4000, ""), SpawnConfigError);
}

// Test: configuration errors are invalid_argument, not runtime errors
TEST(SpawnConfigTest, ConfigurationErrorIsInvalidArgument) {
    EXPECT_THROW(build_server_harness_spawn_config(binary_identity(), -1, "/x.log"),
                 std::invalid_argument);
}

// Test: executable validation never throws and requires the execute bit
TEST(SpawnConfigTest, ValidateExecutablePath) {
    test::TempDir dir;
    auto script = dir.path() / "tool.sh";
    test::write_file(script, "#!/bin/sh\nexit 0\n");

    EXPECT_FALSE(validate_executable_path(script.string()));
    chmod(script.c_str(), 0755);
    EXPECT_TRUE(validate_executable_path(script.string()));

    EXPECT_FALSE(validate_executable_path(""));
    EXPECT_FALSE(validate_executable_path((dir.path() / "missing").string()));
}
