#include <catch2/catch.hpp>

#include <string_view>
#include <vector>

#include <CommandLine.hpp>

namespace codctl_commandline_test {

using codctl::Command;
using codctl::UsageError;
using codctl::app::Options;
using codctl::app::parseCommandLine;
using namespace std::chrono_literals;

Options parse(std::vector<std::string_view> args) {
    return parseCommandLine(args);
}

TEST_CASE("A bare command uses the defaults", "[CommandLine]") {
    const auto options = parse({ "play" });
    REQUIRE(options.command == Command{ "play", {} });
    REQUIRE_FALSE(options.configFile);
    REQUIRE_FALSE(options.timeout);
    REQUIRE_FALSE(options.quiet);
    REQUIRE_FALSE(options.follow);
    REQUIRE_FALSE(options.fifo);
    REQUIRE_FALSE(options.verbose);
}

TEST_CASE("Options precede the command", "[CommandLine]") {
    const auto options = parse({ "-c", "/tmp/codctl.conf", "--timeout", "2", "-q", "-v", "-f", "state" });
    REQUIRE(options.configFile);
    REQUIRE(options.configFile->string() == "/tmp/codctl.conf");
    REQUIRE(options.timeout == 2000ms);
    REQUIRE(options.quiet);
    REQUIRE(options.verbose);
    REQUIRE(options.follow);
    REQUIRE(options.command.name == "state");
}

TEST_CASE("Arguments after the command belong to it", "[CommandLine]") {
    const auto options = parse({ "radio", "3" });
    REQUIRE(options.command == Command{ "radio", { "3" } });
    REQUIRE(parse({ "--", "radio", "-1" }).command == Command{ "radio", { "-1" } });
}

TEST_CASE("Help wins over everything else", "[CommandLine]") {
    REQUIRE(parse({ "-h" }).help);
    REQUIRE(parse({ "-q", "--help", "no-such-command" }).help);
}

TEST_CASE("Invalid command lines are usage errors", "[CommandLine]") {
    REQUIRE_THROWS_WITH(parse({}), "missing command");
    REQUIRE_THROWS_WITH(parse({ "-q" }), "missing command");
    REQUIRE_THROWS_WITH(parse({ "-x", "play" }), "unknown option: -x");
    REQUIRE_THROWS_WITH(parse({ "play", "-t" }), "play takes at most 0 argument(s), got 1");
    REQUIRE_THROWS_WITH(parse({ "-t" }), "option -t requires a value");
    REQUIRE_THROWS_WITH(parse({ "-t", "0", "play" }), "invalid timeout: 0");
    REQUIRE_THROWS_WITH(parse({ "-t", "abc", "play" }), "invalid timeout: abc");
    REQUIRE_THROWS_WITH(parse({ "rewind" }), "unknown command: rewind");
    REQUIRE_THROWS_WITH(parse({ "disc", "abc123" }), "invalid disc or db id: abc123");
}

TEST_CASE("Follow and fifo are restricted to suitable commands", "[CommandLine]") {
    REQUIRE(parse({ "--follow", "source" }).follow);
    REQUIRE_THROWS_WITH(parse({ "--follow", "play" }), "--follow is not supported by play");
    REQUIRE(parse({ "--fifo", "play_pause" }).fifo);
    REQUIRE_THROWS_AS(parse({ "--fifo", "state" }), UsageError);
    REQUIRE_THROWS_AS(parse({ "--fifo", "version" }), UsageError);
}

TEST_CASE("Usage lists every command", "[CommandLine]") {
    const auto text = codctl::app::usage();
    for (const auto &info : codctl::commands) {
        REQUIRE(text.find(info.name) != std::string::npos);
    }
}

} // namespace codctl_commandline_test
