#include <catch2/catch.hpp>

#include <chrono>
#include <string>

#include <PendingCalls.hpp>

namespace codctl_pendingcalls_test {

using codctl::CallError;
using codctl::ErrorKind;
using codctl::client::PendingCalls;

TEST_CASE("Each call completes exactly once", "[PendingCalls]") {
    PendingCalls calls;
    int          responses = 0;
    int          errors    = 0;
    std::string  payload;
    const auto   id = calls.add(
            "play", [&](const std::string &p) { ++responses; payload = p; }, [&](const CallError &) { ++errors; });
    REQUIRE(calls.contains(id));
    REQUIRE(calls.find(id)->method == "play");
    REQUIRE(calls.find(id)->created <= std::chrono::steady_clock::now());

    REQUIRE(calls.complete(id, "Playing"));
    REQUIRE_FALSE(calls.complete(id, "again"));
    REQUIRE_FALSE(calls.fail(id, CallError{ .kind = ErrorKind::DaemonCommand, .message = "late" }));
    REQUIRE(responses == 1);
    REQUIRE(errors == 0);
    REQUIRE(payload == "Playing");
    REQUIRE(calls.empty());
}

TEST_CASE("Errors go to the error continuation only", "[PendingCalls]") {
    PendingCalls calls;
    int          responses = 0;
    CallError    received;
    const auto   id = calls.add(
            "stop", [&](const std::string &) { ++responses; }, [&](const CallError &error) { received = error; });
    REQUIRE(calls.fail(id, CallError{ .kind = ErrorKind::DaemonCommand, .message = "not playing" }));
    REQUIRE(responses == 0);
    REQUIRE(received.kind == ErrorKind::DaemonCommand);
    REQUIRE(received.message == "not playing");
}

TEST_CASE("Unknown ids have no effect", "[PendingCalls]") {
    PendingCalls calls;
    int          responses = 0;
    const auto   id        = calls.add("state", [&](const std::string &) { ++responses; }, {});
    REQUIRE_FALSE(calls.complete(id + 1, "stale"));
    REQUIRE_FALSE(calls.complete(0, "foreign"));
    REQUIRE(responses == 0);
    REQUIRE(calls.size() == 1);
}

TEST_CASE("Ids are unique while pending", "[PendingCalls]") {
    PendingCalls calls;
    const auto   first  = calls.add("play", {}, {});
    const auto   second = calls.add("next", {}, {});
    REQUIRE(first != 0);
    REQUIRE(first != second);
    REQUIRE(calls.complete(first, ""));
    const auto third = calls.add("prev", {}, {});
    REQUIRE(third != second);
    REQUIRE(calls.size() == 2);
}

TEST_CASE("A continuation may dispatch a new call", "[PendingCalls]") {
    PendingCalls  calls;
    std::uint64_t followUp = 0;
    const auto    id       = calls.add(
            "state", [&](const std::string &) { followUp = calls.add("source", {}, {}); }, {});
    REQUIRE(calls.complete(id, "{}"));
    REQUIRE(followUp != 0);
    REQUIRE(calls.contains(followUp));
    REQUIRE_FALSE(calls.contains(id));
}

TEST_CASE("Abandoned calls never complete", "[PendingCalls]") {
    PendingCalls calls;
    bool         completed = false;
    const auto   id        = calls.add("play", [&](const std::string &) { completed = true; }, [&](const CallError &) { completed = true; });
    calls.abandonAll();
    REQUIRE(calls.empty());
    REQUIRE_FALSE(calls.complete(id, "Playing"));
    REQUIRE_FALSE(completed);
}

} // namespace codctl_pendingcalls_test
