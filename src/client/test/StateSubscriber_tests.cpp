#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include <EventLoop.hpp>
#include <StateSubscriber.hpp>

#include "MockDaemon.hpp"

namespace codctl_statesubscriber_test {

using codctl::Category;
using codctl::client::EventLoop;
using codctl::client::StateSubscriber;
using codctl::test::MockDaemon;
using namespace codctl;
using namespace std::chrono_literals;

MockDaemon::Handler noReplies() {
    return [](const test::Request &) { return std::vector<MockDaemon::Message>{}; };
}

TEST_CASE("Updates are delivered in arrival order per category", "[StateSubscriber]") {
    const zmq::Context context;
    MockDaemon         daemon(context, noReplies());
    daemon.publishOnSubscribe("state", { { "state", "s1" }, { "state", "s2" }, { "state", "s3" } });
    daemon.publishOnSubscribe("rip_state", { { "rip_state", "r1" }, { "rip_state", "r2" } });

    EventLoop                loop;
    StateSubscriber          subscriber(context, loop, daemon.stateAddress());
    std::vector<std::string> states;
    std::vector<std::string> ripStates;
    const auto               stopWhenDone = [&] {
        if (states.size() == 3 && ripStates.size() == 2) {
            loop.stop();
        }
    };
    subscriber.subscribe({ { Category::State, [&](const std::string &payload) { states.push_back(payload); stopWhenDone(); } },
            { Category::RipState, [&](const std::string &payload) { ripStates.push_back(payload); stopWhenDone(); } } });
    REQUIRE(subscriber.isSubscribed());
    loop.callLater(2s, [&] { loop.stop(); });
    loop.start();

    REQUIRE(states == std::vector<std::string>{ "s1", "s2", "s3" });
    REQUIRE(ripStates == std::vector<std::string>{ "r1", "r2" });
    REQUIRE(subscriber.delivered() == 5);
}

TEST_CASE("Only exact category matches are delivered", "[StateSubscriber]") {
    const zmq::Context context;
    MockDaemon         daemon(context, noReplies());
    // zmq matches topics by prefix, so these reach the subscriber and have to be dropped there
    daemon.publishOnSubscribe("state", { { "state_extra", "x" }, { "state", "a", "b" }, { "state" }, { "state", "s1" } });

    EventLoop                loop;
    StateSubscriber          subscriber(context, loop, daemon.stateAddress());
    std::vector<std::string> states;
    subscriber.subscribe({ { Category::State, [&](const std::string &payload) { states.push_back(payload); } } });
    loop.callLater(300ms, [&] { loop.stop(); });
    loop.start();

    REQUIRE(states == std::vector<std::string>{ "s1" });
    REQUIRE(subscriber.delivered() == 1);
    REQUIRE(daemon.subscriptions() == std::vector<std::string>{ "state" });
}

TEST_CASE("Subscribing twice or to nothing is rejected", "[StateSubscriber]") {
    const zmq::Context context;
    EventLoop          loop;
    StateSubscriber    subscriber(context, loop, "inproc://StateSubscriberNoPublisher");
    REQUIRE_THROWS_AS(subscriber.subscribe({}), std::logic_error);
    subscriber.subscribe({ { Category::Disc, [](const std::string &) {} } });
    REQUIRE_THROWS_AS(subscriber.subscribe({ { Category::State, [](const std::string &) {} } }), std::logic_error);
}

TEST_CASE("Invalid state endpoints are configuration errors", "[StateSubscriber]") {
    const zmq::Context context;
    EventLoop          loop;
    REQUIRE_THROWS_AS(StateSubscriber(context, loop, "nonsense://endpoint"), ConfigurationError);
}

} // namespace codctl_statesubscriber_test
