#include <catch2/catch.hpp>

#include <string>

#include <Category.hpp>
#include <Command.hpp>

namespace codctl_command_test {

using namespace codctl;

constexpr auto musicBrainzId = "Wn8eRBtfLDfM0qjYPdxrz.Zjs_U-";
constexpr auto dbId          = "0123456789abcdef0123456789ABCDEF01234567";

TEST_CASE("The vocabulary knows every player command", "[Command]") {
    for (const auto *name : { "state", "source", "disc", "radio", "play", "pause", "play_pause", "next", "prev", "stop", "eject", "ejected", "quit", "version" }) {
        REQUIRE(findCommand(name) != nullptr);
    }
    REQUIRE(findCommand("rewind") == nullptr);
    REQUIRE(findCommand("state")->transport == Transport::RpcOnly);
    REQUIRE(findCommand("play")->transport == Transport::RpcOrFifo);
    REQUIRE(findCommand("play")->follow.empty());
}

TEST_CASE("Only state and source can be followed", "[Command]") {
    const auto state = findCommand("state")->follow;
    REQUIRE(std::vector<Category>(state.begin(), state.end()) == std::vector<Category>{ Category::State, Category::RipState });
    const auto source = findCommand("source")->follow;
    REQUIRE(std::vector<Category>(source.begin(), source.end()) == std::vector<Category>{ Category::Disc });
}

TEST_CASE("Disc ids are validated", "[Command]") {
    REQUIRE(isValidDiscId(musicBrainzId));
    REQUIRE_FALSE(isValidDiscId("Wn8eRBtfLDfM0qjYPdxrz.Zjs_U"));   // missing padding
    REQUIRE_FALSE(isValidDiscId("Wn8eRBtfLDfM0qjYPdxrz+Zjs/U-")); // standard base64 alphabet
    REQUIRE(isValidDbId(dbId));
    REQUIRE_FALSE(isValidDbId("0123456789abcdef0123456789abcdef0123456"));
    REQUIRE_FALSE(isValidDbId("0123456789abcdef0123456789abcdef0123456g"));

    REQUIRE(makeCommand("disc", { musicBrainzId }).arguments.front() == musicBrainzId);
    REQUIRE(makeCommand("disc", { dbId }).arguments.front() == dbId);
    REQUIRE(makeCommand("disc").arguments.empty());
    REQUIRE_THROWS_WITH(makeCommand("disc", { "abc123" }), "invalid disc or db id: abc123");
    REQUIRE_THROWS_AS(makeCommand("disc", { "abc123" }), InvalidArgumentError);
}

TEST_CASE("Commands are checked against the vocabulary", "[Command]") {
    REQUIRE_THROWS_AS(makeCommand("rewind"), UsageError);
    REQUIRE_THROWS_WITH(makeCommand("rewind"), "unknown command: rewind");
    REQUIRE_THROWS_WITH(makeCommand("play", { "now" }), "play takes at most 0 argument(s), got 1");
    REQUIRE_THROWS_WITH(makeCommand("radio", { "1", "2" }), "radio takes at most 1 argument(s), got 2");
    REQUIRE_THROWS_WITH(makeCommand("radio", { "" }), "invalid argument for radio: ''");
    REQUIRE_THROWS_AS(makeCommand("radio", { "" }), InvalidArgumentError);
    REQUIRE_THROWS_WITH(makeCommand("radio", { "two words" }), "invalid argument for radio: 'two words'");
}

TEST_CASE("The fifo token joins name and arguments", "[Command]") {
    REQUIRE(makeCommand("play").token() == "play");
    REQUIRE(makeCommand("radio", { "3" }).token() == "radio 3");
}

TEST_CASE("Categories map to their topic names", "[Category]") {
    for (const auto category : allCategories) {
        REQUIRE(parseCategory(categoryName(category)) == category);
    }
    REQUIRE(categoryName(Category::RipState) == "rip_state");
    REQUIRE_FALSE(parseCategory("state_extra"));
    REQUIRE_FALSE(parseCategory(""));
}

} // namespace codctl_command_test
