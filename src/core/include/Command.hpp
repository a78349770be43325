#ifndef CODCTL_COMMAND_HPP
#define CODCTL_COMMAND_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <Category.hpp>
#include <Errors.hpp>

namespace codctl {

/**
 * A single player command: its name doubles as RPC method name and as fifo token,
 * the arguments are passed on positionally. Built once from validated input and never mutated.
 */
struct Command {
    std::string              name;
    std::vector<std::string> arguments;

    // fifo representation: name and arguments separated by single spaces
    [[nodiscard]] std::string token() const {
        std::string result = name;
        for (const auto &arg : arguments) {
            result += ' ';
            result += arg;
        }
        return result;
    }

    bool operator==(const Command &) const = default;
};

enum class Transport {
    RpcOnly,  ///< needs a response, cannot be sent through the fifo
    RpcOrFifo
};

struct CommandInfo {
    std::string_view          name;
    std::size_t               maxArguments = 0;
    Transport                 transport    = Transport::RpcOrFifo;
    std::span<const Category> follow{}; ///< categories printed by --follow, empty if not followable
};

namespace detail {
constexpr std::array stateFollow{ Category::State, Category::RipState };
constexpr std::array sourceFollow{ Category::Disc };
} // namespace detail

// clang-format off
constexpr std::array<CommandInfo, 14> commands{ {
    { "state",      0, Transport::RpcOnly,   detail::stateFollow },
    { "source",     0, Transport::RpcOnly,   detail::sourceFollow },
    { "disc",       1, Transport::RpcOrFifo, {} },
    { "radio",      1, Transport::RpcOrFifo, {} },
    { "play",       0, Transport::RpcOrFifo, {} },
    { "pause",      0, Transport::RpcOrFifo, {} },
    { "play_pause", 0, Transport::RpcOrFifo, {} },
    { "next",       0, Transport::RpcOrFifo, {} },
    { "prev",       0, Transport::RpcOrFifo, {} },
    { "stop",       0, Transport::RpcOrFifo, {} },
    { "eject",      0, Transport::RpcOrFifo, {} },
    { "ejected",    0, Transport::RpcOrFifo, {} },
    { "quit",       0, Transport::RpcOrFifo, {} },
    { "version",    0, Transport::RpcOnly,   {} },
} };
// clang-format on

constexpr const CommandInfo *findCommand(std::string_view name) noexcept {
    const auto it = std::ranges::find(commands, name, &CommandInfo::name);
    return it == commands.end() ? nullptr : &*it;
}

// MusicBrainz disc id: 27 characters of the url-safe base64 alphabet ('.', '_' instead of '+', '/') and a '-' padding
inline bool isValidDiscId(std::string_view id) noexcept {
    if (id.size() != 28 || id.back() != '-') {
        return false;
    }
    return std::ranges::all_of(id.substr(0, 27), [](unsigned char c) { return std::isalnum(c) || c == '.' || c == '_'; });
}

// database id: hex encoding of the 20 byte disc id
inline bool isValidDbId(std::string_view id) noexcept {
    return id.size() == 40 && std::ranges::all_of(id, [](unsigned char c) { return std::isxdigit(c) != 0; });
}

/**
 * Validates name and arguments against the command vocabulary.
 * @throws UsageError for unknown commands or surplus arguments
 * @throws InvalidArgumentError for argument values the command cannot accept
 */
inline Command makeCommand(std::string_view name, std::vector<std::string> arguments = {}) {
    const auto *info = findCommand(name);
    if (info == nullptr) {
        throw UsageError(fmt::format("unknown command: {}", name));
    }
    if (arguments.size() > info->maxArguments) {
        throw UsageError(fmt::format("{} takes at most {} argument(s), got {}", name, info->maxArguments, arguments.size()));
    }
    for (const auto &arg : arguments) {
        if (arg.empty() || std::ranges::any_of(arg, [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); })) {
            throw InvalidArgumentError(fmt::format("invalid argument for {}: '{}'", name, arg));
        }
    }
    if (name == "disc" && !arguments.empty() && !isValidDiscId(arguments[0]) && !isValidDbId(arguments[0])) {
        throw InvalidArgumentError(fmt::format("invalid disc or db id: {}", arguments[0]));
    }
    return Command{ std::string(name), std::move(arguments) };
}

} // namespace codctl

#endif // CODCTL_COMMAND_HPP
