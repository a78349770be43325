#ifndef CODCTL_APP_COMMANDLINE_HPP
#define CODCTL_APP_COMMANDLINE_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <Command.hpp>
#include <Errors.hpp>
#include <Settings.hpp>
#include <codctl.hpp>

namespace codctl::app {

struct Options {
    std::optional<std::filesystem::path>     configFile;
    std::optional<std::chrono::milliseconds> timeout;
    bool                                     quiet   = false;
    bool                                     follow  = false;
    bool                                     fifo    = false;
    bool                                     verbose = false;
    bool                                     help    = false;
    Command                                  command;
};

inline std::string usage() {
    std::string text = fmt::format("Usage: {} [-c FILE] [-t SECONDS] [-q] [-f] [--fifo] [-v] COMMAND [ARGS...]\n\n", CLIENT_NAME);
    text += "Options:\n"
            "  -c, --config FILE      configuration file (default: $" + std::string(config::CONFIG_FILE_ENV) + " or " + std::string(config::DEFAULT_CONFIG_FILE) + ")\n"
            "  -t, --timeout SECONDS  give up waiting for the player after SECONDS\n"
            "  -q, --quiet            do not print responses\n"
            "  -f, --follow           keep printing state updates (state, source)\n"
            "      --fifo             send the command through the command fifo\n"
            "  -v, --verbose          print diagnostics to stderr\n"
            "  -h, --help             show this help\n\n"
            "Commands:\n";
    for (const auto &info : commands) {
        text += fmt::format("  {}{}\n", info.name, info.maxArguments > 0 ? " [ARG]" : "");
    }
    return text;
}

/**
 * Parses the arguments following the program name. Options have to precede the command,
 * everything after the command name is passed on as command arguments.
 * @throws UsageError on unknown options, missing values or an invalid command
 */
inline Options parseCommandLine(std::span<const std::string_view> args) {
    Options     options;
    std::size_t i = 0;

    const auto valueOf = [&](std::string_view option) {
        if (i + 1 >= args.size()) {
            throw UsageError(fmt::format("option {} requires a value", option));
        }
        return args[++i];
    };

    for (; i < args.size(); ++i) {
        const auto arg = args[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
            return options;
        } else if (arg == "-c" || arg == "--config") {
            options.configFile = std::filesystem::path(valueOf(arg));
        } else if (arg == "-t" || arg == "--timeout") {
            const auto value = valueOf(arg);
            options.timeout  = config::parseSeconds(value);
            if (!options.timeout) {
                throw UsageError(fmt::format("invalid timeout: {}", value));
            }
        } else if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
        } else if (arg == "-f" || arg == "--follow") {
            options.follow = true;
        } else if (arg == "--fifo") {
            options.fifo = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--") {
            ++i;
            break;
        } else if (arg.size() > 1 && arg.front() == '-') {
            throw UsageError(fmt::format("unknown option: {}", arg));
        } else {
            break;
        }
    }

    if (i >= args.size()) {
        throw UsageError("missing command");
    }
    const auto               name = args[i];
    std::vector<std::string> arguments;
    for (++i; i < args.size(); ++i) {
        arguments.emplace_back(args[i]);
    }
    options.command = makeCommand(name, std::move(arguments));

    const auto *info = findCommand(options.command.name);
    if (options.follow && info->follow.empty()) {
        throw UsageError(fmt::format("--follow is not supported by {}", info->name));
    }
    if (options.fifo && info->transport == Transport::RpcOnly) {
        throw UsageError(fmt::format("{} needs a response and cannot be sent through the fifo", info->name));
    }
    return options;
}

} // namespace codctl::app

#endif // CODCTL_APP_COMMANDLINE_HPP
