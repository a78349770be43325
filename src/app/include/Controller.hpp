#ifndef CODCTL_APP_CONTROLLER_HPP
#define CODCTL_APP_CONTROLLER_HPP

#include <ostream>
#include <span>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <Command.hpp>
#include <Debug.hpp>
#include <Errors.hpp>
#include <FifoSender.hpp>
#include <Session.hpp>
#include <Settings.hpp>
#include <codctl.hpp>
#include <zmq/ZmqUtils.hpp>

#include "CommandLine.hpp"

namespace codctl::app {

/**
 * Runs one parsed invocation: either a single write to the command fifo or an RPC session,
 * optionally following the state feed. The command-line timeout takes precedence over the configured one.
 * @return the process exit status of a finished session
 * @throws FifoError if the fifo write fails, ConfigurationError for unusable endpoints
 */
inline int runCommand(const Options &options, const config::Settings &settings, const zmq::Context &context, std::ostream &out, std::ostream &err) {
    const auto &command = options.command;
    if (options.fifo) {
        client::sendFifoCommand(settings.cmdFifo, command.token());
        return 0;
    }

    if (command.name == "version") {
        fmt::print(out, "{} version {}\n", CLIENT_NAME, VERSION);
    }

    client::SessionOptions sessionOptions;
    sessionOptions.timeout = options.timeout ? options.timeout : settings.timeout;
    sessionOptions.quiet   = options.quiet;

    client::Session session(context, settings, sessionOptions, out, err);
    if (options.follow) {
        // subscribe first, so no update published after the daemon answered the call is missed
        session.follow(findCommand(command.name)->follow);
    }
    session.dispatch(command);
    const auto result = session.run();
    debug::log() << command.name << " finished with exit code " << result.exitCode();
    return result.exitCode();
}

/**
 * Whole client invocation for the arguments following the program name, returning the exit status:
 * 0 on success, 1 for invalid argument values and for config, fifo, daemon, transport and timeout
 * errors, 2 for any other usage error. UnclassifiedError is not handled here.
 */
inline int run(std::span<const std::string_view> args, std::ostream &out, std::ostream &err) {
    Options options;
    try {
        options = parseCommandLine(args);
    } catch (const InvalidArgumentError &e) {
        fmt::print(err, "{}\n", e.what());
        return 1;
    } catch (const UsageError &e) {
        fmt::print(err, "{}: {}\n\n{}", CLIENT_NAME, e.what(), usage());
        return 2;
    }
    if (options.help) {
        fmt::print(out, "{}", usage());
        return 0;
    }
    debug::setEnabled(options.verbose);

    try {
        const auto   settings = config::resolveSettings(options.configFile);
        zmq::Context context;
        return runCommand(options, settings, context, out, err);
    } catch (const ConfigurationError &e) {
        fmt::print(err, "{}: {}\n", CLIENT_NAME, e.what());
        return 1;
    } catch (const FifoError &e) {
        fmt::print(err, "{}: {}\n", CLIENT_NAME, e.what());
        return 1;
    }
}

} // namespace codctl::app

#endif // CODCTL_APP_CONTROLLER_HPP
