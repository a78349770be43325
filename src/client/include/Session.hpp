#ifndef CODCTL_CLIENT_SESSION_HPP
#define CODCTL_CLIENT_SESSION_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <Category.hpp>
#include <Command.hpp>
#include <Debug.hpp>
#include <Errors.hpp>
#include <Settings.hpp>
#include <zmq/ZmqUtils.hpp>

#include "ErrorClassifier.hpp"
#include "EventLoop.hpp"
#include "PendingCalls.hpp"
#include "RpcClient.hpp"
#include "StateSubscriber.hpp"

namespace codctl::client {

enum class Outcome {
    Completed,
    DaemonError,
    TransportError,
    TimedOut
};

struct SessionResult {
    Outcome outcome = Outcome::Completed;

    [[nodiscard]] int exitCode() const noexcept { return outcome == Outcome::Completed ? 0 : 1; }
};

struct SessionOptions {
    std::optional<std::chrono::milliseconds> timeout; // measured from run()
    bool                                     quiet = false;
    ErrorPolicy                              errorPolicy;
};

/*
 * One client invocation: any number of RPC calls, at most one state subscription and at most one
 * timeout, all bound to a single event loop. Calls and the subscription are set up before run();
 * run() blocks until the session ends and reports how it ended. Once the loop has stopped, every
 * still pending call is abandoned and no further callback fires.
 *
 * The session stops by itself as soon as no call is pending and no subscription is active, on a
 * daemon error, or when the timeout fires. The timeout is always reported.
 */
class Session {
    const zmq::Context            &_context;
    config::Settings               _settings;
    SessionOptions                 _options;
    std::ostream                  &_out;
    std::ostream                  &_err;
    ErrorClassifier                _classifier;
    EventLoop                      _loop;
    PendingCalls                   _calls;
    std::optional<RpcClient>       _rpc; // both refer to _loop and _calls, keep them declared after these
    std::optional<StateSubscriber> _subscriber;
    Outcome                        _outcome         = Outcome::Completed;
    bool                           _transportFailed = false;
    bool                           _ran             = false;
    std::size_t                    _received        = 0; // responses and state updates

public:
    Session(const zmq::Context &context, config::Settings settings, SessionOptions options, std::ostream &out, std::ostream &err)
        : _context(context), _settings(std::move(settings)), _options(options), _out(out), _err(err), _classifier(options.errorPolicy) {}

    Session(const Session &)            = delete;
    Session &operator=(const Session &) = delete;

    /**
     * Sends the command to the daemon. The response payload is handed to onResponse, or printed
     * unless quiet when no callback is given. Errors are routed through the ErrorClassifier.
     * @return the request id of the new call
     */
    std::uint64_t dispatch(const Command &command, ResponseCallback onResponse = {}) {
        requireSetupPhase();
        return rpcClient().dispatch(
                command,
                [this, onResponse = std::move(onResponse)](const std::string &payload) {
                    ++_received;
                    if (onResponse) {
                        onResponse(payload);
                    } else {
                        printResponse(payload);
                    }
                    stopIfIdle();
                },
                [this](const CallError &error) { handleError(error); });
    }

    // every update of the given categories is printed as it arrives
    void follow(std::span<const Category> categories) {
        StateSubscriber::Callbacks callbacks;
        for (const auto category : categories) {
            callbacks.emplace(category, [this](const std::string &payload) { fmt::print(_out, "{}\n", payload); });
        }
        follow(std::move(callbacks));
    }

    void follow(StateSubscriber::Callbacks callbacks) {
        requireSetupPhase();
        if (_subscriber) {
            throw std::logic_error("a session has at most one subscription");
        }
        for (auto &[category, callback] : callbacks) {
            callback = [this, inner = std::move(callback)](const std::string &payload) {
                ++_received;
                if (inner) {
                    inner(payload);
                }
            };
        }
        _subscriber.emplace(_context, _loop, _settings.stateEndpoint, _settings.socket);
        _subscriber->subscribe(std::move(callbacks));
    }

    // stops the session from within a callback, the first outcome reported wins
    void stop(Outcome outcome) {
        if (_loop.isStopped()) {
            return;
        }
        _outcome = outcome;
        _loop.stop();
    }

    SessionResult run() {
        requireSetupPhase();
        _ran = true;
        if (_calls.empty() && !isSubscribed()) {
            return SessionResult{ _outcome }; // nothing to wait for
        }
        if (_options.timeout) {
            _loop.callLater(*_options.timeout, [this] { onTimeout(); });
        }
        _loop.start();
        _calls.abandonAll();
        return SessionResult{ _outcome };
    }

    [[nodiscard]] bool        isSubscribed() const noexcept { return _subscriber && _subscriber->isSubscribed(); }
    [[nodiscard]] std::size_t pendingCalls() const noexcept { return _calls.size(); }

private:
    RpcClient &rpcClient() {
        if (!_rpc) {
            _rpc.emplace(_context, _loop, _calls, _settings.rpcEndpoint, _settings.socket);
        }
        return *_rpc;
    }

    void requireSetupPhase() const {
        if (_ran || _loop.state() != EventLoop::State::Idle) {
            throw std::logic_error("session is already running or finished");
        }
    }

    void printResponse(const std::string &payload) {
        if (_options.quiet || payload.empty()) {
            return;
        }
        fmt::print(_out, "{}\n", payload);
    }

    void handleError(const CallError &error) {
        const auto action = _classifier.classify(error); // throws UnclassifiedError
        fmt::print(_err, "{}\n", ErrorClassifier::describe(error));
        if (error.kind == ErrorKind::ClientTransport) {
            _transportFailed = true;
        }
        if (action == ErrorAction::StopSession) {
            stop(error.kind == ErrorKind::DaemonCommand ? Outcome::DaemonError : Outcome::TransportError);
            return;
        }
        stopIfIdle();
    }

    void stopIfIdle() {
        if (_calls.empty() && !isSubscribed()) {
            stop(_transportFailed ? Outcome::TransportError : Outcome::Completed);
        }
    }

    // the timeout always ends the session; a follow session that got all its answers still counts as completed
    void onTimeout() {
        fmt::print(_err, "timeout waiting for response\n");
        if (!_calls.empty() || (isSubscribed() && _received == 0)) {
            stop(Outcome::TimedOut);
            return;
        }
        stop(_transportFailed ? Outcome::TransportError : Outcome::Completed);
    }
};

} // namespace codctl::client

#endif // CODCTL_CLIENT_SESSION_HPP
