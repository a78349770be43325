#ifndef CODCTL_CLIENT_RPCCLIENT_HPP
#define CODCTL_CLIENT_RPCCLIENT_HPP

#include <cstdint>
#include <string>

#include <fmt/format.h>

#include <Command.hpp>
#include <Debug.hpp>
#include <Errors.hpp>
#include <zmq/ZmqUtils.hpp>

#include "EventLoop.hpp"
#include "PendingCalls.hpp"
#include "RpcMessage.hpp"

namespace codctl::client {

/*
 * Request/response side of the daemon protocol: a DEALER socket connected to the daemon's ROUTER.
 * dispatch() never blocks and never completes a call synchronously; replies are matched back to
 * their call through the PendingCalls registry when the event loop reports the socket readable.
 */
class RpcClient {
    EventLoop    &_loop;
    PendingCalls &_calls;
    std::string   _endpoint;
    zmq::Socket   _socket;

public:
    RpcClient(const zmq::Context &context, EventLoop &loop, PendingCalls &calls, std::string endpoint, const zmq::SocketOptions &options = {})
        : _loop(loop), _calls(calls), _endpoint(std::move(endpoint)), _socket(context, ZMQ_DEALER) {
        if (const auto result = zmq::initializeSocket(_socket, options); !result) {
            throw ConfigurationError(fmt::format("cannot configure rpc socket: {}", zmq_strerror(result.error())));
        }
        if (const auto result = zmq::invoke(zmq_connect, _socket, _endpoint); !result) {
            throw ConfigurationError(fmt::format("invalid rpc endpoint '{}': {}", _endpoint, zmq_strerror(result.error())));
        }
        _loop.watch(_socket, [this] { processIncoming(); });
    }

    RpcClient(const RpcClient &)            = delete;
    RpcClient &operator=(const RpcClient &) = delete;

    std::uint64_t dispatch(const Command &command, ResponseCallback onResponse, ErrorCallback onError) {
        const auto id = _calls.add(command.name, std::move(onResponse), std::move(onError));
        if (const auto result = zmq::sendMultipart(_socket, rpc::encodeRequest(id, command)); !result) {
            auto error = CallError{ .kind = ErrorKind::ClientTransport, .message = fmt::format("cannot send '{}' to {}: {}", command.name, _endpoint, zmq_strerror(result.error())) };
            _loop.callLater(0ms, [this, id, error = std::move(error)] { _calls.fail(id, error); });
        }
        return id;
    }

    // drains the socket, stops early if a continuation stopped the loop
    void processIncoming() {
        while (!_loop.isStopped()) {
            auto frames = zmq::receiveMultipart(_socket);
            if (!frames) {
                return;
            }
            handleReply(std::move(*frames));
        }
    }

private:
    void handleReply(std::vector<std::string> &&frames) {
        const auto reply = rpc::decodeReply(std::move(frames));
        if (!reply) {
            debug::log() << "dropping reply without readable request id from " << _endpoint;
            return;
        }
        if (!_calls.contains(reply->id)) {
            debug::log() << "dropping reply for unknown request id " << reply->id;
            return;
        }
        if (!reply->wellFormed) {
            _calls.fail(reply->id, CallError{ .kind = ErrorKind::ClientTransport, .message = fmt::format("malformed response from {}", _endpoint) });
            return;
        }
        switch (reply->status) {
        case rpc::Status::Ok:
            _calls.complete(reply->id, reply->payload);
            return;
        case rpc::Status::Error:
            _calls.fail(reply->id, CallError{ .kind = ErrorKind::DaemonCommand, .message = reply->payload });
            return;
        case rpc::Status::Unknown:
            break;
        }
        _calls.fail(reply->id, CallError{ .kind = ErrorKind::Unclassified, .message = fmt::format("unexpected reply status '{}': {}", reply->statusText, reply->payload) });
    }
};

} // namespace codctl::client

#endif // CODCTL_CLIENT_RPCCLIENT_HPP
