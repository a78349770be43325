#ifndef CODCTL_CLIENT_STATESUBSCRIBER_HPP
#define CODCTL_CLIENT_STATESUBSCRIBER_HPP

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <system_error>

#include <fmt/format.h>

#include <Category.hpp>
#include <Debug.hpp>
#include <Errors.hpp>
#include <zmq/ZmqUtils.hpp>

#include "EventLoop.hpp"

namespace codctl::client {

/*
 * Live state feed: a SUB socket on the daemon's publish endpoint. Every message ([category] [payload])
 * of a subscribed category is handed to that category's callback in arrival order, without
 * coalescing or deduplication. There is no natural end, the feed lives until the event loop stops.
 */
class StateSubscriber {
public:
    using Callback  = std::function<void(const std::string &payload)>;
    using Callbacks = std::map<Category, Callback>;

private:
    EventLoop  &_loop;
    std::string _endpoint;
    zmq::Socket _socket;
    Callbacks   _callbacks;
    std::size_t _delivered = 0;

public:
    StateSubscriber(const zmq::Context &context, EventLoop &loop, std::string endpoint, const zmq::SocketOptions &options = {})
        : _loop(loop), _endpoint(std::move(endpoint)), _socket(context, ZMQ_SUB) {
        if (const auto result = zmq::initializeSocket(_socket, options); !result) {
            throw ConfigurationError(fmt::format("cannot configure state socket: {}", zmq_strerror(result.error())));
        }
        if (const auto result = zmq::invoke(zmq_connect, _socket, _endpoint); !result) {
            throw ConfigurationError(fmt::format("invalid state endpoint '{}': {}", _endpoint, zmq_strerror(result.error())));
        }
    }

    StateSubscriber(const StateSubscriber &)            = delete;
    StateSubscriber &operator=(const StateSubscriber &) = delete;

    void subscribe(Callbacks callbacks) {
        if (!_callbacks.empty()) {
            throw std::logic_error("state feed is already subscribed");
        }
        if (callbacks.empty()) {
            throw std::logic_error("subscription without any category");
        }
        for (const auto &[category, callback] : callbacks) {
            const auto topic = categoryName(category);
            if (const auto result = zmq::invoke(zmq_setsockopt, _socket, ZMQ_SUBSCRIBE, topic.data(), topic.size()); !result) {
                throw std::system_error(result.error(), std::generic_category(), fmt::format("cannot subscribe to '{}'", topic));
            }
        }
        _callbacks = std::move(callbacks);
        _loop.watch(_socket, [this] { processIncoming(); });
    }

    [[nodiscard]] bool        isSubscribed() const noexcept { return !_callbacks.empty(); }
    [[nodiscard]] std::size_t delivered() const noexcept { return _delivered; }

    void processIncoming() {
        while (!_loop.isStopped()) {
            auto frames = zmq::receiveMultipart(_socket);
            if (!frames) {
                return;
            }
            deliver(std::move(*frames));
        }
    }

private:
    void deliver(std::vector<std::string> &&frames) {
        if (frames.size() != 2) {
            debug::log() << "dropping state message with " << frames.size() << " frame(s)";
            return;
        }
        // zmq subscriptions are prefix matches, the category has to match exactly
        const auto category = parseCategory(frames[0]);
        if (!category) {
            debug::log() << "dropping state message of unknown category '" << frames[0] << "'";
            return;
        }
        const auto it = _callbacks.find(*category);
        if (it == _callbacks.end()) {
            return;
        }
        ++_delivered;
        if (it->second) {
            it->second(frames[1]);
        }
    }
};

} // namespace codctl::client

#endif // CODCTL_CLIENT_STATESUBSCRIBER_HPP
