#ifndef CODCTL_CLIENT_EVENTLOOP_HPP
#define CODCTL_CLIENT_EVENTLOOP_HPP

#include <algorithm>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <zmq/ZmqUtils.hpp>

namespace codctl::client {

using namespace std::chrono_literals;

/*
 * Single threaded cooperative reactor: multiplexes readability of the registered zmq sockets and
 * one-shot timers through zmq_poll. Exactly one callback runs at a time and always to completion.
 * start() blocks until stop() is called from within a callback; after stop() nothing else runs,
 * not even a timer that is already due.
 */
class EventLoop {
public:
    using Clock   = std::chrono::steady_clock;
    using Handler = std::function<void()>;
    using TimerId = std::size_t;

    enum class State {
        Idle,
        Running,
        Stopped
    };

private:
    struct Timer {
        TimerId           id;
        Clock::time_point deadline;
        Handler           callback;
    };

    State                       _state = State::Idle;
    std::vector<zmq_pollitem_t> _pollItems;
    std::vector<Handler>        _readHandlers; // same index as _pollItems
    std::vector<Timer>          _timers;
    TimerId                     _nextTimerId = 0;

public:
    EventLoop()                             = default;
    EventLoop(const EventLoop &)            = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    [[nodiscard]] State       state() const noexcept { return _state; }
    [[nodiscard]] bool        isRunning() const noexcept { return _state == State::Running; }
    [[nodiscard]] bool        isStopped() const noexcept { return _state == State::Stopped; }
    [[nodiscard]] std::size_t pendingTimers() const noexcept { return _timers.size(); }

    // the handler has to drain the socket, it is only called again once new data arrives
    void watch(const zmq::Socket &socket, Handler onReadable) {
        if (_state == State::Running) {
            throw std::logic_error("sockets have to be registered before the event loop is started");
        }
        _pollItems.push_back({ .socket = socket.zmq_ptr, .fd = 0, .events = ZMQ_POLLIN, .revents = 0 });
        _readHandlers.push_back(std::move(onReadable));
    }

    // one-shot, a zero delay defers the callback to the next loop iteration
    TimerId callLater(std::chrono::milliseconds delay, Handler callback) {
        const auto id = _nextTimerId++;
        _timers.push_back(Timer{ .id = id, .deadline = Clock::now() + delay, .callback = std::move(callback) });
        return id;
    }

    bool cancel(TimerId id) {
        return std::erase_if(_timers, [id](const Timer &timer) { return timer.id == id; }) > 0;
    }

    void start() {
        if (_state != State::Idle) {
            throw std::logic_error("event loop can only be started once");
        }
        _state = State::Running;
        while (_state == State::Running) {
            if (_pollItems.empty() && _timers.empty()) {
                _state = State::Stopped; // nothing left that could ever wake us up
                break;
            }
            const auto result = zmq::invoke(zmq_poll, _pollItems.data(), static_cast<int>(_pollItems.size()), pollTimeout());
            if (!result) {
                if (result.error() == EINTR) {
                    continue;
                }
                _state = State::Stopped;
                throw std::system_error(result.error(), std::generic_category(), "zmq_poll");
            }
            dispatchReadable();
            fireDueTimers();
        }
        _timers.clear();
    }

    void stop() noexcept {
        _state = State::Stopped;
    }

private:
    long pollTimeout() const {
        if (_timers.empty()) {
            return -1;
        }
        const auto next = std::ranges::min_element(_timers, {}, &Timer::deadline)->deadline;
        const auto now  = Clock::now();
        if (next <= now) {
            return 0;
        }
        return static_cast<long>(std::chrono::ceil<std::chrono::milliseconds>(next - now).count());
    }

    void dispatchReadable() {
        for (std::size_t i = 0; i < _pollItems.size() && _state == State::Running; ++i) {
            if ((_pollItems[i].revents & ZMQ_POLLIN) != 0) {
                _readHandlers[i]();
            }
        }
    }

    void fireDueTimers() {
        const auto    now   = Clock::now();
        const TimerId limit = _nextTimerId; // timers added by callbacks wait for the next iteration
        while (_state == State::Running) {
            auto due = _timers.end();
            for (auto it = _timers.begin(); it != _timers.end(); ++it) {
                if (it->id < limit && it->deadline <= now && (due == _timers.end() || it->deadline < due->deadline || (it->deadline == due->deadline && it->id < due->id))) {
                    due = it;
                }
            }
            if (due == _timers.end()) {
                return;
            }
            auto callback = std::move(due->callback);
            _timers.erase(due); // removed before it fires, a timer can never fire twice
            callback();
        }
    }
};

} // namespace codctl::client

#endif // CODCTL_CLIENT_EVENTLOOP_HPP
