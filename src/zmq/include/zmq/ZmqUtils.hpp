#ifndef CODCTL_ZMQ_UTILS_HPP
#define CODCTL_ZMQ_UTILS_HPP

// A few thin RAII-only wrappers for ZMQ structures

// core
#include <Debug.hpp>

#include <zmq.h>

#include <cassert>
#include <cerrno>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#ifndef CODCTL_ENABLE_RESULT_CHECKS
#define CODCTL_ENABLE_RESULT_CHECKS 1
#endif

namespace codctl::zmq {

template<typename T>
class [[nodiscard]] Result {
private:
    /*const*/ T   _value;
    /*const*/ int _error = 0;

#if (CODCTL_ENABLE_RESULT_CHECKS)
    // This serves just to check whether we
    // verified that the result is correct or not
    mutable bool _ignoreError = false;
#endif
public:
    int error() const {
        assert(!isValid());
        return _error;
    }

    void ignoreResult([[maybe_unused]] const std::source_location location = std::source_location::current()) {
#if (CODCTL_ENABLE_RESULT_CHECKS)
        if (!isValid()) {
            debug::withLocation(location) << "Ignored error result:" << zmq_strerror(_error);
        }
        _ignoreError = true;
#endif
    };

    bool isValid() const {
#if (CODCTL_ENABLE_RESULT_CHECKS)
        _ignoreError = true;
#endif
        return _value >= 0;
    }

    explicit operator bool() const { return isValid(); }

    explicit constexpr Result(const T value)
        : _value{ value } {
        if (!isValid()) {
            _error = errno;
        }
    }

    ~Result() {
#if (CODCTL_ENABLE_RESULT_CHECKS)
        assert(_ignoreError || isValid());
#endif
    }

    Result(const Result &other)
        : _value(other._value)
        , _error(other._error)
#if (CODCTL_ENABLE_RESULT_CHECKS)
        , _ignoreError(other._ignoreError)
#endif
    {
    }

    Result &operator=(Result other) {
        std::swap(_value, other._value);
        std::swap(_error, other._error);
#if (CODCTL_ENABLE_RESULT_CHECKS)
        other._ignoreError = true;
#endif
        return *this;
    }

    // both operands are always evaluated, so both count as checked
    Result operator&&(const Result &other) const {
        other.isValid();
        return isValid() ? other : *this;
    }
};

namespace detail {

template<typename T>
concept ZmqPtrWrapper = requires(T s) {
    s.zmq_ptr;
};

template<typename Arg, typename ArgValueType = std::remove_cvref_t<Arg>>
constexpr decltype(auto) passArgument(Arg &&arg) {
    if constexpr (ZmqPtrWrapper<ArgValueType>) {
        return arg.zmq_ptr;
    } else if constexpr (std::is_same_v<ArgValueType, std::string>) {
        return arg.data();
    } else {
        return std::forward<Arg>(arg);
    }
}
} // namespace detail

template<typename Function, typename... Args>
[[nodiscard]] auto invoke(const Function &&f, Args &&...args) {
    static_assert((not std::is_same_v<std::remove_cvref_t<Args>, void *> && ...));
    auto result = f(detail::passArgument(std::forward<Args>(args))...);
    return Result{ result };
}

struct ZmqPtr {
    void *zmq_ptr;
    explicit ZmqPtr(void *_ptr)
        : zmq_ptr{ _ptr } { assert(zmq_ptr != nullptr); }
    ZmqPtr()         = delete;
    ZmqPtr(ZmqPtr &) = delete;
    ZmqPtr(ZmqPtr &&other) noexcept
        : zmq_ptr{ other.zmq_ptr } {
        other.zmq_ptr = nullptr;
    }
    ZmqPtr &operator=(const ZmqPtr &) = delete;
};

struct Context : ZmqPtr {
    Context()
        : ZmqPtr{ zmq_ctx_new() } {}
    Context(Context &&other) = default;
    ~Context() {
        if (zmq_ptr != nullptr) {
            zmq_ctx_term(zmq_ptr);
        }
    }
};

struct Socket : ZmqPtr {
    Socket(const Context &context, const int type)
        : ZmqPtr(zmq_socket(context.zmq_ptr, type)) {
    }
    Socket()               = delete;
    Socket(Socket &&other) = default;
    ~Socket() {
        if (zmq_ptr != nullptr) {
            zmq_close(zmq_ptr);
        }
    }
};

struct SocketOptions {
    int highWaterMark = 1000;
    int linger        = 0; // ms, a daemon that is not running must never delay the exit of the client
};

inline Result<int> initializeSocket(const Socket &sock, const SocketOptions &options = {}) {
    return invoke(zmq_setsockopt, sock, ZMQ_SNDHWM, &options.highWaterMark, sizeof(options.highWaterMark))
        && invoke(zmq_setsockopt, sock, ZMQ_RCVHWM, &options.highWaterMark, sizeof(options.highWaterMark))
        && invoke(zmq_setsockopt, sock, ZMQ_LINGER, &options.linger, sizeof(options.linger));
}

class MessageFrame {
private:
    bool _owning = true;

    // mutable as 0mq API knows no const
    mutable zmq_msg_t _message;

public:
    MessageFrame()
        : _message() { zmq_msg_init(&_message); }

    explicit MessageFrame(std::string &&buf) {
        auto copy = new std::string(std::move(buf));
        zmq_msg_init_data(
                &_message, copy->data(), copy->size(),
                [](void * /*unused*/, void *bufOwned) {
                    delete static_cast<std::string *>(bufOwned);
                },
                copy);
    }

    ~MessageFrame() {
        if (_owning) {
            zmq_msg_close(&_message);
        }
    }

    MessageFrame(const MessageFrame &other)            = delete;
    MessageFrame &operator=(const MessageFrame &other) = delete;

    // Reads a message from the socket
    // Returns the number of received bytes
    Result<int> receive(const Socket &socket, int flags) {
        auto result = zmq::invoke(zmq_msg_recv, &_message, socket, flags);
        _owning     = result.isValid();
        return result;
    }

    // Sending is not const as 0mq nullifies the message
    // See: http://api.zeromq.org/3-2:zmq-msg-send
    [[nodiscard]] auto send(const Socket &socket, int flags) {
        auto result = zmq::invoke(zmq_msg_send, &_message, socket, flags);
        _owning     = !result.isValid();
        return result;
    }

    [[nodiscard]] std::size_t size() const {
        return zmq_msg_size(&_message);
    }

    std::string_view data() const {
        return { static_cast<char *>(zmq_msg_data(&_message)), size() };
    }
};

/**
 * Sends all parts as one multipart message without blocking. Returns the first failing
 * result (e.g. EAGAIN if no peer can take the message) or the result of the last frame.
 */
[[nodiscard]] inline Result<int> sendMultipart(const Socket &socket, std::vector<std::string> &&parts) {
    assert(!parts.empty());
    Result<int> result{ 0 };
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const int    flags = i + 1 == parts.size() ? ZMQ_DONTWAIT : ZMQ_DONTWAIT | ZMQ_SNDMORE;
        MessageFrame frame{ std::move(parts[i]) };
        result = frame.send(socket, flags);
        if (!result) {
            return result;
        }
    }
    return result;
}

/**
 * Receives one complete multipart message without blocking.
 * Returns nullopt if no message is pending or the socket reported an error.
 */
[[nodiscard]] inline std::optional<std::vector<std::string>> receiveMultipart(const Socket &socket) {
    std::vector<std::string> parts;
    while (true) {
        MessageFrame frame;
        if (const auto byteCountResult = frame.receive(socket, ZMQ_DONTWAIT); !byteCountResult) {
            if (!parts.empty()) {
                debug::log() << "incomplete multipart message dropped after " << parts.size() << " frame(s): " << zmq_strerror(byteCountResult.error());
            }
            return {};
        }
        parts.emplace_back(frame.data());

        int    more     = 0;
        size_t moreSize = sizeof(more);
        if (!zmq::invoke(zmq_getsockopt, socket, ZMQ_RCVMORE, &more, &moreSize)) {
            // Can not check rcvmore
            return {};
        } else if (more == 0) {
            break;
        }
    }
    return parts;
}

} // namespace codctl::zmq

#endif // CODCTL_ZMQ_UTILS_HPP
