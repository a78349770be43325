#ifndef CODCTL_ERRORS_HPP
#define CODCTL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace codctl {

// invalid or unreadable configuration, reported before any session starts
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// invalid command line or command arguments
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// a known command with an argument value it cannot accept, e.g. a malformed disc id
class InvalidArgumentError : public UsageError {
public:
    using UsageError::UsageError;
};

class FifoError : public std::runtime_error {
public:
    enum class Kind {
        NoListener,   ///< the fifo exists but nobody has it open for reading
        NoSuchTarget, ///< the fifo path does not exist
        Io
    };

    FifoError(Kind kind, const std::string &message)
        : std::runtime_error(message), _kind(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return _kind; }

private:
    Kind _kind;
};

// an error nobody knows how to handle, i.e. a defect; never caught by the client
class UnclassifiedError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

enum class ErrorKind {
    DaemonCommand,   ///< the daemon understood the request and rejected it
    ClientTransport, ///< the request or its reply could not be delivered
    Unclassified
};

struct CallError {
    ErrorKind   kind = ErrorKind::Unclassified;
    std::string message;
};

} // namespace codctl

#endif // CODCTL_ERRORS_HPP
