#ifndef CODCTL_CLIENT_ERRORCLASSIFIER_HPP
#define CODCTL_CLIENT_ERRORCLASSIFIER_HPP

#include <string>

#include <fmt/format.h>

#include <Errors.hpp>

namespace codctl::client {

enum class ErrorAction {
    StopSession,
    Continue
};

struct ErrorPolicy {
    bool stopOnDaemonError    = true;
    bool stopOnTransportError = false; // a transient connectivity problem may still resolve before the timeout
};

/*
 * Decides how the session reacts to a failed call. Daemon and transport failures are reported and
 * mapped to an action; anything unclassified is a defect and is thrown as UnclassifiedError, which
 * the client never catches.
 */
class ErrorClassifier {
    ErrorPolicy _policy;

public:
    explicit ErrorClassifier(ErrorPolicy policy = {})
        : _policy(policy) {}

    [[nodiscard]] ErrorAction classify(const CallError &error) const {
        switch (error.kind) {
        case ErrorKind::DaemonCommand:
            return _policy.stopOnDaemonError ? ErrorAction::StopSession : ErrorAction::Continue;
        case ErrorKind::ClientTransport:
            return _policy.stopOnTransportError ? ErrorAction::StopSession : ErrorAction::Continue;
        case ErrorKind::Unclassified:
            break;
        }
        throw UnclassifiedError(fmt::format("unclassified error: {}", error.message));
    }

    // user visible message
    [[nodiscard]] static std::string describe(const CallError &error) {
        switch (error.kind) {
        case ErrorKind::DaemonCommand: return fmt::format("error: {}", error.message);
        case ErrorKind::ClientTransport: return fmt::format("transport error: {}", error.message);
        case ErrorKind::Unclassified: break;
        }
        return fmt::format("unclassified error: {}", error.message);
    }
};

} // namespace codctl::client

#endif // CODCTL_CLIENT_ERRORCLASSIFIER_HPP
