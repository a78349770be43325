#ifndef CODCTL_DEBUG_H
#define CODCTL_DEBUG_H

#include <filesystem>
#include <iostream>
#include <source_location>
#include <utility>

namespace codctl::debug {

namespace detail {
inline bool &enabledFlag() {
    static bool enabled = false;
    return enabled;
}
} // namespace detail

inline void setEnabled(bool enabled) { detail::enabledFlag() = enabled; }
inline bool enabled() { return detail::enabledFlag(); }

struct DebugImpl {
    bool _active;
    bool _breakLineOnEnd = true;

    explicit DebugImpl(bool active)
        : _active(active) {}

    ~DebugImpl() {
        if (_breakLineOnEnd) {
            operator<<('\n');
        }
    }

    template<typename T>
    DebugImpl &operator<<(T &&val) {
        if (_active) {
            std::cerr << std::forward<T>(val);
        }
        return *this;
    }

    DebugImpl(const DebugImpl &other)
        : _active(other._active) {
    }

    DebugImpl(DebugImpl &&other) noexcept
        : _active(other._active) {
        other._breakLineOnEnd = false;
    }
};

// diagnostics only, user-facing output goes through fmt::print
inline auto log() {
    return DebugImpl{ enabled() };
}

inline auto withLocation(const std::source_location location = std::source_location::current()) {
    std::error_code error;
    auto            relative = std::filesystem::relative(location.file_name(), error);
    auto            out      = log();
    out << relative.string() << ":" << location.line() << " in " << location.function_name() << " --> ";
    return out;
}

} // namespace codctl::debug

#endif // CODCTL_DEBUG_H
