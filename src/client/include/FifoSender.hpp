#ifndef CODCTL_CLIENT_FIFOSENDER_HPP
#define CODCTL_CLIENT_FIFOSENDER_HPP

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <string_view>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/format.h>

#include <Debug.hpp>
#include <Errors.hpp>

namespace codctl::client {

namespace detail {
struct FileDescriptor {
    int fd;
    explicit FileDescriptor(int _fd)
        : fd{ _fd } {}
    FileDescriptor(const FileDescriptor &)            = delete;
    FileDescriptor &operator=(const FileDescriptor &) = delete;
    ~FileDescriptor() {
        if (fd >= 0) {
            ::close(fd);
        }
    }
};
} // namespace detail

/**
 * Fire-and-forget delivery: writes the token and a newline to the player's command fifo.
 * The fifo is opened non-blocking, so this never waits for a reader, and nothing is retried.
 * SIGPIPE must be ignored by the caller, a reader vanishing mid-write is reported as Io.
 * @throws FifoError NoListener if nobody reads the fifo, NoSuchTarget if it does not exist, Io otherwise
 */
inline void sendFifoCommand(const std::filesystem::path &fifo, std::string_view token) {
    detail::FileDescriptor file{ ::open(fifo.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC) };
    if (file.fd < 0) {
        const int error = errno;
        switch (error) {
        case ENXIO:
            throw FifoError(FifoError::Kind::NoListener, fmt::format("no player listening on {}", fifo.string()));
        case ENOENT:
            throw FifoError(FifoError::Kind::NoSuchTarget, fmt::format("no such fifo: {}", fifo.string()));
        default:
            throw FifoError(FifoError::Kind::Io, fmt::format("{}: {}", fifo.string(), std::strerror(error)));
        }
    }

    const std::string line    = fmt::format("{}\n", token);
    const auto        written = ::write(file.fd, line.data(), line.size());
    if (written < 0) {
        throw FifoError(FifoError::Kind::Io, fmt::format("{}: {}", fifo.string(), std::strerror(errno)));
    }
    if (static_cast<std::size_t>(written) != line.size()) {
        throw FifoError(FifoError::Kind::Io, fmt::format("{}: short write ({} of {} bytes)", fifo.string(), written, line.size()));
    }
    debug::log() << "sent '" << token << "' to " << fifo.string();
}

} // namespace codctl::client

#endif // CODCTL_CLIENT_FIFOSENDER_HPP
