#ifndef CODCTL_CLIENT_RPCMESSAGE_HPP
#define CODCTL_CLIENT_RPCMESSAGE_HPP

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Command.hpp>

namespace codctl::rpc {

constexpr auto protocol = std::string_view{ "CODRPC01" };

enum class Status {
    Ok,     ///< success, the payload is the result
    Error,  ///< the daemon rejected the command, the payload is the message
    Unknown ///< anything else
};

constexpr Status parseStatus(std::string_view name) noexcept {
    if (name == "ok") {
        return Status::Ok;
    }
    if (name == "error") {
        return Status::Error;
    }
    return Status::Unknown;
}

inline std::optional<std::uint64_t> parseRequestId(std::string_view text) noexcept {
    std::uint64_t id = 0;
    if (auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id); ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return id;
}

// request frames: [protocol] [request id] [method] [arg 0] ... [arg n-1]
enum class RequestFrame : std::size_t {
    Protocol = 0,
    RequestId,
    Method,
    FirstArgument
};

// reply frames: [protocol] [request id] [status] [payload]
enum class ReplyFrame : std::size_t {
    Protocol = 0,
    RequestId,
    Status,
    Payload
};
constexpr std::size_t ReplyFrameCount = 4;

inline std::vector<std::string> encodeRequest(std::uint64_t id, const Command &command) {
    std::vector<std::string> frames;
    frames.reserve(static_cast<std::size_t>(RequestFrame::FirstArgument) + command.arguments.size());
    frames.emplace_back(protocol);
    frames.push_back(std::to_string(id));
    frames.push_back(command.name);
    frames.insert(frames.end(), command.arguments.begin(), command.arguments.end());
    return frames;
}

struct Reply {
    std::uint64_t id         = 0;
    bool          wellFormed = false; ///< false: the id could be read but protocol or frame count are wrong
    Status        status     = Status::Unknown;
    std::string   statusText;
    std::string   payload;
};

// nullopt if not even the request id can be read, such a reply cannot be matched to any call
inline std::optional<Reply> decodeReply(std::vector<std::string> &&frames) {
    constexpr auto idFrame = static_cast<std::size_t>(ReplyFrame::RequestId);
    if (frames.size() <= idFrame) {
        return std::nullopt;
    }
    const auto id = parseRequestId(frames[idFrame]);
    if (!id) {
        return std::nullopt;
    }
    Reply reply;
    reply.id = *id;
    if (frames.size() != ReplyFrameCount || frames[static_cast<std::size_t>(ReplyFrame::Protocol)] != protocol) {
        return reply;
    }
    reply.wellFormed = true;
    reply.statusText = std::move(frames[static_cast<std::size_t>(ReplyFrame::Status)]);
    reply.status     = parseStatus(reply.statusText);
    reply.payload    = std::move(frames[static_cast<std::size_t>(ReplyFrame::Payload)]);
    return reply;
}

} // namespace codctl::rpc

#endif // CODCTL_CLIENT_RPCMESSAGE_HPP
