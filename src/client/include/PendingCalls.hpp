#ifndef CODCTL_CLIENT_PENDINGCALLS_HPP
#define CODCTL_CLIENT_PENDINGCALLS_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>

#include <Debug.hpp>
#include <Errors.hpp>

namespace codctl::client {

using timePoint        = std::chrono::steady_clock::time_point;
using ResponseCallback = std::function<void(const std::string &payload)>;
using ErrorCallback    = std::function<void(const CallError &error)>;

struct PendingCall {
    std::string      method;
    ResponseCallback onResponse;
    ErrorCallback    onError;
    timePoint        created = std::chrono::steady_clock::now();
};

/*
 * Registry of in-flight requests keyed by correlation id. An entry is removed from the registry
 * before its continuation runs, so each call completes at most once, through exactly one of
 * onResponse or onError. Completions for unknown ids are ignored. Only used from the event loop thread.
 */
class PendingCalls {
    std::unordered_map<std::uint64_t, PendingCall> _calls;
    std::uint64_t                                  _nextId = 1;

public:
    std::uint64_t add(std::string method, ResponseCallback onResponse, ErrorCallback onError) {
        while (_nextId == 0 || _calls.contains(_nextId)) {
            ++_nextId;
        }
        const auto id = _nextId++;
        _calls.emplace(id, PendingCall{ .method = std::move(method), .onResponse = std::move(onResponse), .onError = std::move(onError) });
        return id;
    }

    bool complete(std::uint64_t id, const std::string &payload) {
        auto node = _calls.extract(id);
        if (node.empty()) {
            return false;
        }
        if (node.mapped().onResponse) {
            node.mapped().onResponse(payload);
        }
        return true;
    }

    bool fail(std::uint64_t id, const CallError &error) {
        auto node = _calls.extract(id);
        if (node.empty()) {
            return false;
        }
        if (node.mapped().onError) {
            node.mapped().onError(error);
        }
        return true;
    }

    // drops every pending call without running any continuation
    void abandonAll() {
        const auto now = std::chrono::steady_clock::now();
        for (const auto &[id, call] : _calls) {
            debug::log() << "abandoning '" << call.method << "' (id " << id << ") after " << std::chrono::duration_cast<std::chrono::milliseconds>(now - call.created).count() << " ms";
        }
        _calls.clear();
    }

    [[nodiscard]] const PendingCall *find(std::uint64_t id) const {
        const auto it = _calls.find(id);
        return it == _calls.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool        contains(std::uint64_t id) const { return _calls.contains(id); }
    [[nodiscard]] bool        empty() const noexcept { return _calls.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return _calls.size(); }
};

} // namespace codctl::client

#endif // CODCTL_CLIENT_PENDINGCALLS_HPP
