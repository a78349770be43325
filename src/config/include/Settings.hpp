#ifndef CODCTL_CONFIG_SETTINGS_HPP
#define CODCTL_CONFIG_SETTINGS_HPP

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <Debug.hpp>
#include <Errors.hpp>
#include <zmq/ZmqUtils.hpp>

namespace codctl::config {

constexpr auto DEFAULT_CONFIG_FILE = std::string_view{ "/etc/codctl.conf" };
constexpr auto CONFIG_FILE_ENV     = "CODCTL_CONFIG";

struct Settings {
    std::string                              cmdFifo       = "/var/lib/codplayer/player.fifo";
    std::string                              rpcEndpoint   = "ipc:///var/lib/codplayer/player_rpc";
    std::string                              stateEndpoint = "ipc:///var/lib/codplayer/player_state";
    std::optional<std::chrono::milliseconds> timeout; // no timeout if unset
    zmq::SocketOptions                       socket;
};

namespace detail {

inline std::string_view trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\r\n";
    const auto                 first      = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    return text.substr(first, text.find_last_not_of(whitespace) - first + 1);
}

inline std::optional<int> parseInt(std::string_view text) {
    int value = 0;
    if (auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value); ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace detail

/**
 * Parses a positive, possibly fractional number of seconds ("5", "0.25").
 * Returns nullopt for anything else, including zero and negative values.
 */
inline std::optional<std::chrono::milliseconds> parseSeconds(std::string_view text) {
    double seconds = 0.0;
    if (auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds); ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::ceil(seconds * 1000.0)));
}

/**
 * Parses the 'key = value' config format, one entry per line, '#' starts a comment line.
 * Values may be wrapped in single or double quotes.
 * @param origin used to prefix error messages, normally the file name
 * @throws ConfigurationError naming origin and line for every malformed entry
 */
inline Settings parseSettings(std::string_view text, std::string_view origin, Settings settings = {}) {
    std::size_t lineNumber = 0;
    while (!text.empty()) {
        const auto end  = text.find('\n');
        auto       line = detail::trim(text.substr(0, end));
        text            = end == std::string_view::npos ? std::string_view{} : text.substr(end + 1);
        ++lineNumber;

        if (line.empty() || line.front() == '#') {
            continue;
        }
        const auto fail = [&](std::string_view what) {
            return ConfigurationError(fmt::format("{}:{}: {}", origin, lineNumber, what));
        };

        const auto separator = line.find('=');
        if (separator == std::string_view::npos) {
            throw fail(fmt::format("expected 'key = value', got '{}'", line));
        }
        const auto key   = detail::trim(line.substr(0, separator));
        auto       value = detail::trim(line.substr(separator + 1));
        if (key.empty()) {
            throw fail("missing key");
        }
        if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
            if (value.size() < 2 || value.back() != value.front()) {
                throw fail(fmt::format("unterminated quote in value of '{}'", key));
            }
            value = value.substr(1, value.size() - 2);
        }

        if (key == "cmd_fifo") {
            settings.cmdFifo = std::string(value);
        } else if (key == "rpc_endpoint") {
            settings.rpcEndpoint = std::string(value);
        } else if (key == "state_endpoint") {
            settings.stateEndpoint = std::string(value);
        } else if (key == "timeout") {
            if (value.empty() || value == "0") {
                settings.timeout.reset();
            } else if (const auto timeout = parseSeconds(value)) {
                settings.timeout = timeout;
            } else {
                throw fail(fmt::format("invalid timeout '{}'", value));
            }
        } else if (key == "high_water_mark") {
            const auto hwm = detail::parseInt(value);
            if (!hwm || *hwm < 0) {
                throw fail(fmt::format("invalid high_water_mark '{}'", value));
            }
            settings.socket.highWaterMark = *hwm;
        } else if (key == "linger_ms") {
            const auto linger = detail::parseInt(value);
            if (!linger || *linger < -1) {
                throw fail(fmt::format("invalid linger_ms '{}'", value));
            }
            settings.socket.linger = *linger;
        } else {
            throw fail(fmt::format("unknown setting '{}'", key));
        }
    }
    return settings;
}

inline Settings loadSettings(const std::filesystem::path &file) {
    std::ifstream in(file, std::ios::in);
    if (!in) {
        throw ConfigurationError(fmt::format("{}: cannot open config file", file.string()));
    }
    std::stringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        throw ConfigurationError(fmt::format("{}: error reading config file", file.string()));
    }
    return parseSettings(content.str(), file.string());
}

/**
 * Resolves the config file to use: an explicit path, else $CODCTL_CONFIG, else the default
 * file. Explicit and environment paths must exist; a missing default file yields the defaults.
 */
inline Settings resolveSettings(const std::optional<std::filesystem::path> &explicitFile) {
    if (explicitFile) {
        return loadSettings(*explicitFile);
    }
    if (const char *env = std::getenv(CONFIG_FILE_ENV); env != nullptr && *env != '\0') {
        return loadSettings(env);
    }
    const std::filesystem::path defaultFile{ DEFAULT_CONFIG_FILE };
    std::error_code             error;
    if (!std::filesystem::exists(defaultFile, error)) {
        debug::log() << "no config file at " << defaultFile.string() << ", using defaults";
        return Settings{};
    }
    return loadSettings(defaultFile);
}

} // namespace codctl::config

#endif // CODCTL_CONFIG_SETTINGS_HPP
