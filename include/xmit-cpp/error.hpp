/// @file error.hpp
/// @brief Error types for the xmit-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace xmit_cpp {

/// Categories of errors that can occur while publishing.
enum class ErrorKind : std::uint8_t {
    transport,            ///< Non-200 status, connection failure or aborted transfer.
    timeout,              ///< A network call exceeded its deadline.
    discovery,            ///< The well-known protocol document is unusable.
    protocol,             ///< The server reported a failure in a 200 response.
    team_auth,            ///< The destination requires a team scope that was not resolved.
    cancelled,            ///< The launch was cancelled by the user.
    invariant_violation,  ///< Internal inconsistency, e.g. content missing from the table.
    configuration,        ///< The project or site configuration is invalid.
    build_failed,         ///< The build task exited with a non-zero code.
    decoding,             ///< A response body could not be decompressed or decoded.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::transport:           return "transport";
        case ErrorKind::timeout:             return "timeout";
        case ErrorKind::discovery:           return "discovery";
        case ErrorKind::protocol:            return "protocol";
        case ErrorKind::team_auth:           return "team_auth";
        case ErrorKind::cancelled:           return "cancelled";
        case ErrorKind::invariant_violation: return "invariant_violation";
        case ErrorKind::configuration:       return "configuration";
        case ErrorKind::build_failed:        return "build_failed";
        case ErrorKind::decoding:            return "decoding";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception raised by publishing steps. Carries the structured Error.
class PublishError : public std::runtime_error {
public:
    PublishError(ErrorKind kind, const std::string& message)
        : std::runtime_error{message}, error_{kind, message} {}

    explicit PublishError(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    auto kind() const noexcept -> ErrorKind { return error_.kind; }
    auto error() const -> const Error& { return error_; }

private:
    Error error_;
};

}  // namespace xmit_cpp
