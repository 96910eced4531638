#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace TS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        MalformedInput,
        UnrecognizedIntent,
        NotFound,
        NotADirectory,
        AlreadyExists,
        PermissionDenied,
        Forbidden,
        InvalidArguments,
        UnknownCommand,
        ExecutionFailed,
        Timeout,
        ChannelClosed,
        CapacityExceeded
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::UnrecognizedIntent:
        return "unrecognized_intent";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::NotADirectory:
        return "not_a_directory";
    case Error::Code::AlreadyExists:
        return "already_exists";
    case Error::Code::PermissionDenied:
        return "permission_denied";
    case Error::Code::Forbidden:
        return "forbidden";
    case Error::Code::InvalidArguments:
        return "invalid_arguments";
    case Error::Code::UnknownCommand:
        return "unknown_command";
    case Error::Code::ExecutionFailed:
        return "execution_failed";
    case Error::Code::Timeout:
        return "timeout";
    case Error::Code::ChannelClosed:
        return "channel_closed";
    case Error::Code::CapacityExceeded:
        return "capacity_exceeded";
    }
    return "unknown_error";
}

// Which layer of the engine raises a given code.
[[nodiscard]] inline auto errorCategory(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::MalformedInput:
    case Error::Code::UnrecognizedIntent:
        return "resolution";
    case Error::Code::NotFound:
    case Error::Code::NotADirectory:
    case Error::Code::AlreadyExists:
    case Error::Code::PermissionDenied:
    case Error::Code::Forbidden:
    case Error::Code::InvalidArguments:
        return "navigator";
    case Error::Code::UnknownCommand:
    case Error::Code::ExecutionFailed:
    case Error::Code::Timeout:
        return "dispatch";
    case Error::Code::ChannelClosed:
    case Error::Code::CapacityExceeded:
        return "transport";
    case Error::Code::InvalidError:
    case Error::Code::UnknownError:
        return "internal";
    }
    return "internal";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace TS
