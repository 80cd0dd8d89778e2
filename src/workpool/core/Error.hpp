#pragma once
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace WP {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        Rejected,
        Discarded,
        TaskFailed,
        Cancelled,
        Timeout,
        IllegalState,
        InvalidConfig,
        MalformedInput,
        CapacityExceeded,
        NotSupported
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
    case Error::Code::Rejected:
        return "rejected";
    case Error::Code::Discarded:
        return "discarded";
    case Error::Code::TaskFailed:
        return "task_failed";
    case Error::Code::Cancelled:
        return "cancelled";
    case Error::Code::Timeout:
        return "timeout";
    case Error::Code::IllegalState:
        return "illegal_state";
    case Error::Code::InvalidConfig:
        return "invalid_config";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::CapacityExceeded:
        return "capacity_exceeded";
    case Error::Code::NotSupported:
        return "not_supported";
    }
    return "unknown_error";
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

/**
 * ErrorException carries an Error through code paths whose only channel is an
 * exception, e.g. ForkJoinTask::join() on a cancelled subtask.
 */
class ErrorException : public std::runtime_error {
public:
    explicit ErrorException(Error e)
        : std::runtime_error(describeError(e)), error_(std::move(e)) {}

    [[nodiscard]] auto error() const -> Error const& { return error_; }

private:
    Error error_;
};

} // namespace WP
