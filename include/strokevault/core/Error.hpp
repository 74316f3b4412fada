#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace SV {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        InvalidHandle,
        EmptyHistory,
        RenderJobCancelled,
        CorruptSnapshotState,
        DecodeFailed,
        MalformedInput,
        InvalidConfig,
        ShuttingDown,
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
    case Error::Code::InvalidHandle:
        return "invalid_handle";
    case Error::Code::EmptyHistory:
        return "empty_history";
    case Error::Code::RenderJobCancelled:
        return "render_job_cancelled";
    case Error::Code::CorruptSnapshotState:
        return "corrupt_snapshot_state";
    case Error::Code::DecodeFailed:
        return "decode_failed";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::InvalidConfig:
        return "invalid_config";
    case Error::Code::ShuttingDown:
        return "shutting_down";
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

// Stale or absent handles are reported through this helper so every
// component produces the same code.
[[nodiscard]] inline auto invalidHandleError(std::string message) -> Error {
    return Error{Error::Code::InvalidHandle, std::move(message)};
}

} // namespace SV
