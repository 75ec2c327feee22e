#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace core {

enum class ErrorCode : std::uint8_t {
    Ok = 0,
    StreamLimitExceeded,
    ChunkAppendFailure,
    InvalidLabelSet,
    EntryOutOfOrder,
    Cancelled,
    DeadlineExceeded,
    InvalidArgument,
    Internal, // exception escaped the push path
};

const char* error_code_name(ErrorCode code) noexcept;

// Result of a push-path operation. Cheap when ok (no message allocated).
struct Status {
    ErrorCode code{ErrorCode::Ok};
    std::string message;

    Status() = default;
    Status(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    static Status ok_status() { return Status{}; }

    bool ok() const noexcept { return code == ErrorCode::Ok; }
    explicit operator bool() const noexcept { return ok(); }

    // "<CodeName>: <message>"
    std::string to_string() const;
};

} // namespace core
