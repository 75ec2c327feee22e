#include "core/status.hpp"

namespace core {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::Ok: return "Ok";
    case ErrorCode::StreamLimitExceeded: return "StreamLimitExceeded";
    case ErrorCode::ChunkAppendFailure: return "ChunkAppendFailure";
    case ErrorCode::InvalidLabelSet: return "InvalidLabelSet";
    case ErrorCode::EntryOutOfOrder: return "EntryOutOfOrder";
    case ErrorCode::Cancelled: return "Cancelled";
    case ErrorCode::DeadlineExceeded: return "DeadlineExceeded";
    case ErrorCode::InvalidArgument: return "InvalidArgument";
    case ErrorCode::Internal: return "Internal";
    }
    return "Unknown";
}

std::string Status::to_string() const {
    if (ok()) {
        return "Ok";
    }
    std::string out = error_code_name(code);
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

} // namespace core
