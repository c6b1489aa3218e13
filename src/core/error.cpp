#include <lolite/core/error.h>

namespace lolite::core {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                   return "ok";
        case ErrorCode::InvalidHandle:        return "invalid_handle";
        case ErrorCode::InvalidId:            return "invalid_id";
        case ErrorCode::DuplicateId:          return "duplicate_id";
        case ErrorCode::UnknownNode:          return "unknown_node";
        case ErrorCode::WouldCreateCycle:     return "would_create_cycle";
        case ErrorCode::ParseError:           return "parse_error";
        case ErrorCode::CommunicationFailure: return "communication_failure";
        case ErrorCode::AlreadyRunning:       return "already_running";
        case ErrorCode::NotRunning:           return "not_running";
        case ErrorCode::Fatal:                return "fatal";
    }
    return "unknown";
}

std::string describe(const Status& status) {
    if (status.ok()) {
        return "ok";
    }
    std::string out = error_code_name(status.code);
    if (!status.message.empty()) {
        out += ": ";
        out += status.message;
    }
    if (status.code == ErrorCode::ParseError) {
        out += " (at offset " + std::to_string(status.position) + ")";
    }
    return out;
}

}  // namespace lolite::core
