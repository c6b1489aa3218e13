#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace lolite::core {

enum class ErrorCode : std::uint32_t {
    Ok = 0,
    InvalidHandle,
    InvalidId,
    DuplicateId,
    UnknownNode,
    WouldCreateCycle,
    ParseError,
    CommunicationFailure,
    AlreadyRunning,
    NotRunning,
    Fatal,
};

const char* error_code_name(ErrorCode code);

// Outcome of an engine operation. `position` is a byte offset into the
// stylesheet text and only meaningful for ParseError.
struct Status {
    ErrorCode code = ErrorCode::Ok;
    std::string message;
    std::size_t position = 0;

    bool ok() const { return code == ErrorCode::Ok; }

    static Status success() { return {}; }
    static Status error(ErrorCode code, std::string message, std::size_t position = 0) {
        return Status{code, std::move(message), position};
    }
};

// "ok", or "<code>: <message>".
std::string describe(const Status& status);

}  // namespace lolite::core
