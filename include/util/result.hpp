#pragma once
#include <string>
#include <utility>

namespace ingest {

enum class ErrorKind : int {
    None = 0,
    TransientIo,     // connection reset/timeout while streaming; retry in place
    TransientUpload, // backend signalled a retryable multipart condition
    Integrity,       // checksum mismatch
    Archive,         // corrupt archive or failed decompression
    Backend,         // HTTP error status or non-retryable store error
    Config,          // missing or invalid configuration
    Io,              // local filesystem failure
    Exhausted,       // retry budget used up
    Cancelled,       // process asked to stop
};

const char* ErrorKindName(ErrorKind kind);

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;
    ErrorKind kind{ErrorKind::None};
    // Symbolic error code reported by a remote backend (e.g. "InvalidPart").
    std::string code;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m), .kind = ErrorKind::Io};
    }
    static Result Fail(ErrorKind k, int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m), .kind = k};
    }
    static Result BackendFail(int http_status, std::string backend_code, std::string m) {
        return {.ok = false,
                .err = http_status,
                .msg = std::move(m),
                .kind = ErrorKind::Backend,
                .code = std::move(backend_code)};
    }

    // Prefix the message with context while keeping kind/code.
    Result& Wrap(const std::string& context) {
        msg = context + ": " + msg;
        return *this;
    }
};

} // namespace ingest
