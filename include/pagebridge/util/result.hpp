#pragma once
#include <string>
#include <utility>

namespace pagebridge {

enum class ErrorKind : int {
    None = 0,
    Validation,
    Transport,
    Auth,
    Remote,
    Timeout,
};

const char* ErrorKindName(ErrorKind kind);

struct Result {
    bool ok{true};
    int err{0}; // HTTP status when the failure came from a response
    ErrorKind kind{ErrorKind::None};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, int e, std::string m) {
        return {.ok = false, .err = e, .kind = k, .msg = std::move(m)};
    }
    static Result Invalid(std::string m) { return Fail(ErrorKind::Validation, 0, std::move(m)); }
    static Result Remote(int status, std::string m) {
        return Fail(ErrorKind::Remote, status, std::move(m));
    }
};

} // namespace pagebridge
