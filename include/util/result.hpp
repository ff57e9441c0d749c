#pragma once
#include <string>
#include <utility>

namespace repack {

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    // Prepends "<context>: " to the message, keeps the error code.
    Result WithContext(const std::string& context) const {
        if (ok) return *this;
        return Fail(err, msg.empty() ? context : context + ": " + msg);
    }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
};

} // namespace repack
