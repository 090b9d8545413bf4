#pragma once
#include <string>
#include <utility>

namespace mdeploy {

// Failure classes reported to the operator. Lower classes never abort a run;
// the fatal ones stop it with a hint naming the next action.
enum class ErrorKind : int {
    None = 0,
    Preflight,   // privilege/OS/connectivity, before any mutation
    Activation,  // one of the four activation steps
    Degraded,    // package or runtime entry failure, run continues
    Repairable,  // detected drift with a known fix
    Escalation,  // damage beyond in-place repair
    Fatal,       // any other terminal error (download, extraction, IO)
    Aborted,     // operator declined at a prompt
};

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;
    std::string hint;
    ErrorKind kind{ErrorKind::None};

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m), .hint = {}, .kind = ErrorKind::Fatal};
    }
    static Result Fail(ErrorKind k, std::string m, std::string h = {}) {
        return {.ok = false, .err = -1, .msg = std::move(m), .hint = std::move(h), .kind = k};
    }
    static Result Aborted(std::string m) {
        return {.ok = false, .err = 0, .msg = std::move(m), .hint = {}, .kind = ErrorKind::Aborted};
    }

    // Keeps the message, attaches the operator hint.
    Result WithHint(std::string h) && {
        hint = std::move(h);
        return std::move(*this);
    }
};

} // namespace mdeploy
