#ifndef RANKPOLL_POLL_TYPES_HPP
#define RANKPOLL_POLL_TYPES_HPP

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <stdexcept>

namespace rankpoll {

// 64-char hex identifier of a chain (one poll instance per chain)
typedef std::string ChainId;

// Exception for malformed requests (bad JSON, missing or mistyped fields).
// Domain rule violations are reported through ExecResult instead.
class PollError : public std::runtime_error {
public:
    explicit PollError(const std::string& msg) : std::runtime_error(msg) {}
};

// A single nomination (e.g., "Pizza Place")
struct Nomination {
    std::string user_id;     // Who nominated it
    std::string text;
    
    Nomination() {}
    Nomination(const std::string& u, const std::string& t) : user_id(u), text(t) {}
};

// One line of the final tally
struct ResultEntry {
    std::string nomination_id;
    std::string text;
    uint64_t score;
    
    ResultEntry() : score(0) {}
    ResultEntry(const std::string& id, const std::string& t, uint64_t s)
        : nomination_id(id), text(t), score(s) {}
    
    bool operator==(const ResultEntry& o) const {
        return nomination_id == o.nomination_id && text == o.text && score == o.score;
    }
    bool operator!=(const ResultEntry& o) const { return !(*this == o); }
};

enum class ExecErrorCode {
    NONE,
    AUTHENTICATION_MISSING,
    POLL_CLOSED,
    VOTING_ALREADY_STARTED,
    VOTING_NOT_STARTED,
    NOT_A_PARTICIPANT,
    TOO_MANY_RANKINGS,
    NOT_ADMIN,
    ALREADY_CLOSED,
    // Raised by the chain host, never by the contract
    UNKNOWN_CHAIN,
    STORAGE_FAILURE,
    HOST_STOPPED,
    INTERNAL_ERROR
};

// Stable wire name ("NotAdmin", "PollClosed", ...)
const char* exec_error_code_str(ExecErrorCode code);

// Outcome of executing an operation or message on a chain. A failed
// result means the call committed nothing.
struct ExecResult {
    bool success;
    ExecErrorCode code;
    std::string error;
    
    ExecResult() : success(false), code(ExecErrorCode::NONE) {}
    
    static ExecResult ok() {
        ExecResult r;
        r.success = true;
        return r;
    }
    
    static ExecResult fail(ExecErrorCode code, const std::string& err) {
        ExecResult r;
        r.success = false;
        r.code = code;
        r.error = err;
        return r;
    }
};

} // namespace rankpoll

#endif // RANKPOLL_POLL_TYPES_HPP
