#include <rankpoll/poll/types.hpp>

namespace rankpoll {

const char* exec_error_code_str(ExecErrorCode code) {
    switch (code) {
        case ExecErrorCode::NONE:                   return "None";
        case ExecErrorCode::AUTHENTICATION_MISSING: return "AuthenticationMissing";
        case ExecErrorCode::POLL_CLOSED:            return "PollClosed";
        case ExecErrorCode::VOTING_ALREADY_STARTED: return "VotingAlreadyStarted";
        case ExecErrorCode::VOTING_NOT_STARTED:     return "VotingNotStarted";
        case ExecErrorCode::NOT_A_PARTICIPANT:      return "NotAParticipant";
        case ExecErrorCode::TOO_MANY_RANKINGS:      return "TooManyRankings";
        case ExecErrorCode::NOT_ADMIN:              return "NotAdmin";
        case ExecErrorCode::ALREADY_CLOSED:         return "AlreadyClosed";
        case ExecErrorCode::UNKNOWN_CHAIN:          return "UnknownChain";
        case ExecErrorCode::STORAGE_FAILURE:        return "StorageFailure";
        case ExecErrorCode::HOST_STOPPED:           return "HostStopped";
        case ExecErrorCode::INTERNAL_ERROR:         return "InternalError";
    }
    return "Unknown";
}

} // namespace rankpoll
