#ifndef RANKPOLL_POLL_STATE_HPP
#define RANKPOLL_POLL_STATE_HPP

#include <rankpoll/poll/types.hpp>
#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace rankpoll {

// State of one poll chain. Loaded at the start of every call on the chain
// and persisted at its end; nothing else shares it.
struct PollState {
    std::string topic;
    uint32_t votes_per_voter;
    std::string admin_id;
    bool has_started;
    bool is_closed;
    
    std::map<std::string, std::string> participants;           // user_id -> display name
    std::map<std::string, Nomination> nominations;             // nomination_id -> nomination
    std::map<std::string, std::vector<std::string> > rankings; // user_id -> nomination_ids, best first
    
    std::vector<ResultEntry> results;                          // Empty until the poll closes
    
    PollState()
        : votes_per_voter(0)
        , has_started(false)
        , is_closed(false) {}
    
    // An uninitialized chain has no admin yet
    bool is_initialized() const { return !admin_id.empty(); }
    
    // Id the next nomination receives: "nom_<current count>"
    std::string next_nomination_id() const;
};

// Factory bookkeeping: which poll chains each user has created from this chain
struct FactoryState {
    std::map<std::string, std::vector<ChainId> > created_polls;
    
    const std::vector<ChainId>& polls_created_by(const std::string& user_id) const;
};

} // namespace rankpoll

#endif // RANKPOLL_POLL_STATE_HPP
