#ifndef RANKPOLL_POLL_CONTRACT_HPP
#define RANKPOLL_POLL_CONTRACT_HPP

#include <rankpoll/poll/state.hpp>
#include <rankpoll/poll/operation.hpp>
#include <rankpoll/chain/runtime.hpp>
#include <string>
#include <vector>

namespace rankpoll {

// Tokens a freshly opened poll chain is funded with by default
extern const Amount DEFAULT_POLL_CHAIN_BALANCE;

// Poll actor for one chain.
//
// Operations and their message counterparts share the same handlers, so a
// remote Nominate/Vote/StartVote/ClosePoll is validated exactly like the
// local one. Every handler checks all preconditions before touching state;
// a failed ExecResult means state was left as it was.
class PollContract {
public:
    PollContract(PollState& state, FactoryState& factory, ContractRuntime& runtime,
                 Amount poll_chain_balance = DEFAULT_POLL_CHAIN_BALANCE);
    
    ExecResult execute_operation(const Operation& operation);
    ExecResult execute_message(const Message& message);

private:
    PollState& state_;
    FactoryState& factory_;
    ContractRuntime& runtime_;
    Amount poll_chain_balance_;
    
    ExecResult create_poll(const std::string& topic, uint32_t votes_per_voter, const std::string& owner);
    ExecResult initialize(const std::string& topic, uint32_t votes_per_voter, const std::string& admin_id);
    ExecResult join(const std::string& user_id, const std::string& name);
    ExecResult nominate(const std::string& user_id, const std::string& text);
    ExecResult vote(const std::string& user_id, const std::vector<std::string>& rankings);
    ExecResult start_vote(const std::string& user_id);
    ExecResult close_poll(const std::string& user_id);
};

} // namespace rankpoll

#endif // RANKPOLL_POLL_CONTRACT_HPP
