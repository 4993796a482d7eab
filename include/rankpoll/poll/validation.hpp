#ifndef RANKPOLL_POLL_VALIDATION_HPP
#define RANKPOLL_POLL_VALIDATION_HPP

#include <rankpoll/poll/state.hpp>
#include <string>
#include <vector>

namespace rankpoll {

// Pure predicates over poll state; no side effects

bool is_admin(const PollState& state, const std::string& user_id);

bool is_participant(const PollState& state, const std::string& user_id);

// Voting phase entered (StartVote has run)
bool voting_started(const PollState& state);

bool poll_closed(const PollState& state);

// Ranking length within the per-voter cap
bool ranking_within_limit(const PollState& state, const std::vector<std::string>& rankings);

} // namespace rankpoll

#endif // RANKPOLL_POLL_VALIDATION_HPP
