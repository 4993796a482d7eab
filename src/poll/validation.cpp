/*
 * rankpoll - Poll Validation
 */
#include <rankpoll/poll/validation.hpp>

namespace rankpoll {

bool is_admin(const PollState& state, const std::string& user_id) {
    return user_id == state.admin_id;
}

bool is_participant(const PollState& state, const std::string& user_id) {
    return state.participants.find(user_id) != state.participants.end();
}

bool voting_started(const PollState& state) {
    return state.has_started;
}

bool poll_closed(const PollState& state) {
    return state.is_closed;
}

bool ranking_within_limit(const PollState& state, const std::vector<std::string>& rankings) {
    return rankings.size() <= static_cast<size_t>(state.votes_per_voter);
}

} // namespace rankpoll
