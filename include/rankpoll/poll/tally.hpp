#ifndef RANKPOLL_POLL_TALLY_HPP
#define RANKPOLL_POLL_TALLY_HPP

#include <rankpoll/poll/state.hpp>
#include <vector>
#include <cstdint>

namespace rankpoll {

// Points a ranking position earns: votes_per_voter - rank_index, never
// below zero. rank_index 0 is the voter's first choice.
uint64_t rank_points(uint32_t votes_per_voter, size_t rank_index);

// Borda-style tally over state.rankings.
//
// Scores are summed per nomination id, emitted in ascending id order with
// their text resolved from state.nominations ("Unknown" if missing), then
// stable-sorted by descending score. Equal scores therefore stay in
// ascending id order. Nominations nobody ranked do not appear.
std::vector<ResultEntry> compute_results(const PollState& state);

} // namespace rankpoll

#endif // RANKPOLL_POLL_TALLY_HPP
