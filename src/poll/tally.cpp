/*
 * rankpoll - Tally Implementation
 */
#include <rankpoll/poll/tally.hpp>
#include <algorithm>
#include <map>

namespace rankpoll {

namespace {

struct HigherScore {
    bool operator()(const ResultEntry& a, const ResultEntry& b) const {
        return a.score > b.score;
    }
};

} // anonymous namespace

uint64_t rank_points(uint32_t votes_per_voter, size_t rank_index) {
    uint64_t max_votes = votes_per_voter;
    uint64_t index = static_cast<uint64_t>(rank_index);
    return index >= max_votes ? 0 : max_votes - index;
}

std::vector<ResultEntry> compute_results(const PollState& state) {
    std::map<std::string, uint64_t> scores;
    
    for (std::map<std::string, std::vector<std::string> >::const_iterator voter = state.rankings.begin();
         voter != state.rankings.end(); ++voter) {
        const std::vector<std::string>& ranking = voter->second;
        for (size_t i = 0; i < ranking.size(); ++i) {
            scores[ranking[i]] += rank_points(state.votes_per_voter, i);
        }
    }
    
    std::vector<ResultEntry> results;
    results.reserve(scores.size());
    for (std::map<std::string, uint64_t>::const_iterator it = scores.begin(); it != scores.end(); ++it) {
        std::map<std::string, Nomination>::const_iterator nom = state.nominations.find(it->first);
        std::string text = nom != state.nominations.end() ? nom->second.text : "Unknown";
        results.push_back(ResultEntry(it->first, text, it->second));
    }
    
    std::stable_sort(results.begin(), results.end(), HigherScore());
    return results;
}

} // namespace rankpoll
