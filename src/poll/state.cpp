#include <rankpoll/poll/state.hpp>
#include <sstream>

namespace rankpoll {

std::string PollState::next_nomination_id() const {
    std::ostringstream oss;
    oss << "nom_" << nominations.size();
    return oss.str();
}

const std::vector<ChainId>& FactoryState::polls_created_by(const std::string& user_id) const {
    static const std::vector<ChainId> none;
    std::map<std::string, std::vector<ChainId> >::const_iterator it = created_polls.find(user_id);
    return it != created_polls.end() ? it->second : none;
}

} // namespace rankpoll
