/*
 * rankpoll - Poll Contract Implementation
 *
 * Guards run before any mutation, so a rejected call leaves state as it was.
 */
#include <rankpoll/poll/contract.hpp>
#include <rankpoll/poll/validation.hpp>
#include <rankpoll/poll/tally.hpp>
#include <rankpoll/core/logger.hpp>
#include <rankpoll/core/utils.hpp>
#include <sstream>

namespace rankpoll {

const Amount DEFAULT_POLL_CHAIN_BALANCE = 10;

static const char* ADMIN_DISPLAY_NAME = "Admin";

PollContract::PollContract(PollState& state, FactoryState& factory, ContractRuntime& runtime,
                           Amount poll_chain_balance)
    : state_(state)
    , factory_(factory)
    , runtime_(runtime)
    , poll_chain_balance_(poll_chain_balance) {}

ExecResult PollContract::execute_operation(const Operation& operation) {
    switch (operation.kind) {
        case OperationKind::CREATE_POLL:
            return create_poll(operation.topic, operation.votes_per_voter, operation.owner);
        case OperationKind::JOIN:
            return join(operation.owner, operation.name);
        case OperationKind::NOMINATE:
            return nominate(operation.owner, operation.text);
        case OperationKind::VOTE:
            return vote(operation.owner, operation.rankings);
        case OperationKind::START_VOTE:
            return start_vote(operation.owner);
        case OperationKind::CLOSE_POLL:
            return close_poll(operation.owner);
    }
    return ExecResult::fail(ExecErrorCode::NONE, "unhandled operation");
}

ExecResult PollContract::execute_message(const Message& message) {
    switch (message.kind) {
        case MessageKind::INITIALIZE_POLL:
            return initialize(message.topic, message.votes_per_voter, message.user_id);
        case MessageKind::NOMINATE:
            return nominate(message.user_id, message.text);
        case MessageKind::VOTE:
            return vote(message.user_id, message.rankings);
        case MessageKind::START_VOTE:
            return start_vote(message.user_id);
        case MessageKind::CLOSE_POLL:
            return close_poll(message.user_id);
    }
    return ExecResult::fail(ExecErrorCode::NONE, "unhandled message");
}

ExecResult PollContract::create_poll(const std::string& topic, uint32_t votes_per_voter,
                                     const std::string& owner) {
    if (runtime_.authenticated_signer().empty()) {
        return ExecResult::fail(ExecErrorCode::AUTHENTICATION_MISSING,
                                "Needs authenticated signer to create poll");
    }
    
    ChainId poll_chain = runtime_.open_chain(owner, poll_chain_balance_);
    runtime_.send_message(poll_chain, Message::initialize_poll(topic, votes_per_voter, owner));
    
    factory_.created_polls[owner].push_back(poll_chain);
    
    LOG_INFO("Poll '%s' created by %s on chain %s", topic.c_str(), owner.c_str(), poll_chain.c_str());
    return ExecResult::ok();
}

ExecResult PollContract::initialize(const std::string& topic, uint32_t votes_per_voter,
                                    const std::string& admin_id) {
    // Delivered exactly once by construction; a repeat resets the phase flags
    if (state_.is_initialized()) {
        LOG_WARN("Chain %s re-initialized (previous admin %s, new admin %s)",
                 runtime_.chain_id().c_str(), state_.admin_id.c_str(), admin_id.c_str());
    }
    
    state_.topic = topic;
    state_.votes_per_voter = votes_per_voter;
    state_.admin_id = admin_id;
    state_.has_started = false;
    state_.is_closed = false;
    state_.results.clear();
    state_.participants[admin_id] = ADMIN_DISPLAY_NAME;
    return ExecResult::ok();
}

ExecResult PollContract::join(const std::string& user_id, const std::string& name) {
    if (poll_closed(state_)) {
        return ExecResult::fail(ExecErrorCode::POLL_CLOSED, "Poll is closed");
    }
    state_.participants[user_id] = name;
    LOG_DEBUG("%s joined as '%s'", user_id.c_str(), name.c_str());
    return ExecResult::ok();
}

ExecResult PollContract::nominate(const std::string& user_id, const std::string& text) {
    if (voting_started(state_)) {
        return ExecResult::fail(ExecErrorCode::VOTING_ALREADY_STARTED,
                                "Cannot nominate after voting has started");
    }
    if (!is_participant(state_, user_id)) {
        return ExecResult::fail(ExecErrorCode::NOT_A_PARTICIPANT, "User not in poll");
    }
    
    std::string nomination_id = state_.next_nomination_id();
    state_.nominations[nomination_id] = Nomination(user_id, text);
    LOG_DEBUG("%s nominated %s '%s'", user_id.c_str(), nomination_id.c_str(), text.c_str());
    return ExecResult::ok();
}

ExecResult PollContract::vote(const std::string& user_id, const std::vector<std::string>& rankings) {
    if (!voting_started(state_)) {
        return ExecResult::fail(ExecErrorCode::VOTING_NOT_STARTED, "Voting has not started yet");
    }
    if (poll_closed(state_)) {
        return ExecResult::fail(ExecErrorCode::POLL_CLOSED, "Poll is already closed");
    }
    if (!ranking_within_limit(state_, rankings)) {
        std::ostringstream oss;
        oss << "Too many rankings. Max allowed: " << state_.votes_per_voter;
        return ExecResult::fail(ExecErrorCode::TOO_MANY_RANKINGS, oss.str());
    }
    if (!is_participant(state_, user_id)) {
        return ExecResult::fail(ExecErrorCode::NOT_A_PARTICIPANT, "User not in poll");
    }
    
    state_.rankings[user_id] = rankings;
    LOG_DEBUG("%s ranked [%s]", user_id.c_str(), rankpoll::join(rankings, ", ").c_str());
    return ExecResult::ok();
}

ExecResult PollContract::start_vote(const std::string& user_id) {
    if (!is_admin(state_, user_id)) {
        return ExecResult::fail(ExecErrorCode::NOT_ADMIN, "Only admin can start voting");
    }
    state_.has_started = true;
    return ExecResult::ok();
}

ExecResult PollContract::close_poll(const std::string& user_id) {
    if (!is_admin(state_, user_id)) {
        return ExecResult::fail(ExecErrorCode::NOT_ADMIN, "Only admin can close the poll");
    }
    if (poll_closed(state_)) {
        return ExecResult::fail(ExecErrorCode::ALREADY_CLOSED, "Poll is already closed");
    }
    
    state_.is_closed = true;
    state_.results = compute_results(state_);
    LOG_INFO("Poll on chain %s closed: %zu voters, %zu ranked nominations",
             runtime_.chain_id().c_str(), state_.rankings.size(), state_.results.size());
    return ExecResult::ok();
}

} // namespace rankpoll
