/*
 * rankpoll - Operation and Message Implementation
 *
 * Named constructors and the JSON forms used by requests and the outbox.
 */
#include <rankpoll/poll/operation.hpp>
#include <rankpoll/poll/types.hpp>
#include <cmath>

namespace rankpoll {

namespace {

std::string require_string(const Json& args, const std::string& key) {
    const Json& v = args[key];
    if (!v.is_string()) {
        throw PollError("Field '" + key + "' must be a string");
    }
    return v.as_string();
}

uint32_t require_uint32(const Json& args, const std::string& key) {
    const Json& v = args[key];
    if (!v.is_number()) {
        throw PollError("Field '" + key + "' must be a number");
    }
    double n = v.as_number();
    if (n < 0 || n > 4294967295.0 || std::floor(n) != n) {
        throw PollError("Field '" + key + "' must be an unsigned 32-bit integer");
    }
    return static_cast<uint32_t>(n);
}

std::vector<std::string> require_strings(const Json& args, const std::string& key) {
    try {
        return args[key].to_strings();
    } catch (const std::runtime_error&) {
        throw PollError("Field '" + key + "' must be an array of strings");
    }
}

} // anonymous namespace

// ============ Operation ============

Operation Operation::create_poll(const std::string& topic, uint32_t votes_per_voter, const std::string& owner) {
    Operation op;
    op.kind = OperationKind::CREATE_POLL;
    op.topic = topic;
    op.votes_per_voter = votes_per_voter;
    op.owner = owner;
    return op;
}

Operation Operation::join(const std::string& name, const std::string& owner) {
    Operation op;
    op.kind = OperationKind::JOIN;
    op.name = name;
    op.owner = owner;
    return op;
}

Operation Operation::nominate(const std::string& text, const std::string& owner) {
    Operation op;
    op.kind = OperationKind::NOMINATE;
    op.text = text;
    op.owner = owner;
    return op;
}

Operation Operation::vote(const std::vector<std::string>& rankings, const std::string& owner) {
    Operation op;
    op.kind = OperationKind::VOTE;
    op.rankings = rankings;
    op.owner = owner;
    return op;
}

Operation Operation::start_vote(const std::string& owner) {
    Operation op;
    op.kind = OperationKind::START_VOTE;
    op.owner = owner;
    return op;
}

Operation Operation::close_poll(const std::string& owner) {
    Operation op;
    op.kind = OperationKind::CLOSE_POLL;
    op.owner = owner;
    return op;
}

const char* Operation::kind_name(OperationKind kind) {
    switch (kind) {
        case OperationKind::CREATE_POLL: return "createPoll";
        case OperationKind::JOIN:        return "join";
        case OperationKind::NOMINATE:    return "nominate";
        case OperationKind::VOTE:        return "vote";
        case OperationKind::START_VOTE:  return "startVote";
        case OperationKind::CLOSE_POLL:  return "closePoll";
    }
    return "unknown";
}

Operation Operation::from_json(const std::string& name, const Json& args) {
    if (name == "createPoll") {
        return create_poll(require_string(args, "topic"),
                           require_uint32(args, "votesPerVoter"),
                           require_string(args, "owner"));
    }
    if (name == "join") {
        return join(require_string(args, "name"), require_string(args, "owner"));
    }
    if (name == "nominate") {
        return nominate(require_string(args, "text"), require_string(args, "owner"));
    }
    if (name == "vote") {
        return vote(require_strings(args, "rankings"), require_string(args, "owner"));
    }
    if (name == "startVote") {
        return start_vote(require_string(args, "owner"));
    }
    if (name == "closePoll") {
        return close_poll(require_string(args, "owner"));
    }
    throw PollError("Unknown mutation '" + name + "'");
}

Json Operation::to_json() const {
    Json j = Json::object();
    j.set("kind", kind_name(kind));
    j.set("owner", owner);
    switch (kind) {
        case OperationKind::CREATE_POLL:
            j.set("topic", topic);
            j.set("votesPerVoter", static_cast<int64_t>(votes_per_voter));
            break;
        case OperationKind::JOIN:
            j.set("name", name);
            break;
        case OperationKind::NOMINATE:
            j.set("text", text);
            break;
        case OperationKind::VOTE:
            j.set("rankings", Json::from_strings(rankings));
            break;
        case OperationKind::START_VOTE:
        case OperationKind::CLOSE_POLL:
            break;
    }
    return j;
}

// ============ Message ============

Message Message::initialize_poll(const std::string& topic, uint32_t votes_per_voter, const std::string& admin_id) {
    Message msg;
    msg.kind = MessageKind::INITIALIZE_POLL;
    msg.topic = topic;
    msg.votes_per_voter = votes_per_voter;
    msg.user_id = admin_id;
    return msg;
}

Message Message::nominate(const std::string& user_id, const std::string& text) {
    Message msg;
    msg.kind = MessageKind::NOMINATE;
    msg.user_id = user_id;
    msg.text = text;
    return msg;
}

Message Message::vote(const std::string& user_id, const std::vector<std::string>& rankings) {
    Message msg;
    msg.kind = MessageKind::VOTE;
    msg.user_id = user_id;
    msg.rankings = rankings;
    return msg;
}

Message Message::start_vote(const std::string& user_id) {
    Message msg;
    msg.kind = MessageKind::START_VOTE;
    msg.user_id = user_id;
    return msg;
}

Message Message::close_poll(const std::string& user_id) {
    Message msg;
    msg.kind = MessageKind::CLOSE_POLL;
    msg.user_id = user_id;
    return msg;
}

const char* Message::kind_name(MessageKind kind) {
    switch (kind) {
        case MessageKind::INITIALIZE_POLL: return "initializePoll";
        case MessageKind::NOMINATE:        return "nominate";
        case MessageKind::VOTE:            return "vote";
        case MessageKind::START_VOTE:      return "startVote";
        case MessageKind::CLOSE_POLL:      return "closePoll";
    }
    return "unknown";
}

Message Message::from_json(const std::string& name, const Json& args) {
    if (name == "initializePoll") {
        return initialize_poll(require_string(args, "topic"),
                               require_uint32(args, "votesPerVoter"),
                               require_string(args, "adminId"));
    }
    if (name == "nominate") {
        return nominate(require_string(args, "userId"), require_string(args, "text"));
    }
    if (name == "vote") {
        return vote(require_string(args, "userId"), require_strings(args, "rankings"));
    }
    if (name == "startVote") {
        return start_vote(require_string(args, "userId"));
    }
    if (name == "closePoll") {
        return close_poll(require_string(args, "userId"));
    }
    throw PollError("Unknown message '" + name + "'");
}

Json Message::to_json() const {
    Json j = Json::object();
    j.set("kind", kind_name(kind));
    switch (kind) {
        case MessageKind::INITIALIZE_POLL:
            j.set("topic", topic);
            j.set("votesPerVoter", static_cast<int64_t>(votes_per_voter));
            j.set("adminId", user_id);
            break;
        case MessageKind::NOMINATE:
            j.set("userId", user_id);
            j.set("text", text);
            break;
        case MessageKind::VOTE:
            j.set("userId", user_id);
            j.set("rankings", Json::from_strings(rankings));
            break;
        case MessageKind::START_VOTE:
        case MessageKind::CLOSE_POLL:
            j.set("userId", user_id);
            break;
    }
    return j;
}

} // namespace rankpoll
