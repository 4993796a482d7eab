#ifndef RANKPOLL_POLL_OPERATION_HPP
#define RANKPOLL_POLL_OPERATION_HPP

#include <rankpoll/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace rankpoll {

enum class OperationKind {
    CREATE_POLL,
    JOIN,
    NOMINATE,
    VOTE,
    START_VOTE,
    CLOSE_POLL
};

// Caller-initiated action executed on the chain the caller is routed to.
// Only the fields belonging to `kind` are meaningful; build values with the
// named constructors.
struct Operation {
    OperationKind kind;
    std::string owner;                  // Acting user (all kinds)
    std::string topic;                  // CREATE_POLL
    uint32_t votes_per_voter;           // CREATE_POLL
    std::string name;                   // JOIN
    std::string text;                   // NOMINATE
    std::vector<std::string> rankings;  // VOTE
    
    Operation() : kind(OperationKind::JOIN), votes_per_voter(0) {}
    
    static Operation create_poll(const std::string& topic, uint32_t votes_per_voter, const std::string& owner);
    static Operation join(const std::string& name, const std::string& owner);
    static Operation nominate(const std::string& text, const std::string& owner);
    static Operation vote(const std::vector<std::string>& rankings, const std::string& owner);
    static Operation start_vote(const std::string& owner);
    static Operation close_poll(const std::string& owner);
    
    // Façade name ("createPoll", "join", ...)
    static const char* kind_name(OperationKind kind);
    
    // Build from a façade mutation name and its arguments object.
    // Throws PollError on unknown names and missing or mistyped fields.
    static Operation from_json(const std::string& name, const Json& args);
    
    Json to_json() const;
};

enum class MessageKind {
    INITIALIZE_POLL,
    NOMINATE,
    VOTE,
    START_VOTE,
    CLOSE_POLL
};

// One-way instruction addressed to a specific chain. Carries the acting
// identity explicitly; the sender is trusted to have authenticated it.
struct Message {
    MessageKind kind;
    std::string user_id;                // Acting user; admin for INITIALIZE_POLL
    std::string topic;                  // INITIALIZE_POLL
    uint32_t votes_per_voter;           // INITIALIZE_POLL
    std::string text;                   // NOMINATE
    std::vector<std::string> rankings;  // VOTE
    
    Message() : kind(MessageKind::START_VOTE), votes_per_voter(0) {}
    
    static Message initialize_poll(const std::string& topic, uint32_t votes_per_voter, const std::string& admin_id);
    static Message nominate(const std::string& user_id, const std::string& text);
    static Message vote(const std::string& user_id, const std::vector<std::string>& rankings);
    static Message start_vote(const std::string& user_id);
    static Message close_poll(const std::string& user_id);
    
    static const char* kind_name(MessageKind kind);
    
    // Field names follow the message surface: adminId for
    // initializePoll, userId for the rest. Throws PollError.
    static Message from_json(const std::string& name, const Json& args);
    
    Json to_json() const;
};

} // namespace rankpoll

#endif // RANKPOLL_POLL_OPERATION_HPP
