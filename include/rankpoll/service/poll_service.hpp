#ifndef RANKPOLL_SERVICE_POLL_SERVICE_HPP
#define RANKPOLL_SERVICE_POLL_SERVICE_HPP

#include <rankpoll/chain/chain_host.hpp>
#include <rankpoll/core/json.hpp>
#include <string>

namespace rankpoll {

// JSON request façade over a ChainHost.
//
// Request shapes (chain defaults to the root chain):
//   {"chain": id, "signer": user, "mutation": "createPoll", "args": {...}}
//   {"chain": id, "message": "vote", "args": {...}}
//   {"chain": id, "query": ["topic", "results", ...], "args": {"userId": ...}}
//
// Responses are {"ok": true, "data": {...}} or
// {"ok": false, "code": "NotAdmin", "error": "..."}.
class PollService {
public:
    explicit PollService(ChainHost& host);
    
    Json handle(const Json& request);
    
    // Parse one request line and handle it; invalid JSON yields a
    // BadRequest response
    Json handle_line(const std::string& line);
    
    // Value of one query field over committed state. Throws PollError for
    // unknown fields or missing arguments.
    static Json query_field(const std::string& field, const PollState& poll,
                            const FactoryState& factory, const Json& args);

private:
    ChainHost& host_;
    
    ChainId target_chain(const Json& request) const;
    Json handle_mutation(const ChainId& chain, const Json& request);
    Json handle_message(const ChainId& chain, const Json& request);
    Json handle_query(const ChainId& chain, const Json& request);
    
    static Json ok_response(const Json& data);
    static Json error_response(const std::string& code, const std::string& error);
    static Json error_response(const ExecResult& result);
};

} // namespace rankpoll

#endif // RANKPOLL_SERVICE_POLL_SERVICE_HPP
