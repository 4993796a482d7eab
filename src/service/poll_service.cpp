/*
 * rankpoll - Poll Service Implementation
 *
 * Maps JSON requests onto host calls and shapes the responses.
 */
#include <rankpoll/service/poll_service.hpp>
#include <rankpoll/core/logger.hpp>
#include <rankpoll/core/utils.hpp>

namespace rankpoll {

static const char* BAD_REQUEST = "BadRequest";

PollService::PollService(ChainHost& host) : host_(host) {}

Json PollService::handle_line(const std::string& line) {
    Json request;
    try {
        request = Json::parse(line);
    } catch (const std::exception& e) {
        return error_response(BAD_REQUEST, std::string("Invalid JSON: ") + e.what());
    }
    return handle(request);
}

Json PollService::handle(const Json& request) {
    try {
        if (!request.is_object()) {
            throw PollError("Request must be a JSON object");
        }
        ChainId chain = target_chain(request);
        
        if (request.has("mutation")) return handle_mutation(chain, request);
        if (request.has("message")) return handle_message(chain, request);
        if (request.has("query")) return handle_query(chain, request);
        
        throw PollError("Request needs one of 'mutation', 'message' or 'query'");
    } catch (const PollError& e) {
        LOG_DEBUG("Bad request: %s", e.what());
        return error_response(BAD_REQUEST, e.what());
    }
}

ChainId PollService::target_chain(const Json& request) const {
    if (!request.has("chain")) {
        return host_.root_chain();
    }
    std::string chain = request.get_string("chain");
    if (!is_hex_digest(chain)) {
        throw PollError("'chain' must be a 64-character hex chain id");
    }
    return chain;
}

Json PollService::handle_mutation(const ChainId& chain, const Json& request) {
    Operation op = Operation::from_json(request.get_string("mutation"), request["args"]);
    std::string signer = request.get_string("signer");
    
    ExecResult result = host_.execute_operation(chain, signer, op);
    if (!result.success) {
        return error_response(result);
    }
    
    Json data = Json::object();
    if (op.kind == OperationKind::CREATE_POLL) {
        PollState poll;
        FactoryState factory;
        ExecResult read = host_.read(chain, poll, factory);
        if (!read.success) {
            return error_response(read);
        }
        const std::vector<ChainId>& created = factory.polls_created_by(op.owner);
        if (!created.empty()) {
            data.set("chainId", created.back());
        }
    }
    return ok_response(data);
}

Json PollService::handle_message(const ChainId& chain, const Json& request) {
    Message msg = Message::from_json(request.get_string("message"), request["args"]);
    ExecResult result = host_.deliver(chain, msg);
    if (!result.success) {
        return error_response(result);
    }
    Json data = Json::object();
    data.set("queued", true);
    return ok_response(data);
}

Json PollService::handle_query(const ChainId& chain, const Json& request) {
    std::vector<std::string> fields;
    const Json& query = request["query"];
    if (query.is_string()) {
        fields.push_back(query.as_string());
    } else {
        try {
            fields = query.to_strings();
        } catch (const std::runtime_error&) {
            throw PollError("'query' must be a field name or an array of field names");
        }
    }
    
    PollState poll;
    FactoryState factory;
    ExecResult read = host_.read(chain, poll, factory);
    if (!read.success) {
        return error_response(read);
    }
    
    Json data = Json::object();
    for (size_t i = 0; i < fields.size(); ++i) {
        data.set(fields[i], query_field(fields[i], poll, factory, request["args"]));
    }
    return ok_response(data);
}

Json PollService::query_field(const std::string& field, const PollState& poll,
                              const FactoryState& factory, const Json& args) {
    if (field == "topic") return Json(poll.topic);
    if (field == "adminId") return Json(poll.admin_id);
    if (field == "votesPerVoter") return Json(static_cast<int64_t>(poll.votes_per_voter));
    if (field == "hasStarted") return Json(poll.has_started);
    if (field == "isClosed") return Json(poll.is_closed);
    if (field == "participantCount") return Json(static_cast<int64_t>(poll.participants.size()));
    
    if (field == "results") {
        Json arr = Json::array();
        for (size_t i = 0; i < poll.results.size(); ++i) {
            Json entry = Json::object();
            entry.set("nominationId", poll.results[i].nomination_id);
            entry.set("text", poll.results[i].text);
            entry.set("score", static_cast<int64_t>(poll.results[i].score));
            arr.push(entry);
        }
        return arr;
    }
    
    if (field == "nominations") {
        Json arr = Json::array();
        for (std::map<std::string, Nomination>::const_iterator it = poll.nominations.begin();
             it != poll.nominations.end(); ++it) {
            Json entry = Json::object();
            entry.set("nominationId", it->first);
            entry.set("userId", it->second.user_id);
            entry.set("text", it->second.text);
            arr.push(entry);
        }
        return arr;
    }
    
    if (field == "participants") {
        Json arr = Json::array();
        for (std::map<std::string, std::string>::const_iterator it = poll.participants.begin();
             it != poll.participants.end(); ++it) {
            Json entry = Json::object();
            entry.set("userId", it->first);
            entry.set("name", it->second);
            arr.push(entry);
        }
        return arr;
    }
    
    if (field == "rankings") {
        Json arr = Json::array();
        for (std::map<std::string, std::vector<std::string> >::const_iterator it = poll.rankings.begin();
             it != poll.rankings.end(); ++it) {
            Json entry = Json::object();
            entry.set("userId", it->first);
            entry.set("nominationIds", Json::from_strings(it->second));
            arr.push(entry);
        }
        return arr;
    }
    
    if (field == "createdPolls") {
        if (!args["userId"].is_string()) {
            throw PollError("createdPolls needs args.userId");
        }
        return Json::from_strings(factory.polls_created_by(args.get_string("userId")));
    }
    
    throw PollError("Unknown query field '" + field + "'");
}

Json PollService::ok_response(const Json& data) {
    Json r = Json::object();
    r.set("ok", true);
    r.set("data", data);
    return r;
}

Json PollService::error_response(const std::string& code, const std::string& error) {
    Json r = Json::object();
    r.set("ok", false);
    r.set("code", code);
    r.set("error", error);
    return r;
}

Json PollService::error_response(const ExecResult& result) {
    return error_response(exec_error_code_str(result.code), result.error);
}

} // namespace rankpoll
