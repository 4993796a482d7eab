/*
 * rankpoll - SQLite persistence for chains and poll state
 *
 * One database holds every chain the host knows about. Per-chain state is
 * split the way it is addressed: scalar registers, the three key-ordered
 * maps (participants, nominations, rankings) and the factory's
 * created-poll lists. Messages a call sends are kept in a durable outbox
 * until their target has handled them.
 */
#ifndef RANKPOLL_STORAGE_POLL_STORE_HPP
#define RANKPOLL_STORAGE_POLL_STORE_HPP

#include <rankpoll/poll/state.hpp>
#include <rankpoll/chain/runtime.hpp>
#include <rankpoll/poll/operation.hpp>
#include <string>
#include <vector>
#include <mutex>
#include <sqlite3.h>

namespace rankpoll {

// Message waiting in the outbox for its target chain
struct PendingMessage {
    int64_t seq;             // Assigned by the store; delivery order
    ChainId target;
    Message message;
    
    PendingMessage() : seq(0) {}
    PendingMessage(const ChainId& t, const Message& m) : seq(0), target(t), message(m) {}
};

// Everything a successful call commits besides the chain's own state
struct CallEffects {
    std::vector<ChainRecord> opened;       // Chains the call opened
    std::vector<PendingMessage> outbox;    // Messages it sent; seq set by save_state
    int64_t consumed;                      // Outbox entry the call handled, 0 for operations
    
    CallEffects() : consumed(0) {}
};

class PollStore {
public:
    PollStore();
    ~PollStore();
    
    // Open (or create) the database at path; ":memory:" for a private
    // in-memory database
    bool open(const std::string& db_path);
    void close();
    bool is_open() const;
    
    // Schema management
    bool ensure_schema();
    
    // Chain registry
    bool upsert_chain(const ChainRecord& chain);
    bool get_chain(const ChainId& id, ChainRecord& out);
    std::vector<ChainRecord> list_chains();
    
    // Per-chain state. Loading a chain with no stored state yields
    // default-constructed PollState/FactoryState and returns true.
    bool load_state(const ChainId& chain, PollState& poll, FactoryState& factory);
    
    bool save_state(const ChainId& chain, const PollState& poll, const FactoryState& factory);
    
    // Replace the chain's stored state, register opened chains, append the
    // outbox and drop the consumed entry, all in one transaction
    bool save_state(const ChainId& chain, const PollState& poll, const FactoryState& factory,
                    CallEffects& effects);
    
    // Outbox
    bool enqueue_message(PendingMessage& pending);
    bool remove_message(int64_t seq);
    bool load_pending(std::vector<PendingMessage>& out);
    
    // Meta operations
    bool set_meta(const std::string& key, const std::string& value);
    std::string get_meta(const std::string& key, const std::string& default_val = "");
    
    // Utility
    std::string last_error() const;

private:
    sqlite3* db_;
    std::string last_error_;
    mutable std::mutex mutex_;
    
    bool exec(const std::string& sql);
    void set_error(const std::string& error);
    void set_error_from_db();
    
    bool load_registers(const ChainId& chain, PollState& poll);
    bool load_participants(const ChainId& chain, PollState& poll);
    bool load_nominations(const ChainId& chain, PollState& poll);
    bool load_rankings(const ChainId& chain, PollState& poll);
    bool load_created_polls(const ChainId& chain, FactoryState& factory);
    bool write_state(const ChainId& chain, const PollState& poll, const FactoryState& factory);
    bool write_chain(const ChainRecord& chain);
    bool write_message(PendingMessage& pending);
    bool delete_message(int64_t seq);
    bool put_register(const ChainId& chain, const char* key, const std::string& value);
};

} // namespace rankpoll

#endif // RANKPOLL_STORAGE_POLL_STORE_HPP
