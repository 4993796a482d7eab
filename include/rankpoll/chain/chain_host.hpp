/*
 * rankpoll - in-process chain host
 *
 * Runs every chain as a single-writer actor: one call at a time per chain,
 * each call loading state from the store, running the poll contract and
 * committing state, opened chains and outgoing messages only on success.
 * Messages are written to the store's outbox before they land in a
 * per-chain FIFO inbox drained on the worker pool; whatever is still in
 * the outbox at start is delivered again.
 */
#ifndef RANKPOLL_CHAIN_CHAIN_HOST_HPP
#define RANKPOLL_CHAIN_CHAIN_HOST_HPP

#include <rankpoll/chain/runtime.hpp>
#include <rankpoll/poll/contract.hpp>
#include <rankpoll/storage/poll_store.hpp>
#include <rankpoll/core/thread_pool.hpp>
#include <string>
#include <vector>
#include <map>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>

namespace rankpoll {

struct HostOptions {
    size_t workers;              // Message delivery threads
    Amount poll_chain_balance;   // Funding for chains opened by CreatePoll
    std::string root_owner;      // Owner of the root chain created on first start
    
    HostOptions()
        : workers(2)
        , poll_chain_balance(DEFAULT_POLL_CHAIN_BALANCE)
        , root_owner("root") {}
};

// Called on a worker thread after each delivered message has run
typedef std::function<void(const ChainId& chain, const Message& message, const ExecResult& result)> MessageObserver;

// Child chain id: SHA-256 of "<parent>:<child index>"
ChainId derive_chain_id(const ChainId& parent, size_t index);

class ChainHost {
public:
    ChainHost(PollStore& store, const HostOptions& options = HostOptions());
    ~ChainHost();
    
    // Load registered chains and requeue undelivered messages; registers a
    // root chain on first start
    bool start();
    
    // Finish queued deliveries and stop the workers. Later operations and
    // deliveries fail with HOST_STOPPED.
    void shutdown();
    
    const ChainId& root_chain() const { return root_chain_; }
    
    bool has_chain(const ChainId& chain) const;
    bool get_chain(const ChainId& chain, ChainRecord& out) const;
    std::vector<ChainRecord> chains() const;
    
    // Run an operation on chain. An empty signer means the call is
    // unauthenticated.
    ExecResult execute_operation(const ChainId& chain, const std::string& signer, const Operation& operation);
    
    // Queue a message for chain. Success only means it was accepted; the
    // outcome is only visible through the message observer.
    ExecResult deliver(const ChainId& chain, const Message& message);
    
    // Committed state of chain
    ExecResult read(const ChainId& chain, PollState& poll, FactoryState& factory);
    
    void set_message_observer(MessageObserver observer);
    
    // Block until every inbox is empty and no delivery is running
    void wait_idle();
    
    const HostOptions& options() const { return options_; }

private:
    struct ChainSlot;
    class CallRuntime;
    
    typedef std::shared_ptr<ChainSlot> SlotPtr;
    typedef std::function<ExecResult(PollContract&)> ContractCall;
    
    SlotPtr find_slot(const ChainId& chain) const;
    SlotPtr add_slot(const ChainRecord& record, size_t children);
    ExecResult run_call(ChainSlot& slot, const std::string& signer, const ContractCall& call,
                        int64_t consumed);
    void schedule(const PendingMessage& pending);
    void drain(SlotPtr slot);
    void notify_observer(const ChainId& chain, const Message& message, const ExecResult& result);
    void finish_delivery();
    
    PollStore& store_;
    HostOptions options_;
    ChainId root_chain_;
    std::atomic<bool> stopped_;
    
    mutable std::mutex chains_mutex_;
    std::map<ChainId, SlotPtr> chains_;
    
    std::mutex observer_mutex_;
    MessageObserver observer_;
    
    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
    size_t in_flight_;
    
    // Declared last: destroyed (and joined) before the state it drains
    ThreadPool pool_;
    
    ChainHost(const ChainHost&);
    ChainHost& operator=(const ChainHost&);
};

} // namespace rankpoll

#endif // RANKPOLL_CHAIN_CHAIN_HOST_HPP
