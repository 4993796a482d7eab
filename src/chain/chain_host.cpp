/*
 * rankpoll - Chain Host Implementation
 *
 * Slots, per-call effect buffering and message delivery.
 */
#include <rankpoll/chain/chain_host.hpp>
#include <rankpoll/core/logger.hpp>
#include <rankpoll/core/utils.hpp>
#include <sstream>

namespace rankpoll {

static const char* META_ROOT_CHAIN = "root_chain";

ChainId derive_chain_id(const ChainId& parent, size_t index) {
    std::ostringstream oss;
    oss << parent << ':' << index;
    return sha256_hex(oss.str());
}

// ============ ChainSlot ============

struct ChainHost::ChainSlot {
    ChainRecord record;
    size_t children;              // Chains opened from this one so far
    
    std::mutex exec_mutex;        // Held for the whole of one call
    
    std::mutex inbox_mutex;
    std::deque<PendingMessage> inbox;
    bool draining;                // A drain task is queued or running
    
    ChainSlot() : children(0), draining(false) {}
};

// ============ CallRuntime ============

// Collects the effects a call requests; the host applies them only if the
// call succeeds.
class ChainHost::CallRuntime : public ContractRuntime {
public:
    CallRuntime(ChainSlot& slot, const std::string& signer)
        : slot_(slot), signer_(signer) {}
    
    const ChainId& chain_id() const override { return slot_.record.id; }
    
    const std::string& authenticated_signer() const override { return signer_; }
    
    ChainId open_chain(const std::string& owner, Amount balance) override {
        ChainRecord record;
        record.id = derive_chain_id(slot_.record.id, slot_.children + opened_.size());
        record.parent = slot_.record.id;
        record.owner = owner;
        record.balance = balance;
        record.created_at = current_timestamp();
        opened_.push_back(record);
        return record.id;
    }
    
    void send_message(const ChainId& target, const Message& message) override {
        outbox_.push_back(PendingMessage(target, message));
    }
    
    const std::vector<ChainRecord>& opened() const { return opened_; }
    const std::vector<PendingMessage>& outbox() const { return outbox_; }

private:
    ChainSlot& slot_;
    std::string signer_;
    std::vector<ChainRecord> opened_;
    std::vector<PendingMessage> outbox_;
};

// ============ ChainHost ============

ChainHost::ChainHost(PollStore& store, const HostOptions& options)
    : store_(store)
    , options_(options)
    , stopped_(false)
    , in_flight_(0)
    , pool_(options.workers) {}

ChainHost::~ChainHost() {
    shutdown();
}

bool ChainHost::start() {
    std::vector<ChainRecord> records = store_.list_chains();
    
    if (records.empty()) {
        ChainRecord root;
        root.id = sha256_hex("root:" + options_.root_owner + ":" + generate_uuid());
        root.owner = options_.root_owner;
        root.created_at = current_timestamp();
        if (!store_.upsert_chain(root) || !store_.set_meta(META_ROOT_CHAIN, root.id)) {
            LOG_ERROR("Failed to register root chain: %s", store_.last_error().c_str());
            return false;
        }
        records.push_back(root);
        LOG_INFO("Registered root chain %s (owner %s)", root.id.c_str(), root.owner.c_str());
    }
    
    root_chain_ = store_.get_meta(META_ROOT_CHAIN);
    
    std::map<ChainId, size_t> children;
    for (size_t i = 0; i < records.size(); ++i) {
        if (!records[i].parent.empty()) {
            children[records[i].parent]++;
        }
    }
    for (size_t i = 0; i < records.size(); ++i) {
        add_slot(records[i], children[records[i].id]);
    }
    
    if (!has_chain(root_chain_)) {
        LOG_ERROR("Root chain '%s' is not registered", root_chain_.c_str());
        return false;
    }
    
    std::vector<PendingMessage> pending;
    if (!store_.load_pending(pending)) {
        LOG_ERROR("Loading undelivered messages failed: %s", store_.last_error().c_str());
        return false;
    }
    if (!pending.empty()) {
        LOG_INFO("Requeueing %zu undelivered message(s)", pending.size());
    }
    for (size_t i = 0; i < pending.size(); ++i) {
        schedule(pending[i]);
    }
    
    LOG_INFO("Chain host started: %zu chains, %zu workers", records.size(), pool_.size());
    return true;
}

void ChainHost::shutdown() {
    stopped_ = true;
    pool_.shutdown();
}

ChainHost::SlotPtr ChainHost::find_slot(const ChainId& chain) const {
    std::lock_guard<std::mutex> lock(chains_mutex_);
    std::map<ChainId, SlotPtr>::const_iterator it = chains_.find(chain);
    return it != chains_.end() ? it->second : SlotPtr();
}

ChainHost::SlotPtr ChainHost::add_slot(const ChainRecord& record, size_t children) {
    SlotPtr slot = std::make_shared<ChainSlot>();
    slot->record = record;
    slot->children = children;
    
    std::lock_guard<std::mutex> lock(chains_mutex_);
    chains_[record.id] = slot;
    return slot;
}

bool ChainHost::has_chain(const ChainId& chain) const {
    return static_cast<bool>(find_slot(chain));
}

bool ChainHost::get_chain(const ChainId& chain, ChainRecord& out) const {
    SlotPtr slot = find_slot(chain);
    if (!slot) return false;
    out = slot->record;
    return true;
}

std::vector<ChainRecord> ChainHost::chains() const {
    std::vector<ChainRecord> result;
    std::lock_guard<std::mutex> lock(chains_mutex_);
    for (std::map<ChainId, SlotPtr>::const_iterator it = chains_.begin(); it != chains_.end(); ++it) {
        result.push_back(it->second->record);
    }
    return result;
}

ExecResult ChainHost::execute_operation(const ChainId& chain, const std::string& signer,
                                        const Operation& operation) {
    if (stopped_) {
        return ExecResult::fail(ExecErrorCode::HOST_STOPPED, "Host is shut down");
    }
    SlotPtr slot = find_slot(chain);
    if (!slot) {
        return ExecResult::fail(ExecErrorCode::UNKNOWN_CHAIN, "Unknown chain " + chain);
    }
    
    LOG_DEBUG("Operation on %s: %s", chain.c_str(), operation.to_json().dump().c_str());
    
    ExecResult result = run_call(*slot, signer, [&operation](PollContract& contract) {
        return contract.execute_operation(operation);
    }, 0);
    
    if (!result.success) {
        LOG_INFO("Operation %s by %s on chain %s rejected: %s",
                 Operation::kind_name(operation.kind), operation.owner.c_str(),
                 chain.c_str(), result.error.c_str());
    }
    return result;
}

ExecResult ChainHost::deliver(const ChainId& chain, const Message& message) {
    if (stopped_) {
        return ExecResult::fail(ExecErrorCode::HOST_STOPPED, "Host is shut down");
    }
    if (!has_chain(chain)) {
        return ExecResult::fail(ExecErrorCode::UNKNOWN_CHAIN, "Unknown chain " + chain);
    }
    
    PendingMessage pending(chain, message);
    if (!store_.enqueue_message(pending)) {
        LOG_ERROR("Queueing %s message for chain %s failed: %s",
                  Message::kind_name(message.kind), chain.c_str(), store_.last_error().c_str());
        return ExecResult::fail(ExecErrorCode::STORAGE_FAILURE, store_.last_error());
    }
    schedule(pending);
    return ExecResult::ok();
}

ExecResult ChainHost::read(const ChainId& chain, PollState& poll, FactoryState& factory) {
    SlotPtr slot = find_slot(chain);
    if (!slot) {
        return ExecResult::fail(ExecErrorCode::UNKNOWN_CHAIN, "Unknown chain " + chain);
    }
    
    std::lock_guard<std::mutex> lock(slot->exec_mutex);
    if (!store_.load_state(chain, poll, factory)) {
        return ExecResult::fail(ExecErrorCode::STORAGE_FAILURE, store_.last_error());
    }
    return ExecResult::ok();
}

void ChainHost::set_message_observer(MessageObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = observer;
}

void ChainHost::wait_idle() {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
}

ExecResult ChainHost::run_call(ChainSlot& slot, const std::string& signer, const ContractCall& call,
                               int64_t consumed) {
    CallEffects effects;
    effects.consumed = consumed;
    {
        std::lock_guard<std::mutex> lock(slot.exec_mutex);
        
        PollState poll;
        FactoryState factory;
        if (!store_.load_state(slot.record.id, poll, factory)) {
            LOG_ERROR("Loading chain %s failed: %s", slot.record.id.c_str(), store_.last_error().c_str());
            return ExecResult::fail(ExecErrorCode::STORAGE_FAILURE, store_.last_error());
        }
        
        CallRuntime runtime(slot, signer);
        PollContract contract(poll, factory, runtime, options_.poll_chain_balance);
        
        ExecResult result = call(contract);
        if (!result.success) {
            // A rejected message is consumed all the same
            if (consumed != 0 && !store_.remove_message(consumed)) {
                LOG_ERROR("Removing handled message %lld failed: %s",
                          static_cast<long long>(consumed), store_.last_error().c_str());
            }
            return result;
        }
        
        effects.opened = runtime.opened();
        effects.outbox = runtime.outbox();
        if (!store_.save_state(slot.record.id, poll, factory, effects)) {
            return ExecResult::fail(ExecErrorCode::STORAGE_FAILURE, store_.last_error());
        }
        
        for (size_t i = 0; i < effects.opened.size(); ++i) {
            add_slot(effects.opened[i], 0);
        }
        slot.children += effects.opened.size();
    }
    
    for (size_t i = 0; i < effects.outbox.size(); ++i) {
        schedule(effects.outbox[i]);
    }
    return ExecResult::ok();
}

void ChainHost::schedule(const PendingMessage& pending) {
    SlotPtr slot = find_slot(pending.target);
    if (!slot) {
        LOG_WARN("Dropping %s message for unknown chain %s",
                 Message::kind_name(pending.message.kind), pending.target.c_str());
        if (!store_.remove_message(pending.seq)) {
            LOG_ERROR("Removing message %lld failed: %s",
                      static_cast<long long>(pending.seq), store_.last_error().c_str());
        }
        return;
    }
    
    bool start_drain = false;
    {
        std::lock_guard<std::mutex> lock(slot->inbox_mutex);
        slot->inbox.push_back(pending);
        if (!slot->draining) {
            slot->draining = true;
            start_drain = true;
        }
    }
    if (!start_drain) return;
    
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        ++in_flight_;
    }
    if (!pool_.enqueue([this, slot] { drain(slot); })) {
        size_t held = 0;
        {
            std::lock_guard<std::mutex> lock(slot->inbox_mutex);
            held = slot->inbox.size();
            slot->inbox.clear();
            slot->draining = false;
        }
        // Still in the outbox; the next start delivers them
        LOG_WARN("Host stopped; %zu message(s) for chain %s held until restart",
                 held, pending.target.c_str());
        finish_delivery();
    }
}

void ChainHost::drain(SlotPtr slot) {
    while (true) {
        PendingMessage pending;
        {
            std::lock_guard<std::mutex> lock(slot->inbox_mutex);
            if (slot->inbox.empty()) {
                slot->draining = false;
                break;
            }
            pending = slot->inbox.front();
            slot->inbox.pop_front();
        }
        
        const Message& message = pending.message;
        ExecResult result;
        try {
            result = run_call(*slot, "", [&message](PollContract& contract) {
                return contract.execute_message(message);
            }, pending.seq);
        } catch (const std::exception& e) {
            // The outbox entry survives; the next start retries it
            LOG_ERROR("Message %s on chain %s aborted: %s",
                      Message::kind_name(message.kind), slot->record.id.c_str(), e.what());
            result = ExecResult::fail(ExecErrorCode::INTERNAL_ERROR, e.what());
        }
        
        if (!result.success) {
            LOG_INFO("Message %s from %s on chain %s rejected: %s (%s)",
                     Message::kind_name(message.kind), message.user_id.c_str(),
                     slot->record.id.c_str(), result.error.c_str(),
                     exec_error_code_str(result.code));
        }
        
        notify_observer(slot->record.id, message, result);
    }
    finish_delivery();
}

void ChainHost::notify_observer(const ChainId& chain, const Message& message, const ExecResult& result) {
    MessageObserver observer;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer = observer_;
    }
    if (!observer) return;
    
    try {
        observer(chain, message, result);
    } catch (const std::exception& e) {
        LOG_ERROR("Message observer failed on chain %s: %s", chain.c_str(), e.what());
    }
}

void ChainHost::finish_delivery() {
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        --in_flight_;
    }
    idle_cv_.notify_all();
}

} // namespace rankpoll
