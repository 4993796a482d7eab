/*
 * ChainHost: chain creation, message delivery and persistence.
 */
#include <rankpoll/chain/chain_host.hpp>
#include <rankpoll/core/logger.hpp>
#include <rankpoll/core/utils.hpp>
#include "check.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

using namespace rankpoll;

namespace {

struct Delivery {
    ChainId chain;
    MessageKind kind;
    ExecResult result;
};

// Thread-safe record of every delivered message
class DeliveryLog {
public:
    MessageObserver observer() {
        return [this](const ChainId& chain, const Message& message, const ExecResult& result) {
            Delivery d;
            d.chain = chain;
            d.kind = message.kind;
            d.result = result;
            std::lock_guard<std::mutex> lock(mutex_);
            deliveries_.push_back(d);
        };
    }
    
    std::vector<Delivery> snapshot() {
        std::lock_guard<std::mutex> lock(mutex_);
        return deliveries_;
    }

private:
    std::mutex mutex_;
    std::vector<Delivery> deliveries_;
};

bool open_memory(PollStore& store) {
    return store.open(":memory:") && store.ensure_schema();
}

// Creates a poll from the root chain and waits for its initialization
ChainId create_poll(ChainHost& host, const std::string& owner, const std::string& topic,
                    uint32_t votes_per_voter) {
    ExecResult r = host.execute_operation(host.root_chain(), owner,
                                          Operation::create_poll(topic, votes_per_voter, owner));
    if (!r.success) return "";
    host.wait_idle();
    
    PollState poll;
    FactoryState factory;
    if (!host.read(host.root_chain(), poll, factory).success) return "";
    const std::vector<ChainId>& created = factory.polls_created_by(owner);
    return created.empty() ? "" : created.back();
}

} // anonymous namespace

static int test_start_registers_root() {
    PollStore store;
    EXPECT(open_memory(store), "open");
    ChainHost host(store);
    EXPECT(host.start(), "start");
    EXPECT(is_hex_digest(host.root_chain()), "root id is a hex digest");
    EXPECT(host.has_chain(host.root_chain()), "root registered");
    EXPECT(host.chains().size() == 1, "only root");
    
    ChainRecord root;
    EXPECT(host.get_chain(host.root_chain(), root), "root record");
    EXPECT(root.owner == "root" && root.parent.empty(), "root owner, no parent");
    EXPECT(store.get_meta("root_chain") == host.root_chain(), "root remembered");
    return 0;
}

static int test_unsigned_create_poll_opens_nothing() {
    PollStore store;
    EXPECT(open_memory(store), "open");
    ChainHost host(store);
    EXPECT(host.start(), "start");
    
    ExecResult r = host.execute_operation(host.root_chain(), "",
                                          Operation::create_poll("Lunch", 3, "alice"));
    EXPECT(!r.success && r.code == ExecErrorCode::AUTHENTICATION_MISSING, "rejected");
    host.wait_idle();
    EXPECT(host.chains().size() == 1, "no chain opened");
    
    PollState poll;
    FactoryState factory;
    EXPECT(host.read(host.root_chain(), poll, factory).success, "read root");
    EXPECT(factory.created_polls.empty(), "nothing recorded");
    return 0;
}

static int test_create_poll_initializes_new_chain() {
    PollStore store;
    EXPECT(open_memory(store), "open");
    HostOptions options;
    options.poll_chain_balance = 25;
    ChainHost host(store, options);
    EXPECT(host.start(), "start");
    
    ChainId poll_chain = create_poll(host, "alice", "Lunch", 3);
    EXPECT(!poll_chain.empty(), "poll chain recorded");
    EXPECT(poll_chain == derive_chain_id(host.root_chain(), 0), "first child id");
    
    ChainRecord record;
    EXPECT(host.get_chain(poll_chain, record), "chain registered");
    EXPECT(record.owner == "alice" && record.parent == host.root_chain(), "owner and parent");
    EXPECT(record.balance == 25, "funded with configured balance");
    
    PollState poll;
    FactoryState factory;
    EXPECT(host.read(poll_chain, poll, factory).success, "read poll chain");
    EXPECT(poll.topic == "Lunch" && poll.votes_per_voter == 3, "initialized");
    EXPECT(poll.admin_id == "alice", "creator is admin");
    EXPECT(poll.participants.size() == 1 && poll.participants["alice"] == "Admin", "admin joined as Admin");
    EXPECT(!poll.has_started && !poll.is_closed, "open phase");
    
    ChainId second = create_poll(host, "alice", "Dinner", 2);
    EXPECT(second == derive_chain_id(host.root_chain(), 1), "second child id");
    EXPECT(host.read(host.root_chain(), poll, factory).success, "read root");
    EXPECT(factory.polls_created_by("alice").size() == 2, "both polls listed");
    return 0;
}

static int test_full_poll_lifecycle() {
    PollStore store;
    EXPECT(open_memory(store), "open");
    ChainHost host(store);
    EXPECT(host.start(), "start");
    
    ChainId chain = create_poll(host, "admin", "Lunch", 3);
    EXPECT(!chain.empty(), "created");
    
    EXPECT(host.execute_operation(chain, "alice", Operation::join("Alice", "alice")).success, "alice joins");
    EXPECT(host.execute_operation(chain, "bob", Operation::join("Bob", "bob")).success, "bob joins");
    EXPECT(host.execute_operation(chain, "alice", Operation::nominate("Pizza", "alice")).success, "nom_0");
    EXPECT(host.execute_operation(chain, "bob", Operation::nominate("Sushi", "bob")).success, "nom_1");
    
    ExecResult r = host.execute_operation(chain, "alice", Operation::start_vote("alice"));
    EXPECT(!r.success && r.code == ExecErrorCode::NOT_ADMIN, "only admin starts");
    EXPECT(host.execute_operation(chain, "admin", Operation::start_vote("admin")).success, "start");
    
    std::vector<std::string> alice;
    alice.push_back("nom_0");
    alice.push_back("nom_1");
    std::vector<std::string> bob;
    bob.push_back("nom_1");
    EXPECT(host.execute_operation(chain, "alice", Operation::vote(alice, "alice")).success, "alice votes");
    EXPECT(host.execute_operation(chain, "bob", Operation::vote(bob, "bob")).success, "bob votes");
    EXPECT(host.execute_operation(chain, "admin", Operation::close_poll("admin")).success, "close");
    
    r = host.execute_operation(chain, "admin", Operation::close_poll("admin"));
    EXPECT(!r.success && r.code == ExecErrorCode::ALREADY_CLOSED, "closes once");
    
    PollState poll;
    FactoryState factory;
    EXPECT(host.read(chain, poll, factory).success, "read");
    EXPECT(poll.is_closed && poll.results.size() == 2, "tallied");
    EXPECT(poll.results[0] == ResultEntry("nom_1", "Sushi", 5), "Sushi 2+3");
    EXPECT(poll.results[1] == ResultEntry("nom_0", "Pizza", 3), "Pizza 3");
    return 0;
}

static int test_unknown_chain() {
    PollStore store;
    EXPECT(open_memory(store), "open");
    ChainHost host(store);
    EXPECT(host.start(), "start");
    
    ChainId missing(64, 'f');
    ExecResult r = host.execute_operation(missing, "alice", Operation::join("Alice", "alice"));
    EXPECT(!r.success && r.code == ExecErrorCode::UNKNOWN_CHAIN, "operation rejected");
    
    PollState poll;
    FactoryState factory;
    EXPECT(host.read(missing, poll, factory).code == ExecErrorCode::UNKNOWN_CHAIN, "read rejected");
    EXPECT(host.deliver(missing, Message::start_vote("admin")).code == ExecErrorCode::UNKNOWN_CHAIN,
           "delivery refused");
    return 0;
}

static int test_messages_run_in_arrival_order() {
    PollStore store;
    EXPECT(open_memory(store), "open");
    HostOptions options;
    options.workers = 4;
    ChainHost host(store, options);
    EXPECT(host.start(), "start");
    
    DeliveryLog log;
    host.set_message_observer(log.observer());
    
    ChainId chain = create_poll(host, "admin", "Order", 5);
    EXPECT(!chain.empty(), "created");
    
    for (int i = 0; i < 8; ++i) {
        std::ostringstream text;
        text << "option " << i;
        EXPECT(host.deliver(chain, Message::nominate("admin", text.str())).success, "queued");
    }
    host.wait_idle();
    
    PollState poll;
    FactoryState factory;
    EXPECT(host.read(chain, poll, factory).success, "read");
    EXPECT(poll.nominations.size() == 8, "all applied");
    for (int i = 0; i < 8; ++i) {
        std::ostringstream id, text;
        id << "nom_" << i;
        text << "option " << i;
        EXPECT(poll.nominations[id.str()].text == text.str(), "ids follow arrival order");
    }
    
    std::vector<Delivery> seen = log.snapshot();
    EXPECT(seen.size() == 9, "initialize plus eight nominations observed");
    EXPECT(seen[0].kind == MessageKind::INITIALIZE_POLL && seen[0].chain == chain, "init first");
    return 0;
}

static int test_rejected_message_reported_to_observer() {
    PollStore store;
    EXPECT(open_memory(store), "open");
    ChainHost host(store);
    EXPECT(host.start(), "start");
    
    DeliveryLog log;
    host.set_message_observer(log.observer());
    ChainId chain = create_poll(host, "admin", "Lunch", 1);
    EXPECT(!chain.empty(), "created");
    
    EXPECT(host.deliver(chain, Message::vote("admin", std::vector<std::string>(1, "nom_0"))).success, "queued");
    EXPECT(host.deliver(chain, Message::start_vote("mallory")).success, "queued");
    host.wait_idle();
    
    std::vector<Delivery> seen = log.snapshot();
    EXPECT(seen.size() == 3, "three deliveries");
    EXPECT(seen[1].kind == MessageKind::VOTE && seen[1].result.code == ExecErrorCode::VOTING_NOT_STARTED,
           "vote before start");
    EXPECT(seen[2].result.code == ExecErrorCode::NOT_ADMIN, "non-admin start");
    
    PollState poll;
    FactoryState factory;
    EXPECT(host.read(chain, poll, factory).success && !poll.has_started, "state untouched");
    EXPECT(poll.rankings.empty(), "no ranking stored");
    
    std::vector<PendingMessage> pending;
    EXPECT(store.load_pending(pending) && pending.empty(), "rejected messages leave the outbox");
    return 0;
}

static int test_calls_refused_after_shutdown() {
    PollStore store;
    EXPECT(open_memory(store), "open");
    ChainHost host(store);
    EXPECT(host.start(), "start");
    host.shutdown();
    
    ExecResult r = host.execute_operation(host.root_chain(), "alice",
                                          Operation::create_poll("Lunch", 2, "alice"));
    EXPECT(!r.success && r.code == ExecErrorCode::HOST_STOPPED, "create refused");
    EXPECT(host.chains().size() == 1, "no chain opened");
    
    PollState poll;
    FactoryState factory;
    EXPECT(host.read(host.root_chain(), poll, factory).success, "reads still served");
    EXPECT(factory.created_polls.empty(), "nothing committed");
    
    r = host.deliver(host.root_chain(), Message::start_vote("root"));
    EXPECT(r.code == ExecErrorCode::HOST_STOPPED, "delivery refused");
    std::vector<PendingMessage> pending;
    EXPECT(store.load_pending(pending) && pending.empty(), "nothing queued");
    return 0;
}

static int test_undelivered_messages_requeued_on_start() {
    PollStore store;
    EXPECT(open_memory(store), "open");
    
    ChainId root;
    {
        ChainHost host(store);
        EXPECT(host.start(), "first start");
        root = host.root_chain();
        host.shutdown();
    }
    
    // State a CreatePoll committed before the process died, its
    // InitializePoll never handled
    ChainRecord child;
    child.id = derive_chain_id(root, 0);
    child.parent = root;
    child.owner = "alice";
    child.balance = DEFAULT_POLL_CHAIN_BALANCE;
    child.created_at = current_timestamp();
    
    PollState root_poll;
    FactoryState root_factory;
    root_factory.created_polls["alice"].push_back(child.id);
    CallEffects effects;
    effects.opened.push_back(child);
    effects.outbox.push_back(PendingMessage(child.id, Message::initialize_poll("Lunch", 2, "alice")));
    EXPECT(store.save_state(root, root_poll, root_factory, effects), "commit without delivery");
    
    PendingMessage extra(child.id, Message::nominate("alice", "Pizza"));
    EXPECT(store.enqueue_message(extra), "later message");
    
    ChainHost host(store);
    EXPECT(host.start(), "restart");
    host.wait_idle();
    
    PollState poll;
    FactoryState factory;
    EXPECT(host.read(child.id, poll, factory).success, "read child");
    EXPECT(poll.is_initialized() && poll.admin_id == "alice", "initialized after restart");
    EXPECT(poll.topic == "Lunch" && poll.votes_per_voter == 2, "registers set");
    EXPECT(poll.participants.size() == 1 && poll.participants["alice"] == "Admin", "admin joined");
    EXPECT(poll.nominations.size() == 1 && poll.nominations["nom_0"].text == "Pizza", "queued order kept");
    
    std::vector<PendingMessage> pending;
    EXPECT(store.load_pending(pending) && pending.empty(), "outbox drained");
    
    ExecResult r = host.execute_operation(child.id, "", Operation::start_vote(""));
    EXPECT(!r.success && r.code == ExecErrorCode::NOT_ADMIN, "empty owner is not admin");
    return 0;
}

static int test_failing_observer_does_not_stall_chain() {
    PollStore store;
    EXPECT(open_memory(store), "open");
    ChainHost host(store);
    EXPECT(host.start(), "start");
    
    ChainId chain = create_poll(host, "admin", "Lunch", 2);
    EXPECT(!chain.empty(), "created");
    
    host.set_message_observer([](const ChainId&, const Message&, const ExecResult&) {
        throw std::runtime_error("observer failure");
    });
    EXPECT(host.deliver(chain, Message::nominate("admin", "Pizza")).success, "first queued");
    EXPECT(host.deliver(chain, Message::nominate("admin", "Sushi")).success, "second queued");
    host.wait_idle();
    
    EXPECT(host.deliver(chain, Message::nominate("admin", "Tacos")).success, "queued after failures");
    host.wait_idle();
    
    PollState poll;
    FactoryState factory;
    EXPECT(host.read(chain, poll, factory).success, "read");
    EXPECT(poll.nominations.size() == 3, "every message applied");
    EXPECT(poll.nominations["nom_2"].text == "Tacos", "inbox rescheduled");
    return 0;
}

static int test_state_survives_restart() {
    char path[] = "/tmp/rankpoll_host_XXXXXX";
    int fd = mkstemp(path);
    EXPECT(fd >= 0, "temp file");
    close(fd);
    std::string db(path);
    
    ChainId root;
    ChainId chain;
    bool joined = false;
    int result = 0;
    {
        PollStore store;
        if (!store.open(db) || !store.ensure_schema()) {
            result = 1;
        } else {
            ChainHost host(store);
            if (host.start()) {
                root = host.root_chain();
                chain = create_poll(host, "admin", "Persisted", 2);
                joined = host.execute_operation(chain, "alice", Operation::join("Alice", "alice")).success;
            }
            host.shutdown();
        }
    }
    
    PollState poll;
    FactoryState factory;
    ChainId third;
    size_t chain_count = 0;
    bool reloaded = false;
    if (result == 0) {
        PollStore store;
        if (store.open(db) && store.ensure_schema()) {
            ChainHost host(store);
            if (host.start() && host.root_chain() == root) {
                chain_count = host.chains().size();
                reloaded = host.read(chain, poll, factory).success;
                third = create_poll(host, "bob", "After restart", 1);
            }
            host.shutdown();
        }
    }
    
    std::remove(db.c_str());
    std::remove((db + "-wal").c_str());
    std::remove((db + "-shm").c_str());
    
    EXPECT(result == 0, "store opened");
    EXPECT(!root.empty() && !chain.empty() && joined, "first run created a poll");
    EXPECT(chain_count == 2 && reloaded, "both chains reloaded");
    EXPECT(poll.topic == "Persisted" && poll.admin_id == "admin", "poll state reloaded");
    EXPECT(poll.participants.size() == 2 && poll.participants["alice"] == "Alice", "participants reloaded");
    EXPECT(third == derive_chain_id(root, 1), "child numbering continues after restart");
    return 0;
}

int main() {
    Logger::instance().set_level(LogLevel::ERROR);
    int failures = 0;
    
    RUN_TEST(test_start_registers_root);
    RUN_TEST(test_unsigned_create_poll_opens_nothing);
    RUN_TEST(test_create_poll_initializes_new_chain);
    RUN_TEST(test_full_poll_lifecycle);
    RUN_TEST(test_unknown_chain);
    RUN_TEST(test_messages_run_in_arrival_order);
    RUN_TEST(test_rejected_message_reported_to_observer);
    RUN_TEST(test_state_survives_restart);
    RUN_TEST(test_calls_refused_after_shutdown);
    RUN_TEST(test_undelivered_messages_requeued_on_start);
    RUN_TEST(test_failing_observer_does_not_stall_chain);
    
    if (failures) {
        std::cout << "host_test: " << failures << " failed.\n";
        return 1;
    }
    std::cout << "host_test: Passed.\n";
    return 0;
}
