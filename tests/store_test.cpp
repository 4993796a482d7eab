/*
 * PollStore persistence against an in-memory database.
 */
#include <rankpoll/storage/poll_store.hpp>
#include <rankpoll/core/logger.hpp>
#include "check.hpp"

#include <iostream>

using namespace rankpoll;

namespace {

const ChainId CHAIN_A(64, 'a');
const ChainId CHAIN_B(64, 'b');

bool open_store(PollStore& store) {
    return store.open(":memory:") && store.ensure_schema();
}

ChainRecord make_chain(const ChainId& id, const ChainId& parent, const std::string& owner,
                       Amount balance, int64_t created_at) {
    ChainRecord r;
    r.id = id;
    r.parent = parent;
    r.owner = owner;
    r.balance = balance;
    r.created_at = created_at;
    return r;
}

PollState closed_poll() {
    PollState s;
    s.topic = "Lunch spot";
    s.votes_per_voter = 3;
    s.admin_id = "admin";
    s.has_started = true;
    s.is_closed = true;
    s.participants["admin"] = "Admin";
    s.participants["alice"] = "Alice \"Al\" O'Neil";
    s.nominations["nom_0"] = Nomination("alice", "Pizza");
    s.nominations["nom_1"] = Nomination("admin", "Sushi");
    s.rankings["alice"].push_back("nom_0");
    s.rankings["alice"].push_back("nom_1");
    s.rankings["admin"].push_back("nom_1");
    s.results.push_back(ResultEntry("nom_1", "Sushi", 5));
    s.results.push_back(ResultEntry("nom_0", "Pizza", 3));
    return s;
}

} // anonymous namespace

static int test_missing_chain_state_is_default() {
    PollStore store;
    EXPECT(open_store(store), "open");
    
    PollState poll;
    FactoryState factory;
    poll.topic = "stale";
    EXPECT(store.load_state(CHAIN_A, poll, factory), "load succeeds");
    EXPECT(poll.topic.empty() && !poll.is_initialized(), "default poll state");
    EXPECT(poll.votes_per_voter == 0 && !poll.has_started && !poll.is_closed, "default flags");
    EXPECT(poll.participants.empty() && poll.nominations.empty() && poll.rankings.empty(), "empty maps");
    EXPECT(poll.results.empty() && factory.created_polls.empty(), "empty lists");
    return 0;
}

static int test_state_survives_round_trip() {
    PollStore store;
    EXPECT(open_store(store), "open");
    
    PollState saved = closed_poll();
    FactoryState factory;
    factory.created_polls["alice"].push_back(CHAIN_B);
    factory.created_polls["alice"].push_back(CHAIN_A);
    EXPECT(store.save_state(CHAIN_A, saved, factory), "save");
    
    PollState poll;
    FactoryState loaded;
    EXPECT(store.load_state(CHAIN_A, poll, loaded), "load");
    EXPECT(poll.topic == saved.topic, "topic");
    EXPECT(poll.votes_per_voter == 3, "votes per voter");
    EXPECT(poll.admin_id == "admin", "admin");
    EXPECT(poll.has_started && poll.is_closed, "flags");
    EXPECT(poll.participants == saved.participants, "participants, quotes intact");
    EXPECT(poll.nominations.size() == 2, "nominations");
    EXPECT(poll.nominations["nom_0"].user_id == "alice" && poll.nominations["nom_0"].text == "Pizza", "nom_0");
    EXPECT(poll.rankings == saved.rankings, "rankings keep their order");
    EXPECT(poll.results == saved.results, "results keep their order");
    
    const std::vector<ChainId>& created = loaded.polls_created_by("alice");
    EXPECT(created.size() == 2 && created[0] == CHAIN_B && created[1] == CHAIN_A, "creation order kept");
    EXPECT(loaded.polls_created_by("bob").empty(), "unknown user");
    return 0;
}

static int test_save_replaces_previous_rows() {
    PollStore store;
    EXPECT(open_store(store), "open");
    
    FactoryState factory;
    EXPECT(store.save_state(CHAIN_A, closed_poll(), factory), "first save");
    
    PollState fresh;
    fresh.topic = "Second";
    fresh.admin_id = "bob";
    fresh.participants["bob"] = "Admin";
    EXPECT(store.save_state(CHAIN_A, fresh, factory), "second save");
    
    PollState poll;
    FactoryState loaded;
    EXPECT(store.load_state(CHAIN_A, poll, loaded), "load");
    EXPECT(poll.topic == "Second" && !poll.is_closed, "registers replaced");
    EXPECT(poll.participants.size() == 1 && poll.participants["bob"] == "Admin", "old participants gone");
    EXPECT(poll.nominations.empty() && poll.rankings.empty(), "old nominations and rankings gone");
    EXPECT(poll.results.empty(), "old results gone");
    return 0;
}

static int test_chains_are_isolated() {
    PollStore store;
    EXPECT(open_store(store), "open");
    
    FactoryState factory;
    EXPECT(store.save_state(CHAIN_A, closed_poll(), factory), "save A");
    
    PollState poll;
    FactoryState loaded;
    EXPECT(store.load_state(CHAIN_B, poll, loaded), "load B");
    EXPECT(!poll.is_initialized() && poll.participants.empty(), "B unaffected by A");
    return 0;
}

static int test_chain_registry() {
    PollStore store;
    EXPECT(open_store(store), "open");
    
    EXPECT(store.upsert_chain(make_chain(CHAIN_A, "", "root", 0, 100)), "root");
    EXPECT(store.upsert_chain(make_chain(CHAIN_B, CHAIN_A, "alice", 10, 200)), "child");
    
    ChainRecord r;
    EXPECT(store.get_chain(CHAIN_B, r), "get child");
    EXPECT(r.parent == CHAIN_A && r.owner == "alice" && r.balance == 10 && r.created_at == 200, "fields");
    EXPECT(!store.get_chain(ChainId(64, 'c'), r), "unknown chain");
    
    std::vector<ChainRecord> all = store.list_chains();
    EXPECT(all.size() == 2 && all[0].id == CHAIN_A && all[1].id == CHAIN_B, "ordered by creation");
    
    EXPECT(store.upsert_chain(make_chain(CHAIN_B, CHAIN_A, "alice", 7, 200)), "update");
    EXPECT(store.get_chain(CHAIN_B, r) && r.balance == 7, "balance updated");
    EXPECT(store.list_chains().size() == 2, "no duplicate");
    return 0;
}

static int test_save_registers_opened_chains() {
    PollStore store;
    EXPECT(open_store(store), "open");
    EXPECT(store.upsert_chain(make_chain(CHAIN_A, "", "root", 0, 100)), "root");
    
    PollState poll;
    FactoryState factory;
    factory.created_polls["alice"].push_back(CHAIN_B);
    CallEffects effects;
    effects.opened.push_back(make_chain(CHAIN_B, CHAIN_A, "alice", 10, 150));
    effects.outbox.push_back(PendingMessage(CHAIN_B, Message::initialize_poll("Lunch", 3, "alice")));
    EXPECT(store.save_state(CHAIN_A, poll, factory, effects), "save with opened chain");
    
    ChainRecord r;
    EXPECT(store.get_chain(CHAIN_B, r) && r.owner == "alice" && r.parent == CHAIN_A, "child registered");
    EXPECT(effects.outbox[0].seq > 0, "outbox entry numbered");
    
    std::vector<PendingMessage> pending;
    EXPECT(store.load_pending(pending) && pending.size() == 1, "initialization queued with the commit");
    EXPECT(pending[0].target == CHAIN_B, "target");
    EXPECT(pending[0].message.kind == MessageKind::INITIALIZE_POLL, "kind");
    EXPECT(pending[0].message.topic == "Lunch" && pending[0].message.votes_per_voter == 3, "payload");
    EXPECT(pending[0].message.user_id == "alice", "admin");
    return 0;
}

static int test_outbox_order_and_consumption() {
    PollStore store;
    EXPECT(open_store(store), "open");
    
    PendingMessage first(CHAIN_A, Message::nominate("alice", "Pizza"));
    std::vector<std::string> ranking;
    ranking.push_back("nom_1");
    ranking.push_back("nom_0");
    PendingMessage second(CHAIN_A, Message::vote("alice", ranking));
    PendingMessage third(CHAIN_B, Message::close_poll("admin"));
    EXPECT(store.enqueue_message(first) && store.enqueue_message(second) && store.enqueue_message(third),
           "enqueue");
    EXPECT(first.seq < second.seq && second.seq < third.seq, "increasing seq");
    
    std::vector<PendingMessage> pending;
    EXPECT(store.load_pending(pending) && pending.size() == 3, "all queued");
    EXPECT(pending[0].message.text == "Pizza", "first in order");
    EXPECT(pending[1].message.rankings == ranking, "ranking list kept");
    EXPECT(pending[2].target == CHAIN_B && pending[2].message.kind == MessageKind::CLOSE_POLL, "third");
    
    // Handling a message commits its removal with the target's state
    PollState poll;
    FactoryState factory;
    CallEffects effects;
    effects.consumed = first.seq;
    EXPECT(store.save_state(CHAIN_A, poll, factory, effects), "save consuming first");
    EXPECT(store.remove_message(third.seq), "rejected message removed");
    
    EXPECT(store.load_pending(pending) && pending.size() == 1, "one left");
    EXPECT(pending[0].seq == second.seq, "second remains");
    return 0;
}

static int test_meta() {
    PollStore store;
    EXPECT(open_store(store), "open");
    EXPECT(store.get_meta("root_chain", "none") == "none", "default");
    EXPECT(store.set_meta("root_chain", CHAIN_A), "set");
    EXPECT(store.get_meta("root_chain") == CHAIN_A, "get");
    EXPECT(store.set_meta("root_chain", CHAIN_B), "overwrite");
    EXPECT(store.get_meta("root_chain") == CHAIN_B, "overwritten");
    return 0;
}

static int test_closed_store_reports_errors() {
    PollStore store;
    EXPECT(!store.is_open(), "not open");
    PollState poll;
    FactoryState factory;
    EXPECT(!store.load_state(CHAIN_A, poll, factory), "load fails");
    EXPECT(!store.save_state(CHAIN_A, poll, factory), "save fails");
    EXPECT(!store.last_error().empty(), "error recorded");
    return 0;
}

int main() {
    Logger::instance().set_level(LogLevel::ERROR);
    int failures = 0;
    
    RUN_TEST(test_missing_chain_state_is_default);
    RUN_TEST(test_state_survives_round_trip);
    RUN_TEST(test_save_replaces_previous_rows);
    RUN_TEST(test_chains_are_isolated);
    RUN_TEST(test_chain_registry);
    RUN_TEST(test_save_registers_opened_chains);
    RUN_TEST(test_outbox_order_and_consumption);
    RUN_TEST(test_meta);
    RUN_TEST(test_closed_store_reports_errors);
    
    if (failures) {
        std::cout << "store_test: " << failures << " failed.\n";
        return 1;
    }
    std::cout << "store_test: Passed.\n";
    return 0;
}
