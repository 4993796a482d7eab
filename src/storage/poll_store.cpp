/*
 * rankpoll - SQLite Poll Store Implementation
 *
 * Every write that belongs to one call runs inside a single
 * BEGIN IMMEDIATE transaction.
 */
#include <rankpoll/storage/poll_store.hpp>
#include <rankpoll/core/json.hpp>
#include <rankpoll/core/logger.hpp>
#include <cstdlib>

namespace rankpoll {

namespace {

// Prepared statement finalized on scope exit
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : stmt_(nullptr) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    
    bool ok() const { return rc_ == SQLITE_OK; }
    
    void bind(int idx, const std::string& value) {
        sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }
    void bind(int idx, int64_t value) {
        sqlite3_bind_int64(stmt_, idx, value);
    }
    
    int step() { return sqlite3_step(stmt_); }
    
    std::string text(int col) const {
        const unsigned char* p = sqlite3_column_text(stmt_, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    }
    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }

private:
    Statement(const Statement&);
    Statement& operator=(const Statement&);
    
    sqlite3_stmt* stmt_;
    int rc_;
};

const char* const REG_TOPIC = "topic";
const char* const REG_VOTES_PER_VOTER = "votes_per_voter";
const char* const REG_ADMIN_ID = "admin_id";
const char* const REG_HAS_STARTED = "has_started";
const char* const REG_IS_CLOSED = "is_closed";
const char* const REG_RESULTS = "results";

std::string results_to_text(const std::vector<ResultEntry>& results) {
    Json arr = Json::array();
    for (size_t i = 0; i < results.size(); ++i) {
        Json entry = Json::object();
        entry.set("nominationId", results[i].nomination_id);
        entry.set("text", results[i].text);
        entry.set("score", static_cast<int64_t>(results[i].score));
        arr.push(entry);
    }
    return arr.dump();
}

std::vector<ResultEntry> results_from_text(const std::string& text) {
    std::vector<ResultEntry> results;
    Json arr = Json::parse(text);
    const std::vector<Json>& items = arr.as_array();
    for (size_t i = 0; i < items.size(); ++i) {
        results.push_back(ResultEntry(items[i].get_string("nominationId"),
                                      items[i].get_string("text"),
                                      static_cast<uint64_t>(items[i].get_int("score"))));
    }
    return results;
}

} // anonymous namespace

PollStore::PollStore() 
    : db_(nullptr)
{
}

PollStore::~PollStore() {
    close();
}

bool PollStore::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        set_error_from_db();
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    
    // WAL is ignored for :memory: databases
    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");
    
    LOG_DEBUG("PollStore: opened %s", db_path.c_str());
    return true;
}

void PollStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool PollStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

bool PollStore::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }
    
    if (!exec(
        "CREATE TABLE IF NOT EXISTS meta ("
        "  key TEXT PRIMARY KEY,"
        "  value TEXT"
        ")"
    )) return false;
    
    if (!exec(
        "CREATE TABLE IF NOT EXISTS chains ("
        "  id TEXT PRIMARY KEY,"
        "  parent TEXT NOT NULL DEFAULT '',"
        "  owner TEXT NOT NULL,"
        "  balance INTEGER NOT NULL DEFAULT 0,"
        "  created_at INTEGER NOT NULL DEFAULT 0"
        ")"
    )) return false;
    
    // Scalar registers: topic, votes_per_voter, admin_id, has_started,
    // is_closed, results (JSON)
    if (!exec(
        "CREATE TABLE IF NOT EXISTS registers ("
        "  chain_id TEXT NOT NULL,"
        "  key TEXT NOT NULL,"
        "  value TEXT NOT NULL,"
        "  PRIMARY KEY (chain_id, key)"
        ")"
    )) return false;
    
    if (!exec(
        "CREATE TABLE IF NOT EXISTS participants ("
        "  chain_id TEXT NOT NULL,"
        "  user_id TEXT NOT NULL,"
        "  name TEXT NOT NULL,"
        "  PRIMARY KEY (chain_id, user_id)"
        ")"
    )) return false;
    
    if (!exec(
        "CREATE TABLE IF NOT EXISTS nominations ("
        "  chain_id TEXT NOT NULL,"
        "  nomination_id TEXT NOT NULL,"
        "  user_id TEXT NOT NULL,"
        "  text TEXT NOT NULL,"
        "  PRIMARY KEY (chain_id, nomination_id)"
        ")"
    )) return false;
    
    // nomination_ids is a JSON array, best choice first
    if (!exec(
        "CREATE TABLE IF NOT EXISTS rankings ("
        "  chain_id TEXT NOT NULL,"
        "  user_id TEXT NOT NULL,"
        "  nomination_ids TEXT NOT NULL,"
        "  PRIMARY KEY (chain_id, user_id)"
        ")"
    )) return false;
    
    if (!exec(
        "CREATE TABLE IF NOT EXISTS created_polls ("
        "  chain_id TEXT NOT NULL,"
        "  user_id TEXT NOT NULL,"
        "  seq INTEGER NOT NULL,"
        "  poll_chain TEXT NOT NULL,"
        "  PRIMARY KEY (chain_id, user_id, seq)"
        ")"
    )) return false;
    
    // body is the message's JSON form, kind its message name
    if (!exec(
        "CREATE TABLE IF NOT EXISTS pending_messages ("
        "  seq INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  target TEXT NOT NULL,"
        "  kind TEXT NOT NULL,"
        "  body TEXT NOT NULL"
        ")"
    )) return false;
    
    return true;
}

// ============ Chain registry ============

bool PollStore::upsert_chain(const ChainRecord& chain) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }
    return write_chain(chain);
}

bool PollStore::write_chain(const ChainRecord& chain) {
    Statement stmt(db_,
        "INSERT OR REPLACE INTO chains (id, parent, owner, balance, created_at) "
        "VALUES (?, ?, ?, ?, ?)");
    if (!stmt.ok()) {
        set_error_from_db();
        return false;
    }
    
    stmt.bind(1, chain.id);
    stmt.bind(2, chain.parent);
    stmt.bind(3, chain.owner);
    stmt.bind(4, static_cast<int64_t>(chain.balance));
    stmt.bind(5, chain.created_at);
    
    if (stmt.step() != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

bool PollStore::get_chain(const ChainId& id, ChainRecord& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }
    
    Statement stmt(db_, "SELECT id, parent, owner, balance, created_at FROM chains WHERE id = ?");
    if (!stmt.ok()) {
        set_error_from_db();
        return false;
    }
    stmt.bind(1, id);
    
    if (stmt.step() != SQLITE_ROW) return false;
    
    out.id = stmt.text(0);
    out.parent = stmt.text(1);
    out.owner = stmt.text(2);
    out.balance = static_cast<Amount>(stmt.int64(3));
    out.created_at = stmt.int64(4);
    return true;
}

std::vector<ChainRecord> PollStore::list_chains() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChainRecord> result;
    if (!db_) return result;
    
    Statement stmt(db_, "SELECT id, parent, owner, balance, created_at FROM chains ORDER BY created_at, id");
    if (!stmt.ok()) {
        set_error_from_db();
        return result;
    }
    
    while (stmt.step() == SQLITE_ROW) {
        ChainRecord c;
        c.id = stmt.text(0);
        c.parent = stmt.text(1);
        c.owner = stmt.text(2);
        c.balance = static_cast<Amount>(stmt.int64(3));
        c.created_at = stmt.int64(4);
        result.push_back(c);
    }
    return result;
}

// ============ Poll state ============

bool PollStore::load_state(const ChainId& chain, PollState& poll, FactoryState& factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    poll = PollState();
    factory = FactoryState();
    if (!db_) {
        set_error("Database not open");
        return false;
    }
    
    return load_registers(chain, poll)
        && load_participants(chain, poll)
        && load_nominations(chain, poll)
        && load_rankings(chain, poll)
        && load_created_polls(chain, factory);
}

bool PollStore::load_registers(const ChainId& chain, PollState& poll) {
    Statement stmt(db_, "SELECT key, value FROM registers WHERE chain_id = ?");
    if (!stmt.ok()) {
        set_error_from_db();
        return false;
    }
    stmt.bind(1, chain);
    
    while (stmt.step() == SQLITE_ROW) {
        std::string key = stmt.text(0);
        std::string value = stmt.text(1);
        if (key == REG_TOPIC) {
            poll.topic = value;
        } else if (key == REG_VOTES_PER_VOTER) {
            poll.votes_per_voter = static_cast<uint32_t>(std::strtoul(value.c_str(), NULL, 10));
        } else if (key == REG_ADMIN_ID) {
            poll.admin_id = value;
        } else if (key == REG_HAS_STARTED) {
            poll.has_started = value == "1";
        } else if (key == REG_IS_CLOSED) {
            poll.is_closed = value == "1";
        } else if (key == REG_RESULTS) {
            try {
                poll.results = results_from_text(value);
            } catch (const std::exception& e) {
                set_error(std::string("corrupt results register: ") + e.what());
                return false;
            }
        } else {
            LOG_WARN("PollStore: ignoring unknown register '%s' on chain %s", key.c_str(), chain.c_str());
        }
    }
    return true;
}

bool PollStore::load_participants(const ChainId& chain, PollState& poll) {
    Statement stmt(db_, "SELECT user_id, name FROM participants WHERE chain_id = ?");
    if (!stmt.ok()) {
        set_error_from_db();
        return false;
    }
    stmt.bind(1, chain);
    
    while (stmt.step() == SQLITE_ROW) {
        poll.participants[stmt.text(0)] = stmt.text(1);
    }
    return true;
}

bool PollStore::load_nominations(const ChainId& chain, PollState& poll) {
    Statement stmt(db_, "SELECT nomination_id, user_id, text FROM nominations WHERE chain_id = ?");
    if (!stmt.ok()) {
        set_error_from_db();
        return false;
    }
    stmt.bind(1, chain);
    
    while (stmt.step() == SQLITE_ROW) {
        poll.nominations[stmt.text(0)] = Nomination(stmt.text(1), stmt.text(2));
    }
    return true;
}

bool PollStore::load_rankings(const ChainId& chain, PollState& poll) {
    Statement stmt(db_, "SELECT user_id, nomination_ids FROM rankings WHERE chain_id = ?");
    if (!stmt.ok()) {
        set_error_from_db();
        return false;
    }
    stmt.bind(1, chain);
    
    while (stmt.step() == SQLITE_ROW) {
        std::string user_id = stmt.text(0);
        try {
            poll.rankings[user_id] = Json::parse(stmt.text(1)).to_strings();
        } catch (const std::exception& e) {
            set_error("corrupt ranking for " + user_id + ": " + e.what());
            return false;
        }
    }
    return true;
}

bool PollStore::load_created_polls(const ChainId& chain, FactoryState& factory) {
    Statement stmt(db_,
        "SELECT user_id, poll_chain FROM created_polls WHERE chain_id = ? ORDER BY user_id, seq");
    if (!stmt.ok()) {
        set_error_from_db();
        return false;
    }
    stmt.bind(1, chain);
    
    while (stmt.step() == SQLITE_ROW) {
        factory.created_polls[stmt.text(0)].push_back(stmt.text(1));
    }
    return true;
}

bool PollStore::save_state(const ChainId& chain, const PollState& poll, const FactoryState& factory) {
    CallEffects effects;
    return save_state(chain, poll, factory, effects);
}

bool PollStore::save_state(const ChainId& chain, const PollState& poll, const FactoryState& factory,
                           CallEffects& effects) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }
    
    if (!exec("BEGIN IMMEDIATE")) return false;
    
    bool written = write_state(chain, poll, factory);
    for (size_t i = 0; written && i < effects.opened.size(); ++i) {
        written = write_chain(effects.opened[i]);
    }
    for (size_t i = 0; written && i < effects.outbox.size(); ++i) {
        written = write_message(effects.outbox[i]);
    }
    if (written && effects.consumed != 0) {
        written = delete_message(effects.consumed);
    }
    
    if (!written) {
        std::string error = last_error_;
        exec("ROLLBACK");
        last_error_ = error;
        LOG_ERROR("PollStore: saving chain %s failed: %s", chain.c_str(), error.c_str());
        return false;
    }
    
    if (!exec("COMMIT")) {
        std::string error = last_error_;
        exec("ROLLBACK");
        last_error_ = error;
        LOG_ERROR("PollStore: committing chain %s failed: %s", chain.c_str(), error.c_str());
        return false;
    }
    return true;
}

// ============ Outbox ============

bool PollStore::enqueue_message(PendingMessage& pending) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }
    return write_message(pending);
}

bool PollStore::remove_message(int64_t seq) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }
    return delete_message(seq);
}

bool PollStore::load_pending(std::vector<PendingMessage>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out.clear();
    if (!db_) {
        set_error("Database not open");
        return false;
    }
    
    Statement stmt(db_, "SELECT seq, target, kind, body FROM pending_messages ORDER BY seq");
    if (!stmt.ok()) {
        set_error_from_db();
        return false;
    }
    
    while (stmt.step() == SQLITE_ROW) {
        PendingMessage pending;
        pending.seq = stmt.int64(0);
        pending.target = stmt.text(1);
        try {
            pending.message = Message::from_json(stmt.text(2), Json::parse(stmt.text(3)));
        } catch (const std::exception& e) {
            // Left in place for inspection; it can never be delivered
            LOG_ERROR("PollStore: skipping corrupt pending message %lld: %s",
                      static_cast<long long>(pending.seq), e.what());
            continue;
        }
        out.push_back(pending);
    }
    return true;
}

bool PollStore::write_message(PendingMessage& pending) {
    Statement stmt(db_, "INSERT INTO pending_messages (target, kind, body) VALUES (?, ?, ?)");
    if (!stmt.ok()) {
        set_error_from_db();
        return false;
    }
    stmt.bind(1, pending.target);
    stmt.bind(2, std::string(Message::kind_name(pending.message.kind)));
    stmt.bind(3, pending.message.to_json().dump());
    if (stmt.step() != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    pending.seq = static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
    return true;
}

bool PollStore::delete_message(int64_t seq) {
    Statement stmt(db_, "DELETE FROM pending_messages WHERE seq = ?");
    if (!stmt.ok()) {
        set_error_from_db();
        return false;
    }
    stmt.bind(1, seq);
    if (stmt.step() != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

bool PollStore::put_register(const ChainId& chain, const char* key, const std::string& value) {
    Statement stmt(db_, "INSERT INTO registers (chain_id, key, value) VALUES (?, ?, ?)");
    if (!stmt.ok()) {
        set_error_from_db();
        return false;
    }
    stmt.bind(1, chain);
    stmt.bind(2, std::string(key));
    stmt.bind(3, value);
    if (stmt.step() != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

bool PollStore::write_state(const ChainId& chain, const PollState& poll, const FactoryState& factory) {
    static const char* tables[] = {
        "DELETE FROM registers WHERE chain_id = ?",
        "DELETE FROM participants WHERE chain_id = ?",
        "DELETE FROM nominations WHERE chain_id = ?",
        "DELETE FROM rankings WHERE chain_id = ?",
        "DELETE FROM created_polls WHERE chain_id = ?"
    };
    for (size_t i = 0; i < sizeof(tables) / sizeof(tables[0]); ++i) {
        Statement stmt(db_, tables[i]);
        if (!stmt.ok()) {
            set_error_from_db();
            return false;
        }
        stmt.bind(1, chain);
        if (stmt.step() != SQLITE_DONE) {
            set_error_from_db();
            return false;
        }
    }
    
    if (!put_register(chain, REG_TOPIC, poll.topic)) return false;
    if (!put_register(chain, REG_VOTES_PER_VOTER, std::to_string(poll.votes_per_voter))) return false;
    if (!put_register(chain, REG_ADMIN_ID, poll.admin_id)) return false;
    if (!put_register(chain, REG_HAS_STARTED, poll.has_started ? "1" : "0")) return false;
    if (!put_register(chain, REG_IS_CLOSED, poll.is_closed ? "1" : "0")) return false;
    if (!put_register(chain, REG_RESULTS, results_to_text(poll.results))) return false;
    
    for (std::map<std::string, std::string>::const_iterator it = poll.participants.begin();
         it != poll.participants.end(); ++it) {
        Statement stmt(db_, "INSERT INTO participants (chain_id, user_id, name) VALUES (?, ?, ?)");
        if (!stmt.ok()) {
            set_error_from_db();
            return false;
        }
        stmt.bind(1, chain);
        stmt.bind(2, it->first);
        stmt.bind(3, it->second);
        if (stmt.step() != SQLITE_DONE) {
            set_error_from_db();
            return false;
        }
    }
    
    for (std::map<std::string, Nomination>::const_iterator it = poll.nominations.begin();
         it != poll.nominations.end(); ++it) {
        Statement stmt(db_,
            "INSERT INTO nominations (chain_id, nomination_id, user_id, text) VALUES (?, ?, ?, ?)");
        if (!stmt.ok()) {
            set_error_from_db();
            return false;
        }
        stmt.bind(1, chain);
        stmt.bind(2, it->first);
        stmt.bind(3, it->second.user_id);
        stmt.bind(4, it->second.text);
        if (stmt.step() != SQLITE_DONE) {
            set_error_from_db();
            return false;
        }
    }
    
    for (std::map<std::string, std::vector<std::string> >::const_iterator it = poll.rankings.begin();
         it != poll.rankings.end(); ++it) {
        Statement stmt(db_, "INSERT INTO rankings (chain_id, user_id, nomination_ids) VALUES (?, ?, ?)");
        if (!stmt.ok()) {
            set_error_from_db();
            return false;
        }
        stmt.bind(1, chain);
        stmt.bind(2, it->first);
        stmt.bind(3, Json::from_strings(it->second).dump());
        if (stmt.step() != SQLITE_DONE) {
            set_error_from_db();
            return false;
        }
    }
    
    for (std::map<std::string, std::vector<ChainId> >::const_iterator it = factory.created_polls.begin();
         it != factory.created_polls.end(); ++it) {
        for (size_t seq = 0; seq < it->second.size(); ++seq) {
            Statement stmt(db_,
                "INSERT INTO created_polls (chain_id, user_id, seq, poll_chain) VALUES (?, ?, ?, ?)");
            if (!stmt.ok()) {
                set_error_from_db();
                return false;
            }
            stmt.bind(1, chain);
            stmt.bind(2, it->first);
            stmt.bind(3, static_cast<int64_t>(seq));
            stmt.bind(4, it->second[seq]);
            if (stmt.step() != SQLITE_DONE) {
                set_error_from_db();
                return false;
            }
        }
    }
    
    return true;
}

// ============ Meta ============

bool PollStore::set_meta(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;
    
    Statement stmt(db_, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)");
    if (!stmt.ok()) {
        set_error_from_db();
        return false;
    }
    stmt.bind(1, key);
    stmt.bind(2, value);
    
    if (stmt.step() != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

std::string PollStore::get_meta(const std::string& key, const std::string& default_val) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return default_val;
    
    Statement stmt(db_, "SELECT value FROM meta WHERE key = ?");
    if (!stmt.ok()) return default_val;
    stmt.bind(1, key);
    
    if (stmt.step() == SQLITE_ROW) {
        return stmt.text(0);
    }
    return default_val;
}

std::string PollStore::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool PollStore::exec(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        if (err_msg) {
            last_error_ = err_msg;
            sqlite3_free(err_msg);
        } else {
            set_error_from_db();
        }
        return false;
    }
    return true;
}

void PollStore::set_error(const std::string& error) {
    last_error_ = error;
}

void PollStore::set_error_from_db() {
    if (db_) {
        last_error_ = sqlite3_errmsg(db_);
    }
}

} // namespace rankpoll
