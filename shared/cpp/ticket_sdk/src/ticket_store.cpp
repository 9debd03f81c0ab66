#include "../include/ticket_store.hpp"
#include "../include/errors.hpp"
#include "../include/ticket_codec.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <cstdint>
#include <filesystem>
#include <utility>

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static void bind_claimed_at(sqlite3_stmt* st, int idx, const Ticket& t) {
    if (t.metadata.claimed_at) sqlite3_bind_int64(st, idx, to_epoch_ms(*t.metadata.claimed_at));
    else sqlite3_bind_null(st, idx);
}

// Statements are shared; leave each one reset with no bindings.
struct StmtGuard {
    sqlite3_stmt* st;
    ~StmtGuard() {
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
    }
};

TicketStore::TicketStore(const std::string& db_path, int busy_timeout_ms) : path_(db_path) {
    auto parent = std::filesystem::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("failed to open ticket store " + db_path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, busy_timeout_ms);
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

TicketStore::~TicketStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void TicketStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
    for (Stage s : kAllStages) {
        std::string table = stage_name(s);
        exec("CREATE TABLE IF NOT EXISTS " + table + " (\n"
             "  seq INTEGER PRIMARY KEY AUTOINCREMENT,\n"
             "  ticket_id TEXT NOT NULL UNIQUE,\n"
             "  is_drafted INTEGER NOT NULL DEFAULT 0,\n"
             "  needs_attention INTEGER NOT NULL DEFAULT 0,\n"
             "  claimed_at_ms INTEGER,\n"
             "  doc TEXT NOT NULL\n"
             ");");
    }
    exec("CREATE INDEX IF NOT EXISTS idx_pending_claim ON pending(is_drafted, needs_attention, seq);");
}

void TicketStore::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StoreError("SQLite error (" + std::to_string(rc) + "): " + msg);
    }
}

void TicketStore::rollback() noexcept {
    char* err = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::warn("[ticket-store] rollback failed: {}", err ? err : "unknown");
    }
    sqlite3_free(err);
}

sqlite3_stmt* TicketStore::prepare(const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        throw StoreError("prepare failed: " + std::string(sqlite3_errmsg(db_)) + " [" + sql + "]");
    }
    return st;
}

void TicketStore::prepare_statements() {
    for (Stage s : kAllStages) {
        std::string table = stage_name(s);
        auto& st = stmts(s);
        st.select_by_id = prepare("SELECT doc FROM " + table + " WHERE ticket_id = ?;");
        st.delete_by_id = prepare("DELETE FROM " + table + " WHERE ticket_id = ?;");
        st.insert = prepare("INSERT INTO " + table +
                            " (ticket_id, is_drafted, needs_attention, claimed_at_ms, doc) VALUES (?, ?, ?, ?, ?);");
        st.update_by_id = prepare("UPDATE " + table +
                                  " SET is_drafted = ?, needs_attention = ?, claimed_at_ms = ?, doc = ?"
                                  " WHERE ticket_id = ?;");
        st.recent = prepare("SELECT doc FROM " + table + " ORDER BY seq DESC LIMIT ?;");
        st.count = prepare("SELECT COUNT(*) FROM " + table + ";");
    }
    oldest_unclaimed_stmt_ = prepare(
        "SELECT seq, doc FROM pending WHERE is_drafted = 0 AND needs_attention = 0 ORDER BY seq ASC LIMIT 1;");
    stale_claims_stmt_ = prepare(
        "SELECT seq, doc FROM pending WHERE is_drafted = 1 AND needs_attention = 0"
        " AND claimed_at_ms IS NOT NULL AND claimed_at_ms < ? ORDER BY seq ASC;");
    count_attention_stmt_ = prepare("SELECT COUNT(*) FROM pending WHERE needs_attention = 1;");
    flag_attention_stmt_ = prepare("UPDATE pending SET needs_attention = 1 WHERE seq = ?;");
}

void TicketStore::close_statements() {
    auto fin = [](sqlite3_stmt*& st) { if (st) { sqlite3_finalize(st); st = nullptr; } };
    for (auto& st : stage_stmts_) {
        fin(st.select_by_id);
        fin(st.delete_by_id);
        fin(st.insert);
        fin(st.update_by_id);
        fin(st.recent);
        fin(st.count);
    }
    fin(oldest_unclaimed_stmt_);
    fin(stale_claims_stmt_);
    fin(count_attention_stmt_);
    fin(flag_attention_stmt_);
}

void TicketStore::fail(int rc, const std::string& what) {
    std::string msg = what + ": " + sqlite3_errmsg(db_);
    if ((rc & 0xff) == SQLITE_CONSTRAINT) throw DuplicateError(msg);
    throw StoreError(msg);
}

static Ticket decode_doc(sqlite3_stmt* st, int col) {
    const char* doc = reinterpret_cast<const char*>(sqlite3_column_text(st, col));
    try {
        return ticket_from_json(nlohmann::json::parse(doc ? doc : ""));
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(std::string("stored ticket is not JSON: ") + e.what());
    }
}

std::optional<Ticket> TicketStore::select_one(sqlite3_stmt* st) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) fail(rc, "select failed");
    return decode_doc(st, 0);
}

void TicketStore::flag_unreadable(std::int64_t seq, const std::string& why) {
    sqlite3_stmt* st = flag_attention_stmt_;
    StmtGuard g{st};
    sqlite3_bind_int64(st, 1, seq);
    int rc = sqlite3_step(st);
    if (rc != SQLITE_DONE) fail(rc, "flagging pending row failed");
    spdlog::error("[store] pending row {} flagged for attention: {}", seq, why);
}

std::vector<Ticket> TicketStore::select_all(sqlite3_stmt* st) {
    std::vector<Ticket> out;
    while (auto t = select_one(st)) out.push_back(std::move(*t));
    return out;
}

std::size_t TicketStore::count_unlocked(sqlite3_stmt* st) {
    StmtGuard g{st};
    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) fail(rc, "count failed");
    return (std::size_t)sqlite3_column_int64(st, 0);
}

std::optional<Ticket> TicketStore::find_unlocked(Stage stage, const std::string& ticket_id) {
    sqlite3_stmt* st = stmts(stage).select_by_id;
    StmtGuard g{st};
    bind_text(st, 1, ticket_id);
    return select_one(st);
}

std::optional<Ticket> TicketStore::take_unlocked(Stage stage, const std::string& ticket_id) {
    auto t = find_unlocked(stage, ticket_id);
    if (!t) return std::nullopt;
    sqlite3_stmt* st = stmts(stage).delete_by_id;
    StmtGuard g{st};
    bind_text(st, 1, ticket_id);
    int rc = sqlite3_step(st);
    if (rc != SQLITE_DONE) fail(rc, "delete from " + std::string(stage_name(stage)) + " failed");
    return t;
}

void TicketStore::insert_unlocked(Stage stage, const Ticket& t) {
    validate_for_stage(t, stage);
    if (auto where = locate_unlocked(t.ticket_id)) {
        throw DuplicateError("ticket '" + t.ticket_id + "' already exists in " + stage_name(*where));
    }
    sqlite3_stmt* st = stmts(stage).insert;
    StmtGuard g{st};
    bind_text(st, 1, t.ticket_id);
    sqlite3_bind_int(st, 2, t.metadata.is_drafted ? 1 : 0);
    sqlite3_bind_int(st, 3, t.metadata.needs_attention ? 1 : 0);
    bind_claimed_at(st, 4, t);
    bind_text(st, 5, ticket_to_json(t).dump());
    int rc = sqlite3_step(st);
    if (rc != SQLITE_DONE) fail(rc, "insert into " + std::string(stage_name(stage)) + " failed");
}

bool TicketStore::update_unlocked(Stage stage, const Ticket& t) {
    validate_for_stage(t, stage);
    sqlite3_stmt* st = stmts(stage).update_by_id;
    StmtGuard g{st};
    sqlite3_bind_int(st, 1, t.metadata.is_drafted ? 1 : 0);
    sqlite3_bind_int(st, 2, t.metadata.needs_attention ? 1 : 0);
    bind_claimed_at(st, 3, t);
    bind_text(st, 4, ticket_to_json(t).dump());
    bind_text(st, 5, t.ticket_id);
    int rc = sqlite3_step(st);
    if (rc != SQLITE_DONE) fail(rc, "update in " + std::string(stage_name(stage)) + " failed");
    return sqlite3_changes(db_) > 0;
}

std::optional<Stage> TicketStore::locate_unlocked(const std::string& ticket_id) {
    for (Stage s : kAllStages) {
        sqlite3_stmt* st = stmts(s).select_by_id;
        StmtGuard g{st};
        bind_text(st, 1, ticket_id);
        int rc = sqlite3_step(st);
        if (rc == SQLITE_ROW) return s;
        if (rc != SQLITE_DONE) fail(rc, "locate failed");
    }
    return std::nullopt;
}

void TicketStore::transaction(const std::function<void(Txn&)>& fn) {
    std::lock_guard<std::mutex> lock(mtx_);
    exec("BEGIN IMMEDIATE;");
    try {
        Txn tx(*this);
        fn(tx);
        exec("COMMIT;");
    } catch (...) {
        rollback();
        throw;
    }
}

std::optional<Ticket> TicketStore::Txn::find(Stage stage, const std::string& ticket_id) {
    return store_.find_unlocked(stage, ticket_id);
}

std::optional<Ticket> TicketStore::Txn::take(Stage stage, const std::string& ticket_id) {
    return store_.take_unlocked(stage, ticket_id);
}

void TicketStore::Txn::insert(Stage stage, const Ticket& t) {
    store_.insert_unlocked(stage, t);
}

bool TicketStore::Txn::update(Stage stage, const Ticket& t) {
    return store_.update_unlocked(stage, t);
}

std::optional<Stage> TicketStore::Txn::locate(const std::string& ticket_id) {
    return store_.locate_unlocked(ticket_id);
}

// Rows that do not decode or do not pass the pending schema are flagged
// needs_attention by seq and skipped, so one bad record cannot block the queue.
std::optional<Ticket> TicketStore::Txn::oldest_unclaimed() {
    for (;;) {
        std::int64_t seq = 0;
        std::string why;
        {
            sqlite3_stmt* st = store_.oldest_unclaimed_stmt_;
            StmtGuard g{st};
            int rc = sqlite3_step(st);
            if (rc == SQLITE_DONE) return std::nullopt;
            if (rc != SQLITE_ROW) store_.fail(rc, "select oldest unclaimed failed");
            seq = sqlite3_column_int64(st, 0);
            try {
                Ticket t = decode_doc(st, 1);
                validate_for_stage(t, Stage::Pending);
                return t;
            } catch (const ParseError& e) {
                why = e.what();
            } catch (const SchemaError& e) {
                why = e.what();
            }
        }
        store_.flag_unreadable(seq, why);
    }
}

void TicketStore::Txn::clear(Stage stage) {
    store_.exec(std::string("DELETE FROM ") + stage_name(stage) + ";");
}

std::vector<Ticket> TicketStore::Txn::stale_claims(TimePoint claimed_before) {
    std::vector<Ticket> out;
    std::vector<std::pair<std::int64_t, std::string>> unreadable;
    {
        sqlite3_stmt* st = store_.stale_claims_stmt_;
        StmtGuard g{st};
        sqlite3_bind_int64(st, 1, to_epoch_ms(claimed_before));
        int rc;
        while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
            try {
                out.push_back(decode_doc(st, 1));
            } catch (const ParseError& e) {
                unreadable.emplace_back(sqlite3_column_int64(st, 0), e.what());
            }
        }
        if (rc != SQLITE_DONE) store_.fail(rc, "select stale claims failed");
    }
    for (const auto& u : unreadable) store_.flag_unreadable(u.first, u.second);
    return out;
}

void TicketStore::insert(Stage stage, const Ticket& t) {
    transaction([&](Txn& tx) { tx.insert(stage, t); });
}

std::optional<Ticket> TicketStore::find(Stage stage, const std::string& ticket_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    return find_unlocked(stage, ticket_id);
}

std::optional<Ticket> TicketStore::find_and_delete(Stage stage, const std::string& ticket_id) {
    std::optional<Ticket> out;
    transaction([&](Txn& tx) { out = tx.take(stage, ticket_id); });
    return out;
}

std::optional<Ticket> TicketStore::find_and_update_unclaimed(const std::function<void(Ticket&)>& mutate) {
    std::optional<Ticket> out;
    transaction([&](Txn& tx) {
        auto t = tx.oldest_unclaimed();
        if (!t) return;
        mutate(*t);
        tx.update(Stage::Pending, *t);
        out = std::move(t);
    });
    return out;
}

std::vector<Ticket> TicketStore::list_recent(Stage stage, int limit) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_stmt* st = stmts(stage).recent;
    StmtGuard g{st};
    sqlite3_bind_int(st, 1, limit);
    return select_all(st);
}

std::size_t TicketStore::count(Stage stage) {
    std::lock_guard<std::mutex> lock(mtx_);
    return count_unlocked(stmts(stage).count);
}

std::size_t TicketStore::count_needs_attention() {
    std::lock_guard<std::mutex> lock(mtx_);
    return count_unlocked(count_attention_stmt_);
}

std::optional<Stage> TicketStore::locate(const std::string& ticket_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    return locate_unlocked(ticket_id);
}

void TicketStore::clear(Stage stage) {
    std::lock_guard<std::mutex> lock(mtx_);
    exec(std::string("DELETE FROM ") + stage_name(stage) + ";");
    spdlog::info("[ticket-store] cleared {}", stage_name(stage));
}
