#pragma once
#include "ticket.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

// The four lifecycle stores, one SQLite table each, in a single database file
// shared by every worker and review process. Writes run inside
// BEGIN IMMEDIATE transactions so concurrent connections serialize on the
// database write lock.
class TicketStore {
public:
    // Primitives available inside transaction(). Every call joins the
    // enclosing transaction; none of them lock or commit on their own.
    class Txn {
    public:
        std::optional<Ticket> find(Stage stage, const std::string& ticket_id);
        std::optional<Ticket> take(Stage stage, const std::string& ticket_id); // find-and-delete
        void insert(Stage stage, const Ticket& t);
        bool update(Stage stage, const Ticket& t);
        std::optional<Stage> locate(const std::string& ticket_id);
        // Skips, and flags needs_attention, pending rows that cannot be read back.
        std::optional<Ticket> oldest_unclaimed();
        std::vector<Ticket> stale_claims(TimePoint claimed_before);
        void clear(Stage stage);

    private:
        friend class TicketStore;
        explicit Txn(TicketStore& store) : store_(store) {}
        TicketStore& store_;
    };

    explicit TicketStore(const std::string& db_path, int busy_timeout_ms = 15000);
    ~TicketStore();

    TicketStore(const TicketStore&) = delete;
    TicketStore& operator=(const TicketStore&) = delete;

    // Runs `fn` in one IMMEDIATE transaction; any exception rolls back and is rethrown.
    // `fn` must not call back into this store outside of the Txn it is given.
    void transaction(const std::function<void(Txn&)>& fn);

    void insert(Stage stage, const Ticket& t);
    std::optional<Ticket> find(Stage stage, const std::string& ticket_id);
    std::optional<Ticket> find_and_delete(Stage stage, const std::string& ticket_id);
    // Atomically picks the oldest pending ticket that is neither claimed nor
    // flagged, applies `mutate` and writes it back.
    std::optional<Ticket> find_and_update_unclaimed(const std::function<void(Ticket&)>& mutate);
    std::vector<Ticket> list_recent(Stage stage, int limit);
    std::size_t count(Stage stage);
    std::size_t count_needs_attention();
    std::optional<Stage> locate(const std::string& ticket_id);
    void clear(Stage stage);

    const std::string& path() const { return path_; }

private:
    struct StageStatements {
        sqlite3_stmt* select_by_id{nullptr};
        sqlite3_stmt* delete_by_id{nullptr};
        sqlite3_stmt* insert{nullptr};
        sqlite3_stmt* update_by_id{nullptr};
        sqlite3_stmt* recent{nullptr};
        sqlite3_stmt* count{nullptr};
    };

    void init();
    void exec(const std::string& sql);
    void rollback() noexcept;
    void prepare_statements();
    void close_statements();
    sqlite3_stmt* prepare(const std::string& sql);
    [[noreturn]] void fail(int rc, const std::string& what);

    StageStatements& stmts(Stage stage) { return stage_stmts_[static_cast<std::size_t>(stage)]; }

    std::optional<Ticket> select_one(sqlite3_stmt* st);
    std::vector<Ticket> select_all(sqlite3_stmt* st);
    std::optional<Ticket> find_unlocked(Stage stage, const std::string& ticket_id);
    std::optional<Ticket> take_unlocked(Stage stage, const std::string& ticket_id);
    void insert_unlocked(Stage stage, const Ticket& t);
    bool update_unlocked(Stage stage, const Ticket& t);
    std::optional<Stage> locate_unlocked(const std::string& ticket_id);
    std::size_t count_unlocked(sqlite3_stmt* st);
    void flag_unreadable(std::int64_t seq, const std::string& why);

    sqlite3* db_{nullptr};
    std::string path_;
    std::mutex mtx_;
    std::array<StageStatements, 4> stage_stmts_{};
    sqlite3_stmt* oldest_unclaimed_stmt_{nullptr};
    sqlite3_stmt* stale_claims_stmt_{nullptr};
    sqlite3_stmt* count_attention_stmt_{nullptr};
    sqlite3_stmt* flag_attention_stmt_{nullptr};
};
