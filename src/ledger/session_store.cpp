#include "ledger/session_store.hpp"

#include <filesystem>
#include <system_error>

#include <sqlite3.h>

namespace uptally {

namespace {

constexpr const char *kCreateSessionsTable =
    "CREATE TABLE IF NOT EXISTS sessions ("
    "    sequence INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    boot_epoch INTEGER NOT NULL,"
    "    uptime REAL NOT NULL,"
    "    shutdown_epoch INTEGER NOT NULL DEFAULT -1,"
    "    shutdown_kind INTEGER NOT NULL DEFAULT 0,"
    "    downtime REAL NOT NULL DEFAULT -1,"
    "    kernel TEXT NOT NULL DEFAULT ''"
    ");";

constexpr int kBusyTimeoutMs = 5000;

constexpr const char *kSelectColumns =
    "SELECT sequence, boot_epoch, uptime, shutdown_epoch, shutdown_kind, "
    "downtime, kernel FROM sessions";

bool isReadOnlyCode(int code)
{
    const int primary = code & 0xff;
    return primary == SQLITE_READONLY || primary == SQLITE_PERM
        || primary == SQLITE_CANTOPEN || primary == SQLITE_AUTH;
}

[[noreturn]] void throwStoreError(sqlite3 *db, int code, const std::string &what)
{
    std::string message = what;
    if (db) {
        message += ": ";
        message += sqlite3_errmsg(db);
    }
    throw StoreError(message, isReadOnlyCode(code));
}

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        const int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            throwStoreError(db, rc, "sqlite prepare failed");
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StoreError(message, isReadOnlyCode(rc));
    }
}

// Rolls back unless commit() succeeded.
class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db;
    bool m_committed = false;
};

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

ShutdownKind shutdownKindFromInt(int value)
{
    return value == static_cast<int>(ShutdownKind::Graceful)
        ? ShutdownKind::Graceful
        : ShutdownKind::Ungraceful;
}

SessionRecord readRecord(sqlite3_stmt *stmt)
{
    SessionRecord record;
    record.sequence = sqlite3_column_int64(stmt, 0);
    record.bootEpoch = sqlite3_column_int64(stmt, 1);
    record.uptimeSeconds = sqlite3_column_double(stmt, 2);
    record.shutdownEpoch = sqlite3_column_int64(stmt, 3);
    record.shutdownKind = shutdownKindFromInt(sqlite3_column_int(stmt, 4));
    record.downtimeSeconds = sqlite3_column_double(stmt, 5);
    record.kernelLabel = columnText(stmt, 6);
    return record;
}

bool tableExists(sqlite3 *db, const char *table)
{
    Statement stmt(db,
                   "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ? LIMIT 1;");
    sqlite3_bind_text(stmt.get(), 1, table, -1, SQLITE_STATIC);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

} // namespace

struct SessionStore::Impl {
    sqlite3 *db = nullptr;
    std::string path;
    bool readOnly = false;

    int64_t insertOpen(const SessionRecord &record)
    {
        Statement stmt(db,
                       "INSERT INTO sessions (boot_epoch, uptime, shutdown_epoch, "
                       "shutdown_kind, downtime, kernel) VALUES (?, ?, ?, ?, ?, ?);");
        sqlite3_bind_int64(stmt.get(), 1, record.bootEpoch);
        sqlite3_bind_double(stmt.get(), 2, record.uptimeSeconds);
        sqlite3_bind_int64(stmt.get(), 3, kOpenShutdownEpoch);
        sqlite3_bind_int(stmt.get(), 4, static_cast<int>(record.shutdownKind));
        sqlite3_bind_double(stmt.get(), 5, kOpenDowntime);
        bindText(stmt.get(), 6, record.kernelLabel);

        const int rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_DONE) {
            throwStoreError(db, rc, "failed to append session");
        }
        return sqlite3_last_insert_rowid(db);
    }

    void updateRow(const SessionRecord &record)
    {
        Statement stmt(db,
                       "UPDATE sessions SET uptime = ?, shutdown_epoch = ?, "
                       "shutdown_kind = ?, downtime = ?, kernel = ? "
                       "WHERE sequence = ?;");
        sqlite3_bind_double(stmt.get(), 1, record.uptimeSeconds);
        sqlite3_bind_int64(stmt.get(), 2, record.shutdownEpoch);
        sqlite3_bind_int(stmt.get(), 3, static_cast<int>(record.shutdownKind));
        sqlite3_bind_double(stmt.get(), 4, record.downtimeSeconds);
        bindText(stmt.get(), 5, record.kernelLabel);
        sqlite3_bind_int64(stmt.get(), 6, record.sequence);

        const int rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_DONE) {
            throwStoreError(db, rc, "failed to update session");
        }
        if (sqlite3_changes(db) != 1) {
            throw StoreError("session " + std::to_string(record.sequence)
                                 + " not found",
                             false);
        }
    }
};

SessionStore::SessionStore(const std::string &path, OpenMode mode)
    : impl(std::make_unique<Impl>())
{
    impl->path = path;
    impl->readOnly = mode == OpenMode::ReadOnly;

    int flags = SQLITE_OPEN_READONLY;
    if (!impl->readOnly) {
        const std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code error;
            std::filesystem::create_directories(parent, error);
            if (error) {
                throw StoreError("failed to create " + parent.string() + ": "
                                     + error.message(),
                                 true);
            }
        }
        flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    const int rc = sqlite3_open_v2(path.c_str(), &impl->db, flags, nullptr);
    if (rc != SQLITE_OK) {
        const std::string message = "failed to open session ledger " + path
            + ": " + (impl->db ? sqlite3_errmsg(impl->db) : sqlite3_errstr(rc));
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw StoreError(message, isReadOnlyCode(rc));
    }

    sqlite3_busy_timeout(impl->db, kBusyTimeoutMs);

    // SQLite silently downgrades to read-only when the file is not writable.
    if (!impl->readOnly && sqlite3_db_readonly(impl->db, "main") == 1) {
        impl->readOnly = true;
    }

    try {
        if (impl->readOnly) {
            if (!tableExists(impl->db, "sessions")) {
                throw StoreError("session ledger " + path + " has no sessions table",
                                 true);
            }
        } else {
            // Readers such as a --no-update run must not block the restart commit.
            execOrThrow(impl->db, "PRAGMA journal_mode = WAL;");
            execOrThrow(impl->db, kCreateSessionsTable);
        }
    } catch (...) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw;
    }
}

SessionStore::~SessionStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

const std::string &SessionStore::path() const
{
    return impl->path;
}

bool SessionStore::isReadOnly() const
{
    return impl->readOnly;
}

int64_t SessionStore::appendOpen(const SessionRecord &record)
{
    return impl->insertOpen(record);
}

void SessionStore::updateOpen(const SessionRecord &record)
{
    impl->updateRow(record);
}

int64_t SessionStore::closeAndAppend(const SessionRecord &closed,
                                     const SessionRecord &next)
{
    Transaction transaction(impl->db);
    impl->updateRow(closed);
    const int64_t sequence = impl->insertOpen(next);
    transaction.commit();
    return sequence;
}

std::optional<SessionRecord> SessionStore::lastRecord() const
{
    const std::string sql =
        std::string(kSelectColumns) + " ORDER BY sequence DESC LIMIT 1;";
    Statement stmt(impl->db, sql.c_str());

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return readRecord(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        throwStoreError(impl->db, rc, "failed to read last session");
    }
    return std::nullopt;
}

std::vector<SessionRecord> SessionStore::listRecords() const
{
    const std::string sql = std::string(kSelectColumns) + " ORDER BY sequence ASC;";
    Statement stmt(impl->db, sql.c_str());

    std::vector<SessionRecord> records;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        records.push_back(readRecord(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throwStoreError(impl->db, rc, "failed to list sessions");
    }
    return records;
}

int64_t SessionStore::rowCount() const
{
    Statement stmt(impl->db, "SELECT COUNT(*) FROM sessions;");
    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW) {
        throwStoreError(impl->db, rc, "failed to count sessions");
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

bool SessionStore::integrityCheck(std::string *message) const
{
    Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace uptally
