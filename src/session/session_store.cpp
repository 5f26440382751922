#include "session/session_store.hpp"

#include <filesystem>
#include <mutex>
#include <utility>

#include <sqlite3.h>

#include "common/errors.hpp"

namespace unpod {

namespace {

constexpr const char *kCreateSessionTable =
    "CREATE TABLE IF NOT EXISTS session_values ("
    "    namespace TEXT NOT NULL,"
    "    key TEXT NOT NULL,"
    "    value TEXT NOT NULL,"
    "    PRIMARY KEY (namespace, key)"
    ");";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw PersistenceError(std::string("sqlite prepare failed: ")
                                   + sqlite3_errmsg(db));
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
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw PersistenceError(message);
    }
}

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

void stepDone(sqlite3 *db, sqlite3_stmt *stmt, const char *operation)
{
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw PersistenceError(std::string(operation) + " failed: " + sqlite3_errmsg(db));
    }
}

} // namespace

struct SessionStore::Impl {
    std::string path;
    std::string nameSpace;
    sqlite3 *db = nullptr;
    std::mutex openMutex;

    ~Impl()
    {
        if (db) {
            sqlite3_close(db);
        }
    }

    sqlite3 *handle()
    {
        std::lock_guard<std::mutex> lock(openMutex);
        if (db) {
            return db;
        }

        const std::filesystem::path dbPath(path);
        if (dbPath.has_parent_path()) {
            std::error_code error;
            std::filesystem::create_directories(dbPath.parent_path(), error);
            if (error) {
                throw PersistenceError("failed to create session directory: "
                                       + error.message());
            }
        }

        sqlite3 *opened = nullptr;
        if (sqlite3_open(path.c_str(), &opened) != SQLITE_OK) {
            const std::string message = opened ? sqlite3_errmsg(opened) : "out of memory";
            sqlite3_close(opened);
            throw PersistenceError("failed to open session store: " + message);
        }

        try {
            // Each statement is its own transaction; FULL waits for the disk.
            execOrThrow(opened, "PRAGMA synchronous = FULL;");
            execOrThrow(opened, kCreateSessionTable);
        } catch (...) {
            sqlite3_close(opened);
            throw;
        }

        db = opened;
        return db;
    }
};

SessionStore::SessionStore(std::string dbPath, std::string nameSpace)
    : impl(std::make_unique<Impl>())
{
    impl->path = std::move(dbPath);
    impl->nameSpace = std::move(nameSpace);
}

SessionStore::~SessionStore() = default;

const std::string &SessionStore::path() const
{
    return impl->path;
}

std::optional<std::string> SessionStore::get(const std::string &key) const
{
    sqlite3 *db = impl->handle();
    Statement stmt(db,
                   "SELECT value FROM session_values"
                   " WHERE namespace = ? AND key = ? LIMIT 1;");
    bindText(stmt.get(), 1, impl->nameSpace);
    bindText(stmt.get(), 2, key);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return columnText(stmt.get(), 0);
    }
    if (rc != SQLITE_DONE) {
        throw PersistenceError(std::string("session read failed: ") + sqlite3_errmsg(db));
    }
    return std::nullopt;
}

void SessionStore::set(const std::string &key, const std::string &value)
{
    sqlite3 *db = impl->handle();
    Statement stmt(db,
                   "INSERT OR REPLACE INTO session_values (namespace, key, value)"
                   " VALUES (?, ?, ?);");
    bindText(stmt.get(), 1, impl->nameSpace);
    bindText(stmt.get(), 2, key);
    bindText(stmt.get(), 3, value);
    stepDone(db, stmt.get(), "session write");
}

void SessionStore::remove(const std::string &key)
{
    sqlite3 *db = impl->handle();
    Statement stmt(db,
                   "DELETE FROM session_values WHERE namespace = ? AND key = ?;");
    bindText(stmt.get(), 1, impl->nameSpace);
    bindText(stmt.get(), 2, key);
    stepDone(db, stmt.get(), "session delete");
}

void SessionStore::clear()
{
    sqlite3 *db = impl->handle();
    Statement stmt(db, "DELETE FROM session_values WHERE namespace = ?;");
    bindText(stmt.get(), 1, impl->nameSpace);
    stepDone(db, stmt.get(), "session clear");
}

std::optional<std::string> SessionStore::authToken() const
{
    return get(kAuthTokenKey);
}

void SessionStore::setAuthToken(const std::string &token)
{
    set(kAuthTokenKey, token);
}

void SessionStore::deleteAuthToken()
{
    remove(kAuthTokenKey);
}

} // namespace unpod
