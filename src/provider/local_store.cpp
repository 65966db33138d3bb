/**
 * @file local_store.cpp
 * @brief SQLite-backed reminder store
 */

#include "remindd/provider/local_store.h"
#include "remindd/logger.h"
#include <sqlite3.h>
#include <uuid/uuid.h>
#include <cerrno>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace remindd {

namespace {

constexpr const char* SCHEMA_SQL = R"(
CREATE TABLE IF NOT EXISTS lists (
    seq INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL UNIQUE
);
CREATE TABLE IF NOT EXISTS reminders (
    seq INTEGER PRIMARY KEY AUTOINCREMENT,
    uuid TEXT NOT NULL UNIQUE,
    title TEXT NOT NULL,
    notes TEXT,
    due_at INTEGER,
    completed INTEGER NOT NULL DEFAULT 0,
    list_name TEXT NOT NULL,
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_reminders_list ON reminders(list_name, completed);
)";

/**
 * @brief RAII wrapper for a prepared statement
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

    void bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }
    void bind(int index, int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }
    void bind_null(int index) {
        sqlite3_bind_null(stmt_, index);
    }

    int step() { return sqlite3_step(stmt_); }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

bool is_permission_failure(sqlite3* db, int rc) {
    int primary = rc & 0xff;
    if (primary == SQLITE_READONLY || primary == SQLITE_PERM || primary == SQLITE_AUTH) {
        return true;
    }
    if (primary == SQLITE_CANTOPEN && db != nullptr) {
        int sys = sqlite3_system_errno(db);
        return sys == EACCES || sys == EPERM || sys == EROFS;
    }
    return false;
}

} // namespace

LocalStore::LocalStore(const std::string& db_path, std::string default_list)
    : db_path_(expand_path(db_path)), default_list_(std::move(default_list)) {
}

LocalStore::~LocalStore() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    close_locked();
}

std::string LocalStore::generate_uuid() {
    uuid_t uuid;
    char uuid_str[37];
    uuid_generate(uuid);
    uuid_unparse_upper(uuid, uuid_str);
    return std::string(uuid_str);
}

Result<AuthorizationStatus> LocalStore::request_authorization() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_handle_) {
        return Result<AuthorizationStatus>::ok(AuthorizationStatus::GRANTED);
    }
    return open_locked();
}

Result<AuthorizationStatus> LocalStore::open_locked() {
    namespace fs = std::filesystem;

    fs::path parent = fs::path(db_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
                ec == std::errc::read_only_file_system) {
                LOG_WARN("LocalStore", "No access to store directory " + parent.string() + ": " + ec.message());
                return Result<AuthorizationStatus>::ok(AuthorizationStatus::DENIED);
            }
            return Result<AuthorizationStatus>::err(ProviderError::UNAVAILABLE,
                "cannot create " + parent.string() + ": " + ec.message());
        }
        if (access(parent.c_str(), W_OK) != 0) {
            if (errno == EACCES || errno == EPERM || errno == EROFS) {
                LOG_WARN("LocalStore", "Store directory not writable: " + parent.string());
                return Result<AuthorizationStatus>::ok(AuthorizationStatus::DENIED);
            }
            return Result<AuthorizationStatus>::err(ProviderError::UNAVAILABLE,
                "cannot access " + parent.string());
        }
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(db_path_.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        bool denied = is_permission_failure(db, rc);
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        if (denied) {
            LOG_WARN("LocalStore", "Store access denied: " + msg);
            return Result<AuthorizationStatus>::ok(AuthorizationStatus::DENIED);
        }
        return Result<AuthorizationStatus>::err(ProviderError::UNAVAILABLE, "open failed: " + msg);
    }
    db_handle_ = db;
    sqlite3_busy_timeout(db, 2000);

    std::string error;
    if (!create_schema_locked(error) || !ensure_list_locked(default_list_, error)) {
        int ext = sqlite3_extended_errcode(db);
        bool denied = is_permission_failure(db, ext);
        close_locked();
        if (denied) {
            LOG_WARN("LocalStore", "Store is read-only: " + error);
            return Result<AuthorizationStatus>::ok(AuthorizationStatus::DENIED);
        }
        return Result<AuthorizationStatus>::err(ProviderError::UNAVAILABLE, error);
    }

    LOG_INFO("LocalStore", "Opened reminder store at " + db_path_);
    return Result<AuthorizationStatus>::ok(AuthorizationStatus::GRANTED);
}

bool LocalStore::create_schema_locked(std::string& error) {
    auto* db = static_cast<sqlite3*>(db_handle_);
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db, SCHEMA_SQL, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        error = errmsg ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        return false;
    }
    return true;
}

bool LocalStore::ensure_list_locked(const std::string& name, std::string& error) {
    auto* db = static_cast<sqlite3*>(db_handle_);
    Statement stmt(db, "INSERT OR IGNORE INTO lists (name) VALUES (?)");
    if (!stmt.ok()) {
        error = sqlite3_errmsg(db);
        return false;
    }
    stmt.bind(1, name);
    if (stmt.step() != SQLITE_DONE) {
        error = sqlite3_errmsg(db);
        return false;
    }
    return true;
}

bool LocalStore::list_exists_locked(const std::string& name, bool& exists, std::string& error) {
    auto* db = static_cast<sqlite3*>(db_handle_);
    Statement stmt(db, "SELECT 1 FROM lists WHERE name = ?");
    if (!stmt.ok()) {
        error = sqlite3_errmsg(db);
        return false;
    }
    stmt.bind(1, name);
    int rc = stmt.step();
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        error = sqlite3_errmsg(db);
        return false;
    }
    exists = (rc == SQLITE_ROW);
    return true;
}

void LocalStore::close_locked() {
    if (db_handle_) {
        sqlite3_close(static_cast<sqlite3*>(db_handle_));
        db_handle_ = nullptr;
    }
}

Result<std::string> LocalStore::create(
    const std::string& title,
    const std::optional<std::string>& notes,
    const std::optional<TimePoint>& due_date,
    const std::optional<std::string>& list_name) {

    if (title.empty()) {
        return Result<std::string>::err(ProviderError::INVALID, "empty title");
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_handle_) {
        return Result<std::string>::err(ProviderError::ACCESS_DENIED, "store not authorized");
    }
    auto* db = static_cast<sqlite3*>(db_handle_);

    std::string target = list_name.value_or(default_list_);
    std::string error;
    if (!ensure_list_locked(target, error)) {
        return Result<std::string>::err(ProviderError::UNAVAILABLE, error);
    }

    Statement stmt(db,
        "INSERT INTO reminders (uuid, title, notes, due_at, completed, list_name, created_at) "
        "VALUES (?, ?, ?, ?, 0, ?, ?)");
    if (!stmt.ok()) {
        return Result<std::string>::err(ProviderError::UNAVAILABLE, sqlite3_errmsg(db));
    }

    std::string id = generate_uuid();
    stmt.bind(1, id);
    stmt.bind(2, title);
    if (notes) {
        stmt.bind(3, *notes);
    } else {
        stmt.bind_null(3);
    }
    if (due_date) {
        stmt.bind(4, static_cast<int64_t>(Clock::to_time_t(*due_date)));
    } else {
        stmt.bind_null(4);
    }
    stmt.bind(5, target);
    stmt.bind(6, static_cast<int64_t>(Clock::to_time_t(Clock::now())));

    if (stmt.step() != SQLITE_DONE) {
        return Result<std::string>::err(ProviderError::UNAVAILABLE, sqlite3_errmsg(db));
    }

    LOG_DEBUG("LocalStore", "Created reminder " + id + " in " + target);
    return Result<std::string>::ok(id);
}

Result<std::vector<Reminder>> LocalStore::list(
    const std::optional<std::string>& list_name,
    bool include_completed) {

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_handle_) {
        return Result<std::vector<Reminder>>::err(ProviderError::ACCESS_DENIED, "store not authorized");
    }
    auto* db = static_cast<sqlite3*>(db_handle_);

    std::string target = list_name.value_or(default_list_);
    bool exists = false;
    std::string error;
    if (!list_exists_locked(target, exists, error)) {
        return Result<std::vector<Reminder>>::err(ProviderError::UNAVAILABLE, error);
    }
    if (!exists) {
        return Result<std::vector<Reminder>>::err(ProviderError::NOT_FOUND, "no list named " + target);
    }

    const char* sql = include_completed
        ? "SELECT uuid, title, notes, due_at, completed, list_name FROM reminders "
          "WHERE list_name = ? ORDER BY seq"
        : "SELECT uuid, title, notes, due_at, completed, list_name FROM reminders "
          "WHERE list_name = ? AND completed = 0 ORDER BY seq";
    Statement stmt(db, sql);
    if (!stmt.ok()) {
        return Result<std::vector<Reminder>>::err(ProviderError::UNAVAILABLE, sqlite3_errmsg(db));
    }
    stmt.bind(1, target);

    std::vector<Reminder> reminders;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        sqlite3_stmt* row = stmt.get();
        Reminder r;
        r.id = column_text(row, 0);
        r.title = column_text(row, 1);
        if (sqlite3_column_type(row, 2) != SQLITE_NULL) {
            r.notes = column_text(row, 2);
        }
        if (sqlite3_column_type(row, 3) != SQLITE_NULL) {
            r.due_date = Clock::from_time_t(static_cast<std::time_t>(sqlite3_column_int64(row, 3)));
        }
        r.completed = sqlite3_column_int(row, 4) != 0;
        r.list_name = column_text(row, 5);
        reminders.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<Reminder>>::err(ProviderError::UNAVAILABLE, sqlite3_errmsg(db));
    }
    return Result<std::vector<Reminder>>::ok(std::move(reminders));
}

Result<bool> LocalStore::complete(const std::string& id) {
    if (id.empty()) {
        return Result<bool>::err(ProviderError::INVALID, "empty id");
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_handle_) {
        return Result<bool>::err(ProviderError::ACCESS_DENIED, "store not authorized");
    }
    auto* db = static_cast<sqlite3*>(db_handle_);

    Statement select(db, "SELECT completed FROM reminders WHERE uuid = ?");
    if (!select.ok()) {
        return Result<bool>::err(ProviderError::UNAVAILABLE, sqlite3_errmsg(db));
    }
    select.bind(1, id);
    int rc = select.step();
    if (rc == SQLITE_DONE) {
        return Result<bool>::err(ProviderError::NOT_FOUND, "no reminder " + id);
    }
    if (rc != SQLITE_ROW) {
        return Result<bool>::err(ProviderError::UNAVAILABLE, sqlite3_errmsg(db));
    }
    if (sqlite3_column_int(select.get(), 0) != 0) {
        // Already completed
        return Result<bool>::ok(true);
    }

    Statement update(db, "UPDATE reminders SET completed = 1 WHERE uuid = ?");
    if (!update.ok()) {
        return Result<bool>::err(ProviderError::UNAVAILABLE, sqlite3_errmsg(db));
    }
    update.bind(1, id);
    if (update.step() != SQLITE_DONE) {
        return Result<bool>::err(ProviderError::UNAVAILABLE, sqlite3_errmsg(db));
    }

    LOG_DEBUG("LocalStore", "Completed reminder " + id);
    return Result<bool>::ok(sqlite3_changes(db) > 0);
}

Result<std::vector<ReminderList>> LocalStore::lists() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_handle_) {
        return Result<std::vector<ReminderList>>::err(ProviderError::ACCESS_DENIED, "store not authorized");
    }
    auto* db = static_cast<sqlite3*>(db_handle_);

    // Default list first, the rest in creation order
    Statement stmt(db, "SELECT name FROM lists ORDER BY (name = ?) DESC, seq");
    if (!stmt.ok()) {
        return Result<std::vector<ReminderList>>::err(ProviderError::UNAVAILABLE, sqlite3_errmsg(db));
    }
    stmt.bind(1, default_list_);

    std::vector<ReminderList> result;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        ReminderList entry;
        entry.name = column_text(stmt.get(), 0);
        entry.is_default = (entry.name == default_list_);
        result.push_back(std::move(entry));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<ReminderList>>::err(ProviderError::UNAVAILABLE, sqlite3_errmsg(db));
    }
    return Result<std::vector<ReminderList>>::ok(std::move(result));
}

} // namespace remindd
