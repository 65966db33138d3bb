/**
 * @file local_store.h
 * @brief Reminder backend with SQLite persistence
 */

#pragma once

#include <string>
#include <mutex>
#include "remindd/provider/provider.h"

namespace remindd {

/**
 * @brief Portable ReminderProvider backed by a local SQLite database
 *
 * Access is "granted" once the database can be opened for writing; a
 * permission failure on the store location reads as a denial. Lists keep
 * creation order (default list first) and reminders keep insertion order.
 */
class LocalStore : public ReminderProvider {
public:
    /**
     * @param db_path Path to SQLite database (~ is expanded)
     * @param default_list Name of the list used when callers omit one
     */
    explicit LocalStore(const std::string& db_path,
                        std::string default_list = DEFAULT_LIST_NAME);
    ~LocalStore() override;

    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    Result<AuthorizationStatus> request_authorization() override;

    Result<std::string> create(
        const std::string& title,
        const std::optional<std::string>& notes,
        const std::optional<TimePoint>& due_date,
        const std::optional<std::string>& list_name) override;

    Result<std::vector<Reminder>> list(
        const std::optional<std::string>& list_name,
        bool include_completed) override;

    Result<bool> complete(const std::string& id) override;

    Result<std::vector<ReminderList>> lists() override;

    const char* name() const override { return "local"; }

    const std::string& db_path() const { return db_path_; }

    /**
     * @brief Generate UUID for a reminder
     */
    static std::string generate_uuid();

private:
    std::string db_path_;
    std::string default_list_;
    void* db_handle_ = nullptr;  // sqlite3* (opaque pointer to avoid including sqlite3.h in header)

    // SQLite connection use is serialized
    mutable std::mutex db_mutex_;

    /**
     * @brief Open the database and create the schema (db_mutex_ held)
     */
    Result<AuthorizationStatus> open_locked();

    bool create_schema_locked(std::string& error);
    bool ensure_list_locked(const std::string& name, std::string& error);
    bool list_exists_locked(const std::string& name, bool& exists, std::string& error);
    void close_locked();
};

} // namespace remindd
