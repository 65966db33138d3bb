/**
 * @file tools.h
 * @brief Tool descriptors, the tool registry and the reminder tools
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <optional>
#include "remindd/common.h"
#include "remindd/provider/provider.h"

namespace remindd {

/**
 * @brief Advertised name, description and parameter schema of a tool
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    json input_schema;
    std::string not_found_message = "Not found";  // client text for ProviderError::NOT_FOUND

    json to_json() const {
        return {
            {"name", name},
            {"description", description},
            {"inputSchema", input_schema}
        };
    }
};

/**
 * @brief Tool body; arguments have already passed schema validation
 */
using ToolHandler = std::function<Result<json>(const json& arguments)>;

struct Tool {
    ToolDescriptor descriptor;
    ToolHandler handler;
};

/**
 * @brief Name -> tool table, frozen before the transport starts
 */
class ToolRegistry {
public:
    /**
     * @throws std::logic_error after freeze() or on a duplicate name
     */
    void add(ToolDescriptor descriptor, ToolHandler handler);

    void freeze() { frozen_ = true; }
    bool frozen() const { return frozen_; }

    const Tool* find(const std::string& name) const;

    /**
     * @brief Descriptors in registration order
     */
    json descriptors_json() const;

    std::vector<std::string> names() const;
    size_t size() const { return tools_.size(); }

private:
    std::vector<Tool> tools_;
    std::map<std::string, size_t> index_;
    bool frozen_ = false;
};

// Typed arguments built from validated JSON

struct CreateReminderArgs {
    std::string title;
    std::optional<std::string> notes;
    std::optional<TimePoint> due_date;
    std::optional<std::string> list_name;

    static CreateReminderArgs from_json(const json& j);
};

struct ListRemindersArgs {
    std::optional<std::string> list_name;
    bool include_completed = false;

    static ListRemindersArgs from_json(const json& j);
};

struct CompleteReminderArgs {
    std::string id;

    static CompleteReminderArgs from_json(const json& j);
};

/**
 * @brief Reminder tool set over a ReminderProvider
 */
class ReminderTools {
public:
    static constexpr const char* CREATE_REMINDER = "create_reminder";
    static constexpr const char* LIST_REMINDERS = "list_reminders";
    static constexpr const char* COMPLETE_REMINDER = "complete_reminder";
    static constexpr const char* GET_LISTS = "get_lists";

    /**
     * @brief Register all four tools; the provider must outlive the registry
     */
    static void register_all(ToolRegistry& registry, ReminderProvider& provider);

    static ToolDescriptor create_reminder_descriptor();
    static ToolDescriptor list_reminders_descriptor();
    static ToolDescriptor complete_reminder_descriptor();
    static ToolDescriptor get_lists_descriptor();

private:
    static Result<json> create_reminder(ReminderProvider& provider, const json& arguments);
    static Result<json> list_reminders(ReminderProvider& provider, const json& arguments);
    static Result<json> complete_reminder(ReminderProvider& provider, const json& arguments);
    static Result<json> get_lists(ReminderProvider& provider, const json& arguments);
};

} // namespace remindd
