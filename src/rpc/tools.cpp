/**
 * @file tools.cpp
 * @brief Reminder tool descriptors and bodies
 */

#include "remindd/rpc/tools.h"
#include "remindd/logger.h"
#include <stdexcept>

namespace remindd {

void ToolRegistry::add(ToolDescriptor descriptor, ToolHandler handler) {
    if (frozen_) {
        throw std::logic_error("tool registry is frozen; cannot add " + descriptor.name);
    }
    if (index_.count(descriptor.name)) {
        throw std::logic_error("duplicate tool " + descriptor.name);
    }
    index_[descriptor.name] = tools_.size();
    tools_.push_back(Tool{std::move(descriptor), std::move(handler)});
}

const Tool* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

json ToolRegistry::descriptors_json() const {
    json out = json::array();
    for (const auto& tool : tools_) {
        out.push_back(tool.descriptor.to_json());
    }
    return out;
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_) {
        out.push_back(tool.descriptor.name);
    }
    return out;
}

CreateReminderArgs CreateReminderArgs::from_json(const json& j) {
    CreateReminderArgs args;
    args.title = j.at("title").get<std::string>();
    if (j.contains("notes") && j["notes"].is_string()) {
        args.notes = j["notes"].get<std::string>();
    }
    if (j.contains("dueDate") && j["dueDate"].is_string()) {
        args.due_date = parse_timestamp(j["dueDate"].get<std::string>());
    }
    if (j.contains("listName") && j["listName"].is_string()) {
        args.list_name = j["listName"].get<std::string>();
    }
    return args;
}

ListRemindersArgs ListRemindersArgs::from_json(const json& j) {
    ListRemindersArgs args;
    if (j.contains("listName") && j["listName"].is_string()) {
        args.list_name = j["listName"].get<std::string>();
    }
    args.include_completed = j.value("includeCompleted", false);
    return args;
}

CompleteReminderArgs CompleteReminderArgs::from_json(const json& j) {
    CompleteReminderArgs args;
    args.id = j.at("id").get<std::string>();
    return args;
}

ToolDescriptor ReminderTools::create_reminder_descriptor() {
    return {
        CREATE_REMINDER,
        "Create a new reminder. Returns the id of the created reminder.",
        {
            {"type", "object"},
            {"properties", {
                {"title", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"pattern", "\\S"},
                    {"description", "Reminder title"}
                }},
                {"notes", {
                    {"type", "string"},
                    {"description", "Optional notes"}
                }},
                {"dueDate", {
                    {"type", "string"},
                    {"format", "date-time"},
                    {"description", "Optional due date, ISO 8601 (e.g. 2026-03-01T09:00:00Z)"}
                }},
                {"listName", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "Target list; the default list when omitted"}
                }}
            }},
            {"required", {"title"}},
            {"additionalProperties", false}
        }
    };
}

ToolDescriptor ReminderTools::list_reminders_descriptor() {
    return {
        LIST_REMINDERS,
        "List reminders in a list. Completed reminders are omitted unless includeCompleted is true.",
        {
            {"type", "object"},
            {"properties", {
                {"listName", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "List to read; the default list when omitted"}
                }},
                {"includeCompleted", {
                    {"type", "boolean"},
                    {"default", false},
                    {"description", "Include completed reminders"}
                }}
            }},
            {"additionalProperties", false}
        },
        "List not found"
    };
}

ToolDescriptor ReminderTools::complete_reminder_descriptor() {
    return {
        COMPLETE_REMINDER,
        "Mark a reminder as completed.",
        {
            {"type", "object"},
            {"properties", {
                {"id", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "Id returned by create_reminder or list_reminders"}
                }}
            }},
            {"required", {"id"}},
            {"additionalProperties", false}
        },
        "Reminder not found"
    };
}

ToolDescriptor ReminderTools::get_lists_descriptor() {
    return {
        GET_LISTS,
        "Get all reminder lists.",
        {
            {"type", "object"},
            {"properties", json::object()},
            {"additionalProperties", false}
        }
    };
}

void ReminderTools::register_all(ToolRegistry& registry, ReminderProvider& provider) {
    registry.add(create_reminder_descriptor(), [&provider](const json& args) {
        return create_reminder(provider, args);
    });
    registry.add(list_reminders_descriptor(), [&provider](const json& args) {
        return list_reminders(provider, args);
    });
    registry.add(complete_reminder_descriptor(), [&provider](const json& args) {
        return complete_reminder(provider, args);
    });
    registry.add(get_lists_descriptor(), [&provider](const json& args) {
        return get_lists(provider, args);
    });

    LOG_INFO("Tools", "Registered " + std::to_string(registry.size()) + " tools");
}

Result<json> ReminderTools::create_reminder(ReminderProvider& provider, const json& arguments) {
    auto args = CreateReminderArgs::from_json(arguments);
    auto created = provider.create(args.title, args.notes, args.due_date, args.list_name);
    if (!created) {
        return Result<json>::err(created.error(), created.message());
    }
    return Result<json>::ok({{"id", created.value()}});
}

Result<json> ReminderTools::list_reminders(ReminderProvider& provider, const json& arguments) {
    auto args = ListRemindersArgs::from_json(arguments);
    auto listed = provider.list(args.list_name, args.include_completed);
    if (!listed) {
        return Result<json>::err(listed.error(), listed.message());
    }
    json reminders = json::array();
    for (const auto& reminder : listed.value()) {
        reminders.push_back(reminder.to_json());
    }
    return Result<json>::ok({{"reminders", reminders}});
}

Result<json> ReminderTools::complete_reminder(ReminderProvider& provider, const json& arguments) {
    auto args = CompleteReminderArgs::from_json(arguments);
    auto completed = provider.complete(args.id);
    if (!completed) {
        return Result<json>::err(completed.error(), completed.message());
    }
    return Result<json>::ok({{"success", completed.value()}});
}

Result<json> ReminderTools::get_lists(ReminderProvider& provider, const json& /*arguments*/) {
    auto lists = provider.lists();
    if (!lists) {
        return Result<json>::err(lists.error(), lists.message());
    }
    json out = json::array();
    for (const auto& list : lists.value()) {
        out.push_back(list.to_json());
    }
    return Result<json>::ok({{"lists", out}});
}

} // namespace remindd
