/**
 * @file reminder.cpp
 * @brief JSON mapping of reminder value objects
 */

#include "remindd/provider/provider.h"

namespace remindd {

json Reminder::to_json() const {
    json j = {
        {"id", id},
        {"title", title},
        {"completed", completed},
        {"listName", list_name}
    };
    j["notes"] = notes ? json(*notes) : json(nullptr);
    j["dueDate"] = due_date ? json(format_timestamp(*due_date)) : json(nullptr);
    return j;
}

bool Reminder::operator==(const Reminder& other) const {
    return id == other.id &&
           title == other.title &&
           notes == other.notes &&
           due_date == other.due_date &&
           completed == other.completed &&
           list_name == other.list_name;
}

json ReminderList::to_json() const {
    return {
        {"name", name},
        {"isDefault", is_default}
    };
}

} // namespace remindd
