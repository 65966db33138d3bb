/**
 * @file schema.cpp
 * @brief JSON Schema subset validator
 */

#include "remindd/rpc/schema.h"
#include <regex>

namespace remindd {

namespace {

std::string describe(const std::string& path, const std::string& problem) {
    return (path.empty() ? std::string("arguments") : path) + ": " + problem;
}

std::string join_path(const std::string& base, const std::string& key) {
    return base.empty() ? key : base + "." + key;
}

const char* type_name(const json& value) {
    if (value.is_null()) return "null";
    if (value.is_boolean()) return "boolean";
    if (value.is_number_integer()) return "integer";
    if (value.is_number()) return "number";
    if (value.is_string()) return "string";
    if (value.is_array()) return "array";
    return "object";
}

} // namespace

std::string SchemaValidator::validate(const json& schema, const json& value) {
    return validate_at(schema, value, "");
}

bool SchemaValidator::type_matches(const std::string& type, const json& value) {
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "string") return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "null") return value.is_null();
    return false;
}

std::string SchemaValidator::validate_at(const json& schema, const json& value, const std::string& path) {
    if (!schema.is_object()) {
        return "";
    }

    if (schema.contains("type")) {
        const json& type = schema["type"];
        bool matched = false;
        if (type.is_string()) {
            matched = type_matches(type.get<std::string>(), value);
        } else if (type.is_array()) {
            for (const auto& t : type) {
                if (t.is_string() && type_matches(t.get<std::string>(), value)) {
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) {
            return describe(path, "expected " + type.dump() + ", got " + type_name(value));
        }
    }

    if (schema.contains("enum") && schema["enum"].is_array()) {
        bool found = false;
        for (const auto& candidate : schema["enum"]) {
            if (candidate == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return describe(path, "must be one of " + schema["enum"].dump());
        }
    }

    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (schema.contains("minLength") && text.size() < schema["minLength"].get<size_t>()) {
            return describe(path, text.empty() ? "must not be empty"
                                               : "is shorter than " + schema["minLength"].dump() + " characters");
        }
        if (schema.contains("maxLength") && text.size() > schema["maxLength"].get<size_t>()) {
            return describe(path, "is longer than " + schema["maxLength"].dump() + " characters");
        }
        if (schema.contains("pattern") && schema["pattern"].is_string()) {
            try {
                std::regex re(schema["pattern"].get<std::string>(), std::regex::ECMAScript);
                if (!std::regex_search(text, re)) {
                    return describe(path, "does not match pattern " + schema["pattern"].dump());
                }
            } catch (const std::regex_error&) {
                return describe(path, "schema pattern is not a valid regular expression");
            }
        }
        if (schema.contains("format") && schema["format"].is_string()) {
            const auto& format = schema["format"].get_ref<const std::string&>();
            if ((format == "date-time" || format == "date") && !parse_timestamp(text)) {
                return describe(path, "is not a valid ISO 8601 timestamp");
            }
        }
    }

    if (value.is_number()) {
        double number = value.get<double>();
        if (schema.contains("minimum") && number < schema["minimum"].get<double>()) {
            return describe(path, "must be >= " + schema["minimum"].dump());
        }
        if (schema.contains("maximum") && number > schema["maximum"].get<double>()) {
            return describe(path, "must be <= " + schema["maximum"].dump());
        }
    }

    if (value.is_array() && schema.contains("items")) {
        for (size_t i = 0; i < value.size(); ++i) {
            std::string error = validate_at(schema["items"], value[i], path + "[" + std::to_string(i) + "]");
            if (!error.empty()) {
                return error;
            }
        }
    }

    if (value.is_object()) {
        static const json empty_object = json::object();
        const json& properties = schema.contains("properties") ? schema["properties"] : empty_object;

        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto& key : schema["required"]) {
                if (key.is_string() && !value.contains(key.get<std::string>())) {
                    return describe(join_path(path, key.get<std::string>()), "is required");
                }
            }
        }

        bool allow_additional = true;
        if (schema.contains("additionalProperties") && schema["additionalProperties"].is_boolean()) {
            allow_additional = schema["additionalProperties"].get<bool>();
        }

        for (auto it = value.begin(); it != value.end(); ++it) {
            std::string child = join_path(path, it.key());
            if (properties.contains(it.key())) {
                std::string error = validate_at(properties[it.key()], it.value(), child);
                if (!error.empty()) {
                    return error;
                }
            } else if (!allow_additional) {
                return describe(child, "is not a recognized parameter");
            }
        }
    }

    return "";
}

} // namespace remindd
