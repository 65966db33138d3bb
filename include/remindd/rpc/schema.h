/**
 * @file schema.h
 * @brief Validation of JSON values against tool input schemas
 */

#pragma once

#include <string>
#include "remindd/common.h"

namespace remindd {

/**
 * @brief Validator for the JSON Schema subset used by tool descriptors
 *
 * Supported keywords: type, properties, required, additionalProperties
 * (boolean), items, enum, minLength, maxLength, pattern, minimum, maximum
 * and format "date-time" / "date". Unknown keywords are ignored.
 */
class SchemaValidator {
public:
    /**
     * @brief Validate a value
     * @return Empty string if valid, otherwise the first violation
     *         prefixed with its path (e.g. "title: must not be empty")
     */
    static std::string validate(const json& schema, const json& value);

private:
    static std::string validate_at(const json& schema, const json& value, const std::string& path);
    static bool type_matches(const std::string& type, const json& value);
};

} // namespace remindd
