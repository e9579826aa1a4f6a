#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Checks tool arguments against the subset of JSON Schema tool
 * descriptors use: type, required, properties, additionalProperties,
 * enum, items, minimum/maximum, minLength/maxLength, minItems/maxItems.
 *
 * Unknown keywords are ignored. Validation stops at the first failure.
 */
class SchemaValidator {
public:
    struct Result {
        bool ok = true;
        std::string field;    // dotted path of the offending value, empty for the root
        std::string message;
    };

    static Result validate(const nlohmann::json& schema, const nlohmann::json& value);

private:
    static Result check(const nlohmann::json& schema, const nlohmann::json& value, const std::string& path);
    static bool matchesType(const std::string& type, const nlohmann::json& value);
    static Result fail(const std::string& path, const std::string& message);
};
