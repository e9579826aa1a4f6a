#include "tools/SchemaValidator.h"
#include <cmath>

namespace {
std::string join(const std::string& base, const std::string& key) {
    return base.empty() ? key : base + "." + key;
}

std::string describe(const nlohmann::json& value) {
    if (value.is_null()) return "null";
    if (value.is_boolean()) return "boolean";
    if (value.is_number_integer() || value.is_number_unsigned()) return "integer";
    if (value.is_number()) return "number";
    if (value.is_string()) return "string";
    if (value.is_array()) return "array";
    return "object";
}
} // namespace

SchemaValidator::Result SchemaValidator::validate(const nlohmann::json& schema, const nlohmann::json& value) {
    if (!schema.is_object()) {
        return {};
    }
    return check(schema, value, "");
}

SchemaValidator::Result SchemaValidator::fail(const std::string& path, const std::string& message) {
    Result r;
    r.ok = false;
    r.field = path;
    r.message = message;
    return r;
}

bool SchemaValidator::matchesType(const std::string& type, const nlohmann::json& value) {
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "string") return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "null") return value.is_null();
    if (type == "number") return value.is_number();
    if (type == "integer") {
        if (value.is_number_integer() || value.is_number_unsigned()) return true;
        if (value.is_number_float()) {
            double d = value.get<double>();
            return std::isfinite(d) && std::trunc(d) == d;
        }
        return false;
    }
    return true;
}

SchemaValidator::Result SchemaValidator::check(const nlohmann::json& schema, const nlohmann::json& value,
                                               const std::string& path) {
    const std::string where = path.empty() ? "arguments" : path;

    if (schema.contains("type")) {
        const auto& type = schema["type"];
        bool matched = false;
        std::string expected;
        if (type.is_string()) {
            expected = type.get<std::string>();
            matched = matchesType(expected, value);
        } else if (type.is_array()) {
            for (const auto& t : type) {
                if (!t.is_string()) continue;
                if (!expected.empty()) expected += "|";
                expected += t.get<std::string>();
                if (matchesType(t.get<std::string>(), value)) matched = true;
            }
        } else {
            matched = true;
        }
        if (!matched) {
            return fail(path, where + " must be of type " + expected + ", got " + describe(value));
        }
    }

    if (schema.contains("enum") && schema["enum"].is_array()) {
        bool found = false;
        for (const auto& option : schema["enum"]) {
            if (option == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return fail(path, where + " must be one of " + schema["enum"].dump());
        }
    }

    if (value.is_number()) {
        double d = value.get<double>();
        if (schema.contains("minimum") && schema["minimum"].is_number() && d < schema["minimum"].get<double>()) {
            return fail(path, where + " must be >= " + schema["minimum"].dump());
        }
        if (schema.contains("maximum") && schema["maximum"].is_number() && d > schema["maximum"].get<double>()) {
            return fail(path, where + " must be <= " + schema["maximum"].dump());
        }
    }

    if (value.is_string()) {
        size_t len = value.get_ref<const std::string&>().size();
        if (schema.contains("minLength") && schema["minLength"].is_number_integer() &&
            len < schema["minLength"].get<size_t>()) {
            return fail(path, where + " is shorter than " + schema["minLength"].dump());
        }
        if (schema.contains("maxLength") && schema["maxLength"].is_number_integer() &&
            len > schema["maxLength"].get<size_t>()) {
            return fail(path, where + " is longer than " + schema["maxLength"].dump());
        }
    }

    if (value.is_array()) {
        if (schema.contains("minItems") && schema["minItems"].is_number_integer() &&
            value.size() < schema["minItems"].get<size_t>()) {
            return fail(path, where + " needs at least " + schema["minItems"].dump() + " items");
        }
        if (schema.contains("maxItems") && schema["maxItems"].is_number_integer() &&
            value.size() > schema["maxItems"].get<size_t>()) {
            return fail(path, where + " allows at most " + schema["maxItems"].dump() + " items");
        }
        if (schema.contains("items") && schema["items"].is_object()) {
            for (size_t i = 0; i < value.size(); ++i) {
                auto r = check(schema["items"], value[i], path + "[" + std::to_string(i) + "]");
                if (!r.ok) return r;
            }
        }
    }

    if (value.is_object()) {
        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto& key : schema["required"]) {
                if (!key.is_string()) continue;
                const auto& name = key.get_ref<const std::string&>();
                if (!value.contains(name)) {
                    return fail(join(path, name), "missing required argument: " + join(path, name));
                }
            }
        }

        const nlohmann::json* properties = nullptr;
        if (schema.contains("properties") && schema["properties"].is_object()) {
            properties = &schema["properties"];
        }

        for (auto it = value.begin(); it != value.end(); ++it) {
            if (properties && properties->contains(it.key())) {
                auto r = check((*properties)[it.key()], it.value(), join(path, it.key()));
                if (!r.ok) return r;
                continue;
            }
            if (schema.contains("additionalProperties")) {
                const auto& extra = schema["additionalProperties"];
                if (extra.is_boolean() && !extra.get<bool>()) {
                    return fail(join(path, it.key()), "unexpected argument: " + join(path, it.key()));
                }
                if (extra.is_object()) {
                    auto r = check(extra, it.value(), join(path, it.key()));
                    if (!r.ok) return r;
                }
            }
        }
    }

    return {};
}
