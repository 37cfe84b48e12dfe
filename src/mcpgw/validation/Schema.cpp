//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Schema.cpp
// Purpose: Schema compilation and recursive, depth-bounded argument validation
//==========================================================================================================

#include "mcpgw/validation/Schema.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <unordered_set>

#include "logging/Logger.h"

namespace mcpgw {
namespace validation {

namespace {

constexpr double kMultipleOfEpsilon = 1e-9;

// Non-negative integral count (minLength, maxItems, ...).
std::optional<uint64_t> countValue(const JSONValue* v) {
    if (v == nullptr) return std::nullopt;
    if (v->isInteger()) {
        int64_t n = std::get<int64_t>(v->value);
        if (n < 0) return std::nullopt;
        return static_cast<uint64_t>(n);
    }
    if (std::holds_alternative<double>(v->value)) {
        double d = std::get<double>(v->value);
        if (d >= 0.0 && d < 18446744073709551616.0 && std::floor(d) == d) {
            return static_cast<uint64_t>(d);
        }
    }
    return std::nullopt;
}

// Exact int64 for int64 values and integral doubles inside the int64 range.
std::optional<int64_t> exactInteger(const JSONValue& v) {
    if (v.isInteger()) {
        return std::get<int64_t>(v.value);
    }
    if (std::holds_alternative<double>(v.value)) {
        double d = std::get<double>(v.value);
        if (std::isfinite(d) && std::floor(d) == d &&
            d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
            return static_cast<int64_t>(d);
        }
    }
    return std::nullopt;
}

std::optional<int64_t> integerValue(const JSONValue* v) {
    if (v == nullptr) return std::nullopt;
    return exactInteger(*v);
}

std::optional<double> numberValue(const JSONValue* v) {
    if (v == nullptr) return std::nullopt;
    return asDouble(*v);
}

ObjectSchema compileObjectBody(const JSONValue& schema, std::size_t depth) {
    ObjectSchema o;
    o.minProperties = countValue(findMember(schema, "minProperties"));
    o.maxProperties = countValue(findMember(schema, "maxProperties"));
    if (const JSONValue* req = findMember(schema, "required"); req && req->isArray()) {
        for (const auto& entry : std::get<JSONValue::Array>(req->value)) {
            if (entry && entry->isString()) {
                o.required.emplace_back(std::get<std::string>(entry->value));
            } else {
                o.required.emplace_back(std::nullopt);
            }
        }
    }
    if (const JSONValue* props = findMember(schema, "properties"); props && props->isObject()) {
        for (const auto& [name, sub] : std::get<JSONValue::Object>(props->value)) {
            o.properties[name] = CompileSchema(sub ? *sub : JSONValue{}, depth + 1);
        }
    }
    return o;
}

std::string argumentPrefix(const std::string& field) {
    return "Argument '" + field + "' ";
}

//------------------------------ Per-type checks ------------------------------
bool validateString(const std::string& field, const JSONValue& value, const StringSchema& s, std::string& errorMessage) {
    if (!value.isString()) {
        errorMessage = argumentPrefix(field) + "must be a string";
        return false;
    }
    const auto& str = std::get<std::string>(value.value);
    if (s.enumValues.has_value()) {
        const auto& allowed = s.enumValues.value();
        if (std::find(allowed.begin(), allowed.end(), str) == allowed.end()) {
            std::string joined;
            for (std::size_t k = 0; k < allowed.size(); ++k) {
                if (k > 0) joined += ", ";
                joined += allowed[k];
            }
            errorMessage = argumentPrefix(field) + "must be one of: " + joined + ". Got: '" + str + "'";
            return false;
        }
    }
    if (s.minLength.has_value() && str.size() < s.minLength.value()) {
        errorMessage = argumentPrefix(field) + "must be at least " + std::to_string(s.minLength.value()) + " characters long";
        return false;
    }
    if (s.maxLength.has_value() && str.size() > s.maxLength.value()) {
        errorMessage = argumentPrefix(field) + "must be at most " + std::to_string(s.maxLength.value()) + " characters long";
        return false;
    }
    if (s.pattern.has_value()) {
        LOG_WARN("Pattern validation for '{}' not enforced: {}", field, s.pattern.value());
    }
    return true;
}

bool validateNumber(const std::string& field, const JSONValue& value, const NumberSchema& s, std::string& errorMessage) {
    auto num = asDouble(value);
    if (!num.has_value()) {
        errorMessage = argumentPrefix(field) + "must be a number";
        return false;
    }
    const double v = num.value();
    if (s.minimum.has_value() && v < s.minimum.value()) {
        errorMessage = argumentPrefix(field) + "must be >= " + formatJSONNumber(s.minimum.value());
        return false;
    }
    if (s.maximum.has_value() && v > s.maximum.value()) {
        errorMessage = argumentPrefix(field) + "must be <= " + formatJSONNumber(s.maximum.value());
        return false;
    }
    if (s.exclusiveMinimum.has_value() && v <= s.exclusiveMinimum.value()) {
        errorMessage = argumentPrefix(field) + "must be > " + formatJSONNumber(s.exclusiveMinimum.value());
        return false;
    }
    if (s.exclusiveMaximum.has_value() && v >= s.exclusiveMaximum.value()) {
        errorMessage = argumentPrefix(field) + "must be < " + formatJSONNumber(s.exclusiveMaximum.value());
        return false;
    }
    if (s.multipleOf.has_value()) {
        const double m = s.multipleOf.value();
        if (m != 0.0 && std::isfinite(m)) {
            // Compare the quotient with its nearest integer so 0.3 / 0.1 passes
            const double q = v / m;
            const double tolerance = kMultipleOfEpsilon * std::max(1.0, std::fabs(q));
            if (!std::isfinite(q) || std::fabs(q - std::round(q)) > tolerance) {
                errorMessage = argumentPrefix(field) + "must be a multiple of " + formatJSONNumber(m);
                return false;
            }
        }
    }
    return true;
}

bool validateInteger(const std::string& field, const JSONValue& value, const IntegerSchema& s, std::string& errorMessage) {
    auto num = exactInteger(value);
    if (!num.has_value()) {
        errorMessage = argumentPrefix(field) + "must be an integer";
        return false;
    }
    const int64_t v = num.value();
    if (s.minimum.has_value() && v < s.minimum.value()) {
        errorMessage = argumentPrefix(field) + "must be >= " + std::to_string(s.minimum.value());
        return false;
    }
    if (s.maximum.has_value() && v > s.maximum.value()) {
        errorMessage = argumentPrefix(field) + "must be <= " + std::to_string(s.maximum.value());
        return false;
    }
    if (s.multipleOf.has_value()) {
        const int64_t m = s.multipleOf.value();
        // m == -1 divides everything and would overflow for INT64_MIN
        if (m != 0 && m != -1 && v % m != 0) {
            errorMessage = argumentPrefix(field) + "must be a multiple of " + std::to_string(m);
            return false;
        }
    }
    return true;
}

bool validateArray(const std::string& field, const JSONValue& value, const ArraySchema& s,
                   std::size_t depth, std::string& errorMessage) {
    if (!value.isArray()) {
        errorMessage = argumentPrefix(field) + "must be an array";
        return false;
    }
    const auto& arr = std::get<JSONValue::Array>(value.value);
    if (s.minItems.has_value() && arr.size() < s.minItems.value()) {
        errorMessage = argumentPrefix(field) + "must have at least " + std::to_string(s.minItems.value()) + " items";
        return false;
    }
    if (s.maxItems.has_value() && arr.size() > s.maxItems.value()) {
        errorMessage = argumentPrefix(field) + "must have at most " + std::to_string(s.maxItems.value()) + " items";
        return false;
    }
    const JSONValue nullValue{};
    if (s.uniqueItems) {
        // Canonical text: keys sorted, 1 and 1.0 print differently
        std::unordered_set<std::string> seen;
        seen.reserve(arr.size());
        for (const auto& item : arr) {
            if (!seen.insert(serializeJSONValue(item ? *item : nullValue)).second) {
                errorMessage = argumentPrefix(field) + "must have unique items";
                return false;
            }
        }
    }
    if (s.items) {
        for (std::size_t k = 0; k < arr.size(); ++k) {
            const std::string itemField = field + "[" + std::to_string(k) + "]";
            if (!ValidateValue(itemField, arr[k] ? *arr[k] : nullValue, *s.items, depth + 1, errorMessage)) {
                return false;
            }
        }
    }
    return true;
}

// Required names then declared properties; argument names are visited in sorted order.
bool validateMembers(const std::string& prefix, const JSONValue::Object& obj, const ObjectSchema& s,
                     std::size_t childDepth, std::string& errorMessage) {
    for (const auto& req : s.required) {
        if (!req.has_value()) {
            errorMessage = "Required field name must be a string";
            return false;
        }
        if (obj.find(req.value()) == obj.end()) {
            errorMessage = "Missing required argument: " + prefix + req.value();
            return false;
        }
    }
    if (s.properties.empty()) {
        return true;
    }
    std::vector<std::string> names;
    names.reserve(obj.size());
    for (const auto& kv : obj) names.push_back(kv.first);
    std::sort(names.begin(), names.end());
    const JSONValue nullValue{};
    for (const auto& name : names) {
        auto prop = s.properties.find(name);
        if (prop == s.properties.end() || !prop->second) {
            continue;
        }
        const auto& member = obj.at(name);
        if (!ValidateValue(prefix + name, member ? *member : nullValue, *prop->second, childDepth, errorMessage)) {
            return false;
        }
    }
    return true;
}

bool validateObject(const std::string& field, const JSONValue& value, const ObjectSchema& s,
                    std::size_t depth, std::string& errorMessage) {
    if (!value.isObject()) {
        errorMessage = argumentPrefix(field) + "must be an object";
        return false;
    }
    const auto& obj = std::get<JSONValue::Object>(value.value);
    if (s.minProperties.has_value() && obj.size() < s.minProperties.value()) {
        errorMessage = argumentPrefix(field) + "must have at least " + std::to_string(s.minProperties.value()) + " properties";
        return false;
    }
    if (s.maxProperties.has_value() && obj.size() > s.maxProperties.value()) {
        errorMessage = argumentPrefix(field) + "must have at most " + std::to_string(s.maxProperties.value()) + " properties";
        return false;
    }
    return validateMembers(field + ".", obj, s, depth + 1, errorMessage);
}

} // namespace

SchemaNodePtr CompileSchema(const JSONValue& schema, std::size_t depth) {
    auto node = std::make_shared<SchemaNode>();
    if (depth > kMaxSchemaDepth) {
        node->kind = TooDeepSchema{};
        return node;
    }
    const JSONValue* type = findMember(schema, "type");
    if (type == nullptr || !type->isString()) {
        node->kind = AnySchema{};
        return node;
    }
    const auto& tag = std::get<std::string>(type->value);
    if (tag == "string") {
        StringSchema s;
        if (const JSONValue* e = findMember(schema, "enum"); e && e->isArray()) {
            std::vector<std::string> values;
            for (const auto& item : std::get<JSONValue::Array>(e->value)) {
                if (item && item->isString()) values.push_back(std::get<std::string>(item->value));
            }
            s.enumValues = std::move(values);
        }
        s.minLength = countValue(findMember(schema, "minLength"));
        s.maxLength = countValue(findMember(schema, "maxLength"));
        if (const JSONValue* p = findMember(schema, "pattern"); p && p->isString()) {
            s.pattern = std::get<std::string>(p->value);
        }
        node->kind = std::move(s);
    } else if (tag == "number") {
        NumberSchema s;
        s.minimum = numberValue(findMember(schema, "minimum"));
        s.maximum = numberValue(findMember(schema, "maximum"));
        s.exclusiveMinimum = numberValue(findMember(schema, "exclusiveMinimum"));
        s.exclusiveMaximum = numberValue(findMember(schema, "exclusiveMaximum"));
        s.multipleOf = numberValue(findMember(schema, "multipleOf"));
        node->kind = s;
    } else if (tag == "integer") {
        IntegerSchema s;
        s.minimum = integerValue(findMember(schema, "minimum"));
        s.maximum = integerValue(findMember(schema, "maximum"));
        s.multipleOf = integerValue(findMember(schema, "multipleOf"));
        node->kind = s;
    } else if (tag == "boolean") {
        node->kind = BooleanSchema{};
    } else if (tag == "array") {
        ArraySchema s;
        s.minItems = countValue(findMember(schema, "minItems"));
        s.maxItems = countValue(findMember(schema, "maxItems"));
        if (const JSONValue* u = findMember(schema, "uniqueItems"); u && u->isBool()) {
            s.uniqueItems = std::get<bool>(u->value);
        }
        if (const JSONValue* items = findMember(schema, "items")) {
            s.items = CompileSchema(*items, depth + 1);
        }
        node->kind = std::move(s);
    } else if (tag == "object") {
        node->kind = compileObjectBody(schema, depth);
    } else if (tag == "null") {
        node->kind = NullSchema{};
    } else {
        node->kind = UnknownSchema{tag};
    }
    return node;
}

bool ValidateValue(const std::string& field, const JSONValue& value, const SchemaNode& node,
                   std::size_t depth, std::string& errorMessage) {
    if (depth > kMaxSchemaDepth) {
        errorMessage = argumentPrefix(field) + "exceeds maximum nesting depth of " + std::to_string(kMaxSchemaDepth);
        return false;
    }
    return std::visit([&](const auto& s) -> bool {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, StringSchema>) {
            return validateString(field, value, s, errorMessage);
        } else if constexpr (std::is_same_v<T, NumberSchema>) {
            return validateNumber(field, value, s, errorMessage);
        } else if constexpr (std::is_same_v<T, IntegerSchema>) {
            return validateInteger(field, value, s, errorMessage);
        } else if constexpr (std::is_same_v<T, BooleanSchema>) {
            if (!value.isBool()) {
                errorMessage = argumentPrefix(field) + "must be a boolean";
                return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, ArraySchema>) {
            return validateArray(field, value, s, depth, errorMessage);
        } else if constexpr (std::is_same_v<T, ObjectSchema>) {
            return validateObject(field, value, s, depth, errorMessage);
        } else if constexpr (std::is_same_v<T, NullSchema>) {
            if (!value.isNull()) {
                errorMessage = argumentPrefix(field) + "must be null";
                return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, AnySchema>) {
            return true;
        } else if constexpr (std::is_same_v<T, UnknownSchema>) {
            errorMessage = "Unknown type '" + s.typeName + "' in schema for '" + field + "'";
            return false;
        } else {
            static_assert(std::is_same_v<T, TooDeepSchema>, "unhandled schema kind");
            errorMessage = argumentPrefix(field) + "exceeds maximum nesting depth of " + std::to_string(kMaxSchemaDepth);
            return false;
        }
    }, node.kind);
}

bool ValidateArguments(const JSONValue& arguments, const JSONValue& inputSchema, std::string& errorMessage) {
    FUNC_SCOPE();
    if (!arguments.isObject()) {
        errorMessage = "Arguments must be an object";
        return false;
    }
    const ObjectSchema top = compileObjectBody(inputSchema, 0);
    if (!validateMembers("", std::get<JSONValue::Object>(arguments.value), top, 1, errorMessage)) {
        LOG_DEBUG("Argument validation failed: {}", errorMessage);
        return false;
    }
    return true;
}

} // namespace validation
} // namespace mcpgw
