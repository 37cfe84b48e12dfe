//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Schema.h
// Purpose: Compiled JSON-Schema subset and fail-fast argument validation for tools/call
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {
namespace validation {

// Deepest schema/argument level the validator descends to.
constexpr std::size_t kMaxSchemaDepth = 64;

struct SchemaNode;
using SchemaNodePtr = std::shared_ptr<const SchemaNode>;

//------------------------------ Per-type constraint sets ------------------------------
struct StringSchema {
    std::optional<std::vector<std::string>> enumValues;  // string members of "enum" only
    std::optional<uint64_t> minLength;                   // byte length
    std::optional<uint64_t> maxLength;
    std::optional<std::string> pattern;                  // logged, not enforced
};

struct NumberSchema {
    std::optional<double> minimum;
    std::optional<double> maximum;
    std::optional<double> exclusiveMinimum;
    std::optional<double> exclusiveMaximum;
    std::optional<double> multipleOf;
};

struct IntegerSchema {
    std::optional<int64_t> minimum;
    std::optional<int64_t> maximum;
    std::optional<int64_t> multipleOf;
};

struct BooleanSchema {};

struct ArraySchema {
    std::optional<uint64_t> minItems;
    std::optional<uint64_t> maxItems;
    bool uniqueItems = false;
    SchemaNodePtr items;  // null when the schema has no "items"
};

struct ObjectSchema {
    std::optional<uint64_t> minProperties;
    std::optional<uint64_t> maxProperties;
    // nullopt marks a non-string entry in "required"
    std::vector<std::optional<std::string>> required;
    std::map<std::string, SchemaNodePtr> properties;
};

struct NullSchema {};

// No "type" keyword (or a non-string one): any value passes
struct AnySchema {};

// Unrecognized "type" string: validation always fails
struct UnknownSchema {
    std::string typeName;
};

// Schema nested beyond kMaxSchemaDepth; reaching it fails validation
struct TooDeepSchema {};

//==========================================================================================================
// SchemaNode
// Purpose: Closed tagged variant over the supported type tags.
//==========================================================================================================
struct SchemaNode {
    std::variant<
        StringSchema,
        NumberSchema,
        IntegerSchema,
        BooleanSchema,
        ArraySchema,
        ObjectSchema,
        NullSchema,
        AnySchema,
        UnknownSchema,
        TooDeepSchema
    > kind;
};

//==========================================================================================================
// CompileSchema
// Purpose: Converts a schema JSON value into a SchemaNode tree.
// Args:
//   schema: Schema JSON value. Non-object schemas compile to AnySchema.
//   depth: Nesting level of this schema; nodes past kMaxSchemaDepth become TooDeepSchema.
// Notes:
//   Constraint keywords with values of the wrong JSON kind are ignored.
//==========================================================================================================
SchemaNodePtr CompileSchema(const JSONValue& schema, std::size_t depth = 0);

//==========================================================================================================
// ValidateValue
// Purpose: Validates one value against a compiled node.
// Args:
//   field: Path used in messages ("location", "tags[2]", "address.city").
//   value: Value to check.
//   node: Compiled schema.
//   depth: Current nesting level (top-level arguments are at depth 1).
//   errorMessage: Receives the first violation.
// Returns:
//   true when the value conforms.
//==========================================================================================================
bool ValidateValue(const std::string& field, const JSONValue& value, const SchemaNode& node,
                   std::size_t depth, std::string& errorMessage);

//==========================================================================================================
// ValidateArguments
// Purpose: Validates a tools/call argument bag against a tool's inputSchema.
// Notes:
//   Every name in the schema's "required" must be present; arguments named in "properties"
//   are validated and all others are accepted as-is.
//==========================================================================================================
bool ValidateArguments(const JSONValue& arguments, const JSONValue& inputSchema, std::string& errorMessage);

} // namespace validation
} // namespace mcpgw
