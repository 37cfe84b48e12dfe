//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_schema_validation.cpp
// Purpose: GoogleTests for tool argument validation against inputSchema
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/validation/Schema.h"

using namespace mcpgw;
using mcpgw::validation::ValidateArguments;

namespace {

// Validates args JSON against schema JSON; returns the error message, or "" when valid.
std::string check(const std::string& args, const std::string& schema) {
    std::string err;
    if (ValidateArguments(parseJSON(args), parseJSON(schema), err)) {
        return std::string();
    }
    EXPECT_FALSE(err.empty());
    return err;
}

const char* kAgeSchema = R"({"type":"object","properties":{"age":{"type":"number","minimum":0,"maximum":120}}})";

} // namespace

TEST(SchemaValidation, MissingRequiredArgument) {
    const char* schema = R"({"type":"object","properties":{"location":{"type":"string"}},"required":["location"]})";
    EXPECT_EQ(check("{}", schema), "Missing required argument: location");
    EXPECT_EQ(check(R"({"location":"Amsterdam"})", schema), "");
}

TEST(SchemaValidation, NumericBoundsInclusive) {
    EXPECT_EQ(check(R"({"age":150})", kAgeSchema), "Argument 'age' must be <= 120");
    EXPECT_EQ(check(R"({"age":-1})", kAgeSchema), "Argument 'age' must be >= 0");
    EXPECT_EQ(check(R"({"age":0})", kAgeSchema), "");
    EXPECT_EQ(check(R"({"age":120})", kAgeSchema), "");
    EXPECT_EQ(check(R"({"age":64.5})", kAgeSchema), "");
    EXPECT_EQ(check(R"({"age":"old"})", kAgeSchema), "Argument 'age' must be a number");
}

TEST(SchemaValidation, ExclusiveBounds) {
    const char* schema = R"({"properties":{"t":{"type":"number","exclusiveMinimum":0,"exclusiveMaximum":1.5}}})";
    EXPECT_EQ(check(R"({"t":0})", schema), "Argument 't' must be > 0");
    EXPECT_EQ(check(R"({"t":1.5})", schema), "Argument 't' must be < 1.5");
    EXPECT_EQ(check(R"({"t":0.75})", schema), "");
}

TEST(SchemaValidation, MultipleOfToleratesRounding) {
    const char* schema = R"({"properties":{"x":{"type":"number","multipleOf":0.1}}})";
    EXPECT_EQ(check(R"({"x":0.3})", schema), "");
    EXPECT_EQ(check(R"({"x":1.7})", schema), "");
    EXPECT_EQ(check(R"({"x":0.35})", schema), "Argument 'x' must be a multiple of 0.1");
}

TEST(SchemaValidation, MultipleOfZeroIsIgnored) {
    EXPECT_EQ(check(R"({"x":3.3})", R"({"properties":{"x":{"type":"number","multipleOf":0}}})"), "");
}

TEST(SchemaValidation, IntegerType) {
    const char* schema = R"({"properties":{"n":{"type":"integer","minimum":1,"maximum":10,"multipleOf":2}}})";
    EXPECT_EQ(check(R"({"n":4})", schema), "");
    EXPECT_EQ(check(R"({"n":4.0})", schema), "");
    EXPECT_EQ(check(R"({"n":4.5})", schema), "Argument 'n' must be an integer");
    EXPECT_EQ(check(R"({"n":"4"})", schema), "Argument 'n' must be an integer");
    EXPECT_EQ(check(R"({"n":12})", schema), "Argument 'n' must be <= 10");
    EXPECT_EQ(check(R"({"n":0})", schema), "Argument 'n' must be >= 1");
    EXPECT_EQ(check(R"({"n":5})", schema), "Argument 'n' must be a multiple of 2");
}

TEST(SchemaValidation, StringConstraints) {
    const char* schema = R"({"properties":{"unit":{"type":"string","enum":["celsius","fahrenheit"]},
                                          "code":{"type":"string","minLength":2,"maxLength":3}}})";
    EXPECT_EQ(check(R"({"unit":"kelvin"})", schema),
              "Argument 'unit' must be one of: celsius, fahrenheit. Got: 'kelvin'");
    EXPECT_EQ(check(R"({"unit":"celsius"})", schema), "");
    EXPECT_EQ(check(R"({"code":"a"})", schema), "Argument 'code' must be at least 2 characters long");
    EXPECT_EQ(check(R"({"code":"abcd"})", schema), "Argument 'code' must be at most 3 characters long");
    EXPECT_EQ(check(R"({"unit":7})", schema), "Argument 'unit' must be a string");
}

TEST(SchemaValidation, PatternIsNotEnforced) {
    EXPECT_EQ(check(R"({"s":"zzz"})", R"({"properties":{"s":{"type":"string","pattern":"^[a]+$"}}})"), "");
}

TEST(SchemaValidation, BooleanAndNull) {
    const char* schema = R"({"properties":{"b":{"type":"boolean"},"z":{"type":"null"}}})";
    EXPECT_EQ(check(R"({"b":true,"z":null})", schema), "");
    EXPECT_EQ(check(R"({"b":1})", schema), "Argument 'b' must be a boolean");
    EXPECT_EQ(check(R"({"z":0})", schema), "Argument 'z' must be null");
}

TEST(SchemaValidation, ArrayItemsAndCounts) {
    const char* schema = R"({"properties":{"tags":{"type":"array","minItems":1,"maxItems":3,"items":{"type":"string"}}}})";
    EXPECT_EQ(check(R"({"tags":["a","b"]})", schema), "");
    EXPECT_EQ(check(R"({"tags":[]})", schema), "Argument 'tags' must have at least 1 items");
    EXPECT_EQ(check(R"({"tags":["a","b","c","d"]})", schema), "Argument 'tags' must have at most 3 items");
    EXPECT_EQ(check(R"({"tags":["a",2]})", schema), "Argument 'tags[1]' must be a string");
    EXPECT_EQ(check(R"({"tags":"a"})", schema), "Argument 'tags' must be an array");
}

TEST(SchemaValidation, UniqueItemsUsesStructuralEquality) {
    const char* schema = R"({"properties":{"xs":{"type":"array","uniqueItems":true}}})";
    EXPECT_EQ(check(R"({"xs":[1,2,3]})", schema), "");
    EXPECT_EQ(check(R"({"xs":[{"a":[1]},2,{"a":[1]}]})", schema), "Argument 'xs' must have unique items");
    EXPECT_EQ(check(R"({"xs":[[1,2],[2,1]]})", schema), "");
}

TEST(SchemaValidation, UniqueItemsKeyOrderAndNumberKinds) {
    const char* schema = R"({"properties":{"xs":{"type":"array","uniqueItems":true}}})";
    EXPECT_EQ(check(R"({"xs":[{"a":1,"b":2},{"b":2,"a":1}]})", schema), "Argument 'xs' must have unique items");
    EXPECT_EQ(check(R"({"xs":[1,1.0]})", schema), "");
    EXPECT_EQ(check(R"({"xs":[null,"a",null]})", schema), "Argument 'xs' must have unique items");
}

TEST(SchemaValidation, UniqueItemsLargeArrayStaysFast) {
    const char* schema = R"({"properties":{"xs":{"type":"array","uniqueItems":true}}})";
    std::string args = R"({"xs":[)";
    for (int i = 0; i < 40000; ++i) {
        if (i > 0) args += ",";
        args += std::to_string(i);
    }
    std::string dup = args + ",17]}";
    args += "]}";

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(check(args, schema), "");
    EXPECT_EQ(check(dup, schema), "Argument 'xs' must have unique items");
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 3000);
}

TEST(SchemaValidation, NestedObjectsReportDottedPath) {
    const char* schema = R"({"properties":{"address":{"type":"object","required":["city"],
        "properties":{"city":{"type":"string"},"geo":{"type":"object","properties":{"lat":{"type":"number","maximum":90}}}}}}})";
    EXPECT_EQ(check(R"({"address":{}})", schema), "Missing required argument: address.city");
    EXPECT_EQ(check(R"({"address":{"city":"Oslo","geo":{"lat":91}}})", schema),
              "Argument 'address.geo.lat' must be <= 90");
    EXPECT_EQ(check(R"({"address":5})", schema), "Argument 'address' must be an object");
}

TEST(SchemaValidation, ObjectPropertyCounts) {
    const char* schema = R"({"properties":{"o":{"type":"object","minProperties":1,"maxProperties":2}}})";
    EXPECT_EQ(check(R"({"o":{}})", schema), "Argument 'o' must have at least 1 properties");
    EXPECT_EQ(check(R"({"o":{"a":1,"b":2,"c":3}})", schema), "Argument 'o' must have at most 2 properties");
}

TEST(SchemaValidation, UnknownTypeIsRejected) {
    EXPECT_EQ(check(R"({"v":1})", R"({"properties":{"v":{"type":"decimal"}}})"),
              "Unknown type 'decimal' in schema for 'v'");
}

TEST(SchemaValidation, UntypedPropertyAcceptsAnything) {
    EXPECT_EQ(check(R"({"v":[1,"x",null]})", R"({"properties":{"v":{"description":"free form"}}})"), "");
}

TEST(SchemaValidation, UndeclaredArgumentsAreAllowed) {
    EXPECT_EQ(check(R"({"extra":true})", kAgeSchema), "");
}

TEST(SchemaValidation, NonStringRequiredEntry) {
    EXPECT_EQ(check("{}", R"({"required":[5]})"), "Required field name must be a string");
}

TEST(SchemaValidation, ArgumentsMustBeObject) {
    EXPECT_EQ(check("[1]", kAgeSchema), "Arguments must be an object");
}

TEST(SchemaValidation, FirstFailureInSortedOrder) {
    const char* schema = R"({"properties":{"b":{"type":"string"},"a":{"type":"string"}}})";
    EXPECT_EQ(check(R"({"b":1,"a":2})", schema), "Argument 'a' must be a string");
}

TEST(SchemaValidation, NestingBeyondBoundIsRejected) {
    const int levels = static_cast<int>(validation::kMaxSchemaDepth) + 6;
    std::string schema;
    std::string args;
    for (int k = 0; k < levels; ++k) {
        schema += R"({"type":"object","properties":{"a":)";
        args += R"({"a":)";
    }
    schema += R"({"type":"string"})";
    args += R"("leaf")";
    for (int k = 0; k < levels; ++k) {
        schema += "}}";
        args += "}";
    }
    std::string err = check(args, schema);
    EXPECT_NE(err.find("exceeds maximum nesting depth of 64"), std::string::npos) << err;
}
