//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Strict JSON parser/serializer and JSON-RPC envelope (de)serialization using only std library
//==========================================================================================================

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <sstream>
#include <cctype>
#include <stdexcept>
#include <iomanip>
#include "mcpgw/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace mcpgw {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

// -------------------------------
// Strict recursive JSON parser
// -------------------------------
namespace {
struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    std::size_t depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw JSONParseError(what, i);
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Unescaped control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("Unpaired surrogate in unicode escape");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate in unicode escape");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired surrogate in unicode escape");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    static bool isDigit(char c) { return c >= '0' && c <= '9'; }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size() || !isDigit(s[i])) fail("Invalid value");
        if (s[i] == '0') {
            ++i;
        } else {
            while (i < s.size() && isDigit(s[i])) ++i;
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (i >= s.size() || !isDigit(s[i])) fail("Expected digit after decimal point");
            while (i < s.size() && isDigit(s[i])) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (i >= s.size() || !isDigit(s[i])) fail("Expected digit in exponent");
            while (i < s.size() && isDigit(s[i])) ++i;
        }
        const char* first = s.data() + start;
        const char* last = s.data() + i;
        if (!isFloat) {
            int64_t v = 0;
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last) {
                return JSONValue(v);
            }
            // Out of int64 range: keep the magnitude as a double
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ptr != last || (ec != std::errc() && ec != std::errc::result_out_of_range)) {
            fail("Invalid number");
        }
        if (!std::isfinite(d)) fail("Number out of range");
        return JSONValue(d);
    }

    void enter() {
        if (++depth > kMaxJSONParseDepth) fail("Maximum nesting depth exceeded");
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        enter();
        JSONValue::Array arr;
        skipWs();
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            skipWs();
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        enter();
        JSONValue::Object obj;
        skipWs();
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            skipWs();
            if (!match(':')) fail("Expected ':' after key");
            JSONValue val = parseValue();
            // Duplicate keys: last one wins
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            skipWs();
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't') {
            if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
            fail("Invalid literal");
        }
        if (c == 'f') {
            if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
            fail("Invalid literal");
        }
        if (c == 'n') {
            if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
            fail("Invalid literal");
        }
        return parseNumber();
    }

    JSONValue parseDocument() {
        JSONValue v = parseValue();
        skipWs();
        if (i != s.size()) fail("Trailing characters after JSON value");
        return v;
    }
};

void appendEscapedString(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

std::string serializeDouble(double v) {
    if (!std::isfinite(v)) {
        return "null";
    }
    std::string out = formatJSONNumber(v);
    // Keep doubles recognizable as such on re-parse
    if (out.find_first_of(".eE") == std::string::npos) {
        out += ".0";
    }
    return out;
}

std::vector<const JSONValue::Object::value_type*> sortedMembers(const JSONValue::Object& o) {
    std::vector<const JSONValue::Object::value_type*> members;
    members.reserve(o.size());
    for (const auto& kv : o) members.push_back(&kv);
    std::sort(members.begin(), members.end(), [](const auto* a, const auto* b){ return a->first < b->first; });
    return members;
}

void writeValue(std::ostringstream& oss, const JSONValue& value, bool pretty, std::size_t indent) {
    auto newline = [&](std::size_t level) {
        if (!pretty) return;
        oss << '\n';
        for (std::size_t k = 0; k < level; ++k) oss << "  ";
    };
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            oss << serializeDouble(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscapedString(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            if (v.empty()) { oss << ']'; return; }
            for (size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                newline(indent + 1);
                if (v[k]) { writeValue(oss, *v[k], pretty, indent + 1); } else { oss << "null"; }
            }
            newline(indent);
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            if (v.empty()) { oss << '}'; return; }
            bool first = true;
            for (const auto* kv : sortedMembers(v)) {
                if (!first) oss << ',';
                first = false;
                newline(indent + 1);
                appendEscapedString(oss, kv->first);
                oss << (pretty ? ": " : ":");
                if (kv->second) { writeValue(oss, *kv->second, pretty, indent + 1); } else { oss << "null"; }
            }
            newline(indent);
            oss << '}';
        }
    }, value.get());
}
} // namespace

JSONValue parseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    return p.parseDocument();
}

bool tryParseJSON(const std::string& text, JSONValue& out, std::string& errorMessage) {
    try {
        out = parseJSON(text);
        return true;
    } catch (const JSONParseError& e) {
        errorMessage = e.what();
        return false;
    }
}

std::string serializeJSONValue(const JSONValue& value) {
    FUNC_SCOPE();
    std::ostringstream oss;
    writeValue(oss, value, false, 0);
    return oss.str();
}

std::string serializeJSONValuePretty(const JSONValue& value) {
    std::ostringstream oss;
    writeValue(oss, value, true, 0);
    return oss.str();
}

std::string formatJSONNumber(double v) {
    std::array<char, 64> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v);
    if (ec != std::errc()) {
        std::ostringstream oss;
        oss << std::setprecision(17) << v;
        return oss.str();
    }
    return std::string(buf.data(), ptr);
}

bool jsonEquals(const JSONValue& a, const JSONValue& b) {
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (a.isArray()) {
        const auto& x = std::get<JSONValue::Array>(a.value);
        const auto& y = std::get<JSONValue::Array>(b.value);
        if (x.size() != y.size()) return false;
        for (size_t k = 0; k < x.size(); ++k) {
            const JSONValue nullValue{};
            const JSONValue& xa = x[k] ? *x[k] : nullValue;
            const JSONValue& yb = y[k] ? *y[k] : nullValue;
            if (!jsonEquals(xa, yb)) return false;
        }
        return true;
    }
    if (a.isObject()) {
        const auto& x = std::get<JSONValue::Object>(a.value);
        const auto& y = std::get<JSONValue::Object>(b.value);
        if (x.size() != y.size()) return false;
        for (const auto& [key, val] : x) {
            auto it = y.find(key);
            if (it == y.end()) return false;
            const JSONValue nullValue{};
            if (!jsonEquals(val ? *val : nullValue, it->second ? *it->second : nullValue)) return false;
        }
        return true;
    }
    return a.value == b.value;
}

const JSONValue* findMember(const JSONValue& v, const std::string& key) {
    if (!v.isObject()) {
        return nullptr;
    }
    const auto& o = std::get<JSONValue::Object>(v.value);
    auto it = o.find(key);
    if (it == o.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<double> asDouble(const JSONValue& v) {
    if (std::holds_alternative<int64_t>(v.value)) {
        return static_cast<double>(std::get<int64_t>(v.value));
    }
    if (std::holds_alternative<double>(v.value)) {
        return std::get<double>(v.value);
    }
    return std::nullopt;
}

//----------------------------------------------------------------------------------------------------------
// UTF-8 validation (RFC 3629: no overlongs, no surrogates, max U+10FFFF)
//----------------------------------------------------------------------------------------------------------
namespace {
// Length of the valid sequence starting at p, or 0 when the bytes are not well-formed UTF-8.
std::size_t utf8SequenceLength(const unsigned char* p, const unsigned char* end) {
    unsigned char b0 = p[0];
    if (b0 < 0x80u) return 1;
    std::size_t len = 0;
    unsigned char lo = 0x80u, hi = 0xBFu;
    if (b0 >= 0xC2u && b0 <= 0xDFu) { len = 2; }
    else if (b0 == 0xE0u) { len = 3; lo = 0xA0u; }
    else if (b0 >= 0xE1u && b0 <= 0xECu) { len = 3; }
    else if (b0 == 0xEDu) { len = 3; hi = 0x9Fu; }
    else if (b0 >= 0xEEu && b0 <= 0xEFu) { len = 3; }
    else if (b0 == 0xF0u) { len = 4; lo = 0x90u; }
    else if (b0 >= 0xF1u && b0 <= 0xF3u) { len = 4; }
    else if (b0 == 0xF4u) { len = 4; hi = 0x8Fu; }
    else { return 0; }
    if (static_cast<std::size_t>(end - p) < len) return 0;
    if (p[1] < lo || p[1] > hi) return 0;
    for (std::size_t k = 2; k < len; ++k) {
        if ((p[k] & 0xC0u) != 0x80u) return 0;
    }
    return len;
}
} // namespace

bool isValidUtf8(const std::string& text) {
    const unsigned char* p = reinterpret_cast<const unsigned char*>(text.data());
    const unsigned char* end = p + text.size();
    while (p < end) {
        std::size_t len = utf8SequenceLength(p, end);
        if (len == 0) return false;
        p += len;
    }
    return true;
}

std::string sanitizeUtf8(const std::string& text) {
    static const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD
    std::string result;
    result.reserve(text.size());
    const unsigned char* p = reinterpret_cast<const unsigned char*>(text.data());
    const unsigned char* end = p + text.size();
    while (p < end) {
        std::size_t len = utf8SequenceLength(p, end);
        if (len == 0) {
            result.append(kReplacement, 3);
            ++p;
            continue;
        }
        result.append(reinterpret_cast<const char*>(p), len);
        p += len;
    }
    return result;
}

//----------------------------------------------------------------------------------------------------------
// JSON-RPC ids
//----------------------------------------------------------------------------------------------------------
JSONValue idToJSONValue(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return JSONValue(nullptr);
        } else {
            return JSONValue(v);
        }
    }, id);
}

std::optional<JSONRPCId> idFromJSONValue(const JSONValue& v) {
    if (std::holds_alternative<std::string>(v.value)) return JSONRPCId{std::get<std::string>(v.value)};
    if (std::holds_alternative<int64_t>(v.value)) return JSONRPCId{std::get<int64_t>(v.value)};
    if (std::holds_alternative<double>(v.value)) return JSONRPCId{std::get<double>(v.value)};
    if (std::holds_alternative<std::nullptr_t>(v.value)) return JSONRPCId{nullptr};
    return std::nullopt;
}

// JSONRPCRequest implementation
bool JSONRPCRequest::FromJSONValue(const JSONValue& v, std::string& errorMessage) {
    FUNC_SCOPE();
    if (!v.isObject()) {
        errorMessage = "request must be a JSON object";
        return false;
    }
    const JSONValue* version = findMember(v, "jsonrpc");
    if (version == nullptr || !version->isString()) {
        errorMessage = "jsonrpc must be a string";
        return false;
    }
    const JSONValue* m = findMember(v, "method");
    if (m == nullptr || !m->isString()) {
        errorMessage = "method must be a string";
        return false;
    }
    JSONRPCId parsedId{nullptr};
    if (const JSONValue* idVal = findMember(v, "id")) {
        auto idOpt = idFromJSONValue(*idVal);
        if (!idOpt.has_value()) {
            errorMessage = "id must be a string, number, or null";
            return false;
        }
        parsedId = std::move(idOpt.value());
    }
    jsonrpc = std::get<std::string>(version->value);
    method = std::get<std::string>(m->value);
    id = std::move(parsedId);
    const JSONValue* p = findMember(v, "params");
    params = p ? *p : JSONValue{JSONValue::Object{}};
    return true;
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    JSONValue::Object o;
    o["jsonrpc"] = makeJSON(JSONValue(jsonrpc));
    o["id"] = makeJSON(idToJSONValue(id));
    if (result.has_value()) {
        o["result"] = makeJSON(result.value());
    }
    if (error.has_value()) {
        o["error"] = makeJSON(error.value());
    }
    return serializeJSONValue(JSONValue(std::move(o)));
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    JSONValue v;
    std::string err;
    if (!tryParseJSON(json, v, err)) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", err);
        return false;
    }
    if (!v.isObject()) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", "not an object");
        return false;
    }
    const JSONValue* version = findMember(v, "jsonrpc");
    if (version == nullptr || !version->isString()) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", "jsonrpc missing");
        return false;
    }
    JSONRPCId parsedId{nullptr};
    if (const JSONValue* idVal = findMember(v, "id")) {
        auto idOpt = idFromJSONValue(*idVal);
        if (!idOpt.has_value()) {
            LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", "invalid id");
            return false;
        }
        parsedId = std::move(idOpt.value());
    }
    const JSONValue* r = findMember(v, "result");
    const JSONValue* e = findMember(v, "error");
    if ((r == nullptr) == (e == nullptr)) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", "exactly one of result/error required");
        return false;
    }
    jsonrpc = std::get<std::string>(version->value);
    id = std::move(parsedId);
    result.reset();
    error.reset();
    if (r) result = *r;
    if (e) error = *e;
    return true;
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);

    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }

    return JSONValue(errorObj);
}

} // namespace mcpgw
