//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, compact serializer and JSON-RPC envelope codecs
//==========================================================================================================

#include <cmath>
#include <format>
#include <sstream>
#include <cctype>
#include <stdexcept>
#include <iomanip>
#include "toolhost/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace toolhost {

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

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (const auto* arr = std::get_if<JSONValue::Array>(&a.value)) {
        const auto& other = std::get<JSONValue::Array>(b.value);
        if (arr->size() != other.size()) return false;
        for (std::size_t i = 0; i < arr->size(); ++i) {
            const auto& x = (*arr)[i];
            const auto& y = other[i];
            if (!x || !y) {
                if (static_cast<bool>(x) != static_cast<bool>(y)) return false;
                continue;
            }
            if (!(*x == *y)) return false;
        }
        return true;
    }
    if (const auto* obj = std::get_if<JSONValue::Object>(&a.value)) {
        const auto& other = std::get<JSONValue::Object>(b.value);
        if (obj->size() != other.size()) return false;
        for (const auto& [key, x] : *obj) {
            auto it = other.find(key);
            if (it == other.end()) return false;
            const auto& y = it->second;
            if (!x || !y) {
                if (static_cast<bool>(x) != static_cast<bool>(y)) return false;
                continue;
            }
            if (!(*x == *y)) return false;
        }
        return true;
    }
    return a.value == b.value;
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    static constexpr int kMaxDepth = 512;

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(std::format("{} at offset {}", what, i));
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
        for (int k = 0; k < 4; ++k) {
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
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
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
                    // Combine a high surrogate with the low surrogate that must follow it
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            fail("Unpaired high surrogate");
                        }
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired low surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    std::size_t digits() {
        std::size_t start = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        return i - start;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (digits() == 0) fail("Invalid value");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (digits() == 0) fail("Expected digits after '.'");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (digits() == 0) fail("Expected exponent digits");
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Integers beyond int64 degrade to double precision
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            fail("Number out of range");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue out;
        char c = s[i];
        if (c == '"') {
            out = JSONValue(parseString());
        } else if (c == '{') {
            out = parseObject();
        } else if (c == '[') {
            out = parseArray();
        } else if (s.compare(i, 4, "true") == 0) {
            i += 4; out = JSONValue(true);
        } else if (s.compare(i, 5, "false") == 0) {
            i += 5; out = JSONValue(false);
        } else if (s.compare(i, 4, "null") == 0) {
            i += 4; out = JSONValue(nullptr);
        } else {
            out = parseNumber();
        }
        --depth;
        return out;
    }
};

void appendQuoted(std::ostringstream& oss, const std::string& v) {
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
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void serializeInto(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            // JSON has no NaN/Infinity; shortest round-trip form otherwise
            if (std::isfinite(v)) {
                oss << std::format("{}", v);
            } else {
                oss << "null";
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendQuoted(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ',';
                if (v[i]) serializeInto(oss, *v[i]); else oss << "null";
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                appendQuoted(oss, key);
                oss << ':';
                if (val) serializeInto(oss, *val); else oss << "null";
            }
            oss << '}';
        }
    }, value.get());
}

void serializeId(std::ostringstream& oss, const JSONRPCId& id) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            appendQuoted(oss, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else {
            oss << "null";
        }
    }, id);
}

// Reads "id" from a parsed envelope; false when present but not string/integer/null.
bool readId(const JSONValue& envelope, JSONRPCId& out) {
    const JSONValue* v = FindMember(envelope, "id");
    if (v == nullptr || v->isNull()) {
        out = nullptr;
        return v != nullptr;
    }
    if (const auto* str = std::get_if<std::string>(&v->value)) {
        out = *str;
        return true;
    }
    if (const auto* num = std::get_if<int64_t>(&v->value)) {
        out = *num;
        return true;
    }
    return false;
}

std::optional<JSONValue> readOptional(const JSONValue& envelope, const char* key) {
    const JSONValue* v = FindMember(envelope, key);
    if (v == nullptr) return std::nullopt;
    return *v;
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Trailing characters after JSON value");
    }
    return v;
}

std::optional<JSONValue> TryParseJSON(const std::string& text) {
    try {
        return ParseJSON(text);
    } catch (const std::runtime_error& e) {
        LOG_DEBUG("TryParseJSON: {}", e.what());
        return std::nullopt;
    }
}

std::string SerializeJSON(const JSONValue& value) {
    std::ostringstream oss;
    serializeInto(oss, value);
    return oss.str();
}

const JSONValue* FindMember(const JSONValue& object, const std::string& key) {
    const auto* obj = std::get_if<JSONValue::Object>(&object.value);
    if (obj == nullptr) return nullptr;
    auto it = obj->find(key);
    if (it == obj->end() || !it->second) return nullptr;
    return it->second.get();
}

std::optional<std::string> GetStringMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (v == nullptr) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&v->value)) return *s;
    return std::nullopt;
}

std::string JSONRPCIdToString(const JSONRPCId& id) {
    if (const auto* s = std::get_if<std::string>(&id)) return *s;
    if (const auto* n = std::get_if<int64_t>(&id)) return std::to_string(*n);
    return "null";
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\",\"id\":";
    serializeId(oss, id);
    oss << ",\"method\":";
    appendQuoted(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":";
        serializeInto(oss, params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    auto doc = TryParseJSON(json);
    if (!doc.has_value()) {
        LOG_ERROR("Failed to deserialize JSONRPCRequest: invalid JSON");
        return false;
    }
    return FromValue(doc.value());
}

bool JSONRPCRequest::FromValue(const JSONValue& value) {
    auto m = GetStringMember(value, "method");
    if (!m.has_value() || m->empty()) return false;
    if (FindMember(value, "id") == nullptr || !readId(value, id)) return false;
    method = std::move(m.value());
    params = readOptional(value, "params");
    return true;
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\",\"id\":";
    serializeId(oss, id);
    if (error.has_value()) {
        oss << ",\"error\":";
        serializeInto(oss, error.value());
    } else {
        oss << ",\"result\":";
        if (result.has_value()) serializeInto(oss, result.value()); else oss << "null";
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    auto doc = TryParseJSON(json);
    if (!doc.has_value()) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: invalid JSON");
        return false;
    }
    return FromValue(doc.value());
}

bool JSONRPCResponse::FromValue(const JSONValue& value) {
    if (!value.isObject() || !readId(value, id)) return false;
    result = readOptional(value, "result");
    error = readOptional(value, "error");
    return result.has_value() || error.has_value();
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\",\"method\":";
    appendQuoted(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":";
        serializeInto(oss, params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    auto doc = TryParseJSON(json);
    if (!doc.has_value()) {
        LOG_ERROR("Failed to deserialize JSONRPCNotification: invalid JSON");
        return false;
    }
    return FromValue(doc.value());
}

bool JSONRPCNotification::FromValue(const JSONValue& value) {
    auto m = GetStringMember(value, "method");
    if (!m.has_value() || m->empty()) return false;
    method = std::move(m.value());
    params = readOptional(value, "params");
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
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace toolhost
