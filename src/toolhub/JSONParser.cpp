//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Strict JSON parser/serializer and JSON-RPC envelope codec
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>

#include <fmt/format.h>

#include "toolhub/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace toolhub {

//----------------------------------------------------------------------------------------------------------
// JSONObject
//----------------------------------------------------------------------------------------------------------
std::shared_ptr<JSONValue>& JSONObject::operator[](const std::string& key) {
    auto it = find(key);
    if (it != entries.end()) {
        return it->second;
    }
    entries.emplace_back(key, std::make_shared<JSONValue>());
    return entries.back().second;
}

JSONObject::iterator JSONObject::find(const std::string& key) {
    return std::find_if(entries.begin(), entries.end(), [&](const Entry& e){ return e.first == key; });
}

JSONObject::const_iterator JSONObject::find(const std::string& key) const {
    return std::find_if(entries.begin(), entries.end(), [&](const Entry& e){ return e.first == key; });
}

std::size_t JSONObject::erase(const std::string& key) {
    auto it = find(key);
    if (it == entries.end()) {
        return 0u;
    }
    entries.erase(it);
    return 1u;
}

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

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
constexpr unsigned int MaxNestingDepth = 256u;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0u};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const char* what) const {
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
        if (i + 4 > s.size()) fail("Truncated unicode escape");
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
        ++i;
        std::string out;
        for (;;) {
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
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("Unpaired high surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
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

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        auto digits = [&]() {
            std::size_t n = 0;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++n; }
            return n;
        };
        if (i < s.size() && s[i] == '-') ++i;
        if (i < s.size() && s[i] == '0') {
            ++i;
        } else if (digits() == 0) {
            fail("Invalid number");
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (digits() == 0) fail("Expected digits after decimal point");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (digits() == 0) fail("Expected digits in exponent");
        }
        const std::string num = s.substr(start, i - start);
        if (!isFloat) {
            errno = 0;
            char* end = nullptr;
            long long v = std::strtoll(num.c_str(), &end, 10);
            if (errno != ERANGE) {
                return JSONValue(static_cast<int64_t>(v));
            }
            // Out of int64 range: keep magnitude as double
        }
        return JSONValue(std::strtod(num.c_str(), nullptr));
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        if (++depth > MaxNestingDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        if (++depth > MaxNestingDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
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
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();
        fail("Unexpected token");
    }

    JSONValue parseDocument() {
        JSONValue v = parseValue();
        skipWs();
        if (i != s.size()) fail("Trailing characters after JSON value");
        return v;
    }
};

std::string formatDouble(double v) {
    if (!std::isfinite(v)) {
        // JSON has no representation for NaN/Infinity
        return "null";
    }
    std::string out = fmt::format("{}", v);
    if (out.find_first_of(".eE") == std::string::npos) {
        out += ".0";
    }
    return out;
}

void appendEscaped(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void appendValue(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            out += formatDouble(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (size_t k = 0; k < v.size(); ++k) {
                if (k > 0) out.push_back(',');
                if (v[k]) { appendValue(out, *v[k]); } else { out += "null"; }
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) out.push_back(',');
                first = false;
                appendEscaped(out, key);
                out.push_back(':');
                if (val) { appendValue(out, *val); } else { out += "null"; }
            }
            out.push_back('}');
        }
    }, value.get());
}

bool idFromValue(const JSONValue& v, JSONRPCId& out) {
    if (std::holds_alternative<std::string>(v.value)) { out = std::get<std::string>(v.value); return true; }
    if (std::holds_alternative<int64_t>(v.value)) { out = std::get<int64_t>(v.value); return true; }
    if (v.isNull()) { out = nullptr; return true; }
    return false;
}

std::string jsonrpcTag(const JSONValue::Object& obj) {
    const JSONValue* tag = FindMember(obj, "jsonrpc");
    if (tag && tag->isString()) {
        return std::get<std::string>(tag->value);
    }
    return std::string();
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    return p.parseDocument();
}

std::string serializeJSONValue(const JSONValue& value) {
    FUNC_SCOPE();
    std::string out;
    appendValue(out, value);
    return out;
}

const JSONValue* FindMember(const JSONValue::Object& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

JSONValue IdToValue(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        return JSONValue(v);
    }, id);
}

std::string IdToString(const JSONRPCId& id) {
    return serializeJSONValue(IdToValue(id));
}

//----------------------------------------------------------------------------------------------------------
// JSONRPCRequest
//----------------------------------------------------------------------------------------------------------
std::optional<std::string> JSONRPCRequest::Validate() const {
    if (jsonrpc != "2.0") {
        return std::string("jsonrpc must be \"2.0\"");
    }
    if (method.empty()) {
        return std::string("method must be a non-empty string");
    }
    return std::nullopt;
}

JSONValue JSONRPCRequest::ToValue() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    if (id.has_value()) {
        obj["id"] = std::make_shared<JSONValue>(IdToValue(id.value()));
    }
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue(std::move(obj));
}

bool JSONRPCRequest::FromValue(const JSONValue& v) {
    if (!v.isObject()) {
        return false;
    }
    const auto& obj = std::get<JSONValue::Object>(v.value);
    jsonrpc = jsonrpcTag(obj);
    const JSONValue* m = FindMember(obj, "method");
    if (!m || !m->isString()) {
        return false;
    }
    method = std::get<std::string>(m->value);
    id.reset();
    if (obj.count("id") > 0) {
        JSONRPCId parsed;
        const JSONValue* idVal = FindMember(obj, "id");
        if (!idVal || !idFromValue(*idVal, parsed)) {
            return false;
        }
        id = std::move(parsed);
    }
    params.reset();
    if (const JSONValue* p = FindMember(obj, "params")) {
        params = *p;
    }
    return true;
}

std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    return serializeJSONValue(ToValue());
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromValue(ParseJSON(json));
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

//----------------------------------------------------------------------------------------------------------
// JSONRPCResponse
//----------------------------------------------------------------------------------------------------------
JSONValue JSONRPCResponse::ToValue() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["id"] = std::make_shared<JSONValue>(IdToValue(id));
    if (error.has_value()) {
        obj["error"] = std::make_shared<JSONValue>(error.value());
    } else {
        obj["result"] = std::make_shared<JSONValue>(result.has_value() ? result.value() : JSONValue(nullptr));
    }
    return JSONValue(std::move(obj));
}

bool JSONRPCResponse::FromValue(const JSONValue& v) {
    if (!v.isObject()) {
        return false;
    }
    const auto& obj = std::get<JSONValue::Object>(v.value);
    if (obj.count("method") > 0) {
        return false;
    }
    jsonrpc = jsonrpcTag(obj);
    const JSONValue* idVal = FindMember(obj, "id");
    if (!idVal || !idFromValue(*idVal, id)) {
        return false;
    }
    result.reset();
    error.reset();
    if (const JSONValue* e = FindMember(obj, "error")) {
        error = *e;
    } else if (const JSONValue* r = FindMember(obj, "result")) {
        result = *r;
    } else {
        return false;
    }
    return true;
}

std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    return serializeJSONValue(ToValue());
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromValue(ParseJSON(json));
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

//----------------------------------------------------------------------------------------------------------
// Utility functions
//----------------------------------------------------------------------------------------------------------
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

JSONRPCResponse CreateErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONRPCResponse response;
    response.id = id;
    response.error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace toolhub
