//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.cpp
// Purpose: Recursive-descent JSON parser, compact serializer and structural comparison
//==========================================================================================================

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "toolwire/JSONTypes.h"

namespace toolwire {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) noexcept = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) noexcept = default;
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

namespace {

constexpr unsigned int MaxDepth = 256u;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0u};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(std::string(what) + " at offset " + std::to_string(i));
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
        ++i;
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
                    // Combine UTF-16 surrogate pairs; a lone surrogate becomes U+FFFD
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low >= 0xDC00 && low <= 0xDFFF) {
                                code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                            } else {
                                appendUtf8(out, 0xFFFD);
                                code = low;
                            }
                        } else {
                            code = 0xFFFD;
                        }
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        code = 0xFFFD;
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
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t intStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == intStart) fail("Invalid number");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) fail("Invalid number fraction");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) fail("Invalid number exponent");
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Integers beyond int64 degrade to double precision
                return JSONValue(std::stod(num));
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
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
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
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        if (++depth > MaxDepth) fail("Nesting too deep");
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

void writeString(std::ostringstream& oss, const std::string& v) {
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

void writeValue(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                oss << "null";
                return;
            }
            // Shortest round-trip form; keep a fraction so the value re-parses as a double
            std::string num = fmt::format("{}", v);
            if (num.find_first_of(".eE") == std::string::npos) {
                num += ".0";
            }
            oss << num;
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeString(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                if (v[k]) { writeValue(oss, *v[k]); } else { oss << "null"; }
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeString(oss, key);
                oss << ':';
                if (val) { writeValue(oss, *val); } else { oss << "null"; }
            }
            oss << '}';
        }
    }, value.get());
}

} // namespace

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Unexpected trailing characters");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    FUNC_SCOPE();
    std::ostringstream oss;
    writeValue(oss, value);
    return oss.str();
}

bool JSONEquals(const JSONValue& a, const JSONValue& b) {
    const auto* ai = std::get_if<int64_t>(&a.value);
    const auto* ad = std::get_if<double>(&a.value);
    const auto* bi = std::get_if<int64_t>(&b.value);
    const auto* bd = std::get_if<double>(&b.value);
    if ((ai || ad) && (bi || bd)) {
        if (ai && bi) return *ai == *bi;
        double x = ai ? static_cast<double>(*ai) : *ad;
        double y = bi ? static_cast<double>(*bi) : *bd;
        return x == y;
    }
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (const auto* arr = std::get_if<JSONValue::Array>(&a.value)) {
        const auto& other = std::get<JSONValue::Array>(b.value);
        if (arr->size() != other.size()) return false;
        for (std::size_t k = 0; k < arr->size(); ++k) {
            JSONValue nullValue;
            const JSONValue& x = (*arr)[k] ? *(*arr)[k] : nullValue;
            const JSONValue& y = other[k] ? *other[k] : nullValue;
            if (!JSONEquals(x, y)) return false;
        }
        return true;
    }
    if (const auto* obj = std::get_if<JSONValue::Object>(&a.value)) {
        const auto& other = std::get<JSONValue::Object>(b.value);
        if (obj->size() != other.size()) return false;
        for (const auto& [key, val] : *obj) {
            auto it = other.find(key);
            if (it == other.end()) return false;
            JSONValue nullValue;
            if (!JSONEquals(val ? *val : nullValue, it->second ? *it->second : nullValue)) return false;
        }
        return true;
    }
    return a.value == b.value;
}

const JSONValue* FindMember(const JSONValue& object, const std::string& key) {
    const auto* obj = std::get_if<JSONValue::Object>(&object.value);
    if (!obj) {
        return nullptr;
    }
    auto it = obj->find(key);
    if (it == obj->end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<std::string> GetStringMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (v && std::holds_alternative<std::string>(v->value)) {
        return std::get<std::string>(v->value);
    }
    return std::nullopt;
}

std::optional<int64_t> GetIntMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (!v) {
        return std::nullopt;
    }
    if (std::holds_alternative<int64_t>(v->value)) {
        return std::get<int64_t>(v->value);
    }
    if (std::holds_alternative<double>(v->value)) {
        double d = std::get<double>(v->value);
        if (std::floor(d) == d) {
            return static_cast<int64_t>(d);
        }
    }
    return std::nullopt;
}

} // namespace toolwire
