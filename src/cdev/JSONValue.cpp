//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.cpp
// Purpose: Minimalistic JSON parser and serializer using only std library
//==========================================================================================================

#include <sstream>
#include <cctype>
#include <stdexcept>
#include <iomanip>
#include <type_traits>
#include "cdev/JSONValue.h"
#include "logging/Logger.h"


namespace cdev {

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

const JSONValue* JSONValue::Find(const std::string& key) const {
    if (!std::holds_alternative<Object>(value)) {
        return nullptr;
    }
    const auto& obj = std::get<Object>(value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

// -------------------------------
// Minimal recursive JSON parser
// -------------------------------
namespace {
struct JsonParser {
    const std::string& s;
    std::size_t i{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

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

    bool atEnd() {
        skipWs();
        return i >= s.size();
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) throw std::runtime_error("Invalid unicode escape");
        unsigned int code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else throw std::runtime_error("Invalid hex in unicode escape");
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
        if (i >= s.size() || s[i] != '"') throw std::runtime_error("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        bool closed = false;
        while (i < s.size()) {
            char c = s[i++];
            if (c == '"') { closed = true; break; }
            if (c == '\\') {
                if (i >= s.size()) throw std::runtime_error("Invalid escape");
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
                        if (code >= 0xD800 && code <= 0xDBFF && i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            std::size_t save = i;
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low >= 0xDC00 && low <= 0xDFFF) {
                                code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                            } else {
                                i = save;
                            }
                        }
                        if (code >= 0xD800 && code <= 0xDFFF) {
                            code = 0xFFFD;
                        }
                        appendUtf8(out, code);
                        break;
                    }
                    default: throw std::runtime_error("Unknown escape");
                }
            } else {
                out.push_back(c);
            }
        }
        if (!closed) throw std::runtime_error("Unterminated string");
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t digitsStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == digitsStart) {
            throw std::runtime_error("Unexpected character at offset " + std::to_string(start));
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                long long v = std::stoll(num);
                return JSONValue(static_cast<int64_t>(v));
            } catch (const std::out_of_range&) {
                // Integers beyond int64 degrade to double
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::exception& e) {
            throw std::runtime_error("Invalid number '" + num + "': " + e.what());
        }
    }

    JSONValue parseArray() {
        if (!match('[')) throw std::runtime_error("Expected '['");
        JSONValue::Array arr;
        skipWs();
        if (match(']')) return JSONValue(arr);
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            skipWs();
            if (match(']')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in array");
        }
        return JSONValue(arr);
    }

    JSONValue parseObject() {
        if (!match('{')) throw std::runtime_error("Expected '{'");
        JSONValue::Object obj;
        skipWs();
        if (match('}')) return JSONValue(obj);
        while (true) {
            std::string key = parseString();
            skipWs();
            if (!match(':')) throw std::runtime_error("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            skipWs();
            if (match('}')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in object");
        }
        return JSONValue(obj);
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) throw std::runtime_error("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't') { // true
            if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        }
        if (c == 'f') { // false
            if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        }
        if (c == 'n') { // null
            if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        }
        return parseNumber();
    }
};

void serializeString(std::ostringstream& oss, const std::string& v) {
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
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
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
            oss << std::setprecision(17) << v;
        } else if constexpr (std::is_same_v<T, std::string>) {
            serializeString(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ',';
                if (v[i]) { serializeInto(oss, *v[i]); } else { oss << "null"; }
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                serializeString(oss, key);
                oss << ':';
                if (val) { serializeInto(oss, *val); } else { oss << "null"; }
            }
            oss << '}';
        }
    }, value.get());
}
} // namespace

JSONValue ParseJSON(const std::string& json) {
    FUNC_SCOPE();
    JsonParser p(json);
    JSONValue v = p.parseValue();
    if (!p.atEnd()) {
        throw std::runtime_error("Trailing characters after JSON value at offset " + std::to_string(p.i));
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    FUNC_SCOPE();
    std::ostringstream oss;
    serializeInto(oss, value);
    return oss.str();
}

JSONValue MakeObject(std::initializer_list<std::pair<const std::string, std::string>> members) {
    JSONValue::Object obj;
    for (const auto& m : members) {
        obj[m.first] = std::make_shared<JSONValue>(m.second);
    }
    return JSONValue(std::move(obj));
}

} // namespace cdev
