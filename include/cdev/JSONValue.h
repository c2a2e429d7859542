//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: JSON value tree used for request bodies and server responses
//==========================================================================================================

#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace cdev {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }

    //======================================================================================================
    // Find
    // Purpose: Looks up a member of an object value.
    // Returns:
    //   Pointer to the member, or nullptr when this is not an object or the key is absent.
    //======================================================================================================
    const JSONValue* Find(const std::string& key) const;
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON document. Trailing non-whitespace is rejected.
// Throws:
//   std::runtime_error describing the first syntax error.
//==========================================================================================================
JSONValue ParseJSON(const std::string& json);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact JSON text for a value. Object member order is unspecified.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//==========================================================================================================
// MakeObject
// Purpose: Builds an object value from string members, the common shape of request bodies.
//==========================================================================================================
JSONValue MakeObject(std::initializer_list<std::pair<const std::string, std::string>> members);

} // namespace cdev
