//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Entities.cpp
// Purpose: JSON decoding and encoding of resource graph entities
//==========================================================================================================

#include "cdev/Entities.h"
#include "cdev/errors/Errors.h"
#include "logging/Logger.h"

namespace cdev {

namespace {

const JSONValue::Object& requireObject(const JSONValue& v, const char* entity) {
    if (!std::holds_alternative<JSONValue::Object>(v.value)) {
        throw errors::DecodeError(entity, "<value>", "expected a JSON object");
    }
    return std::get<JSONValue::Object>(v.value);
}

// Present-and-non-null member, or nullptr.
const JSONValue* member(const JSONValue::Object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->second || it->second->IsNull()) {
        return nullptr;
    }
    return it->second.get();
}

std::string requireString(const JSONValue::Object& obj, const char* entity, const char* key) {
    const JSONValue* m = member(obj, key);
    if (m == nullptr) {
        throw errors::DecodeError(entity, key, "required member missing");
    }
    if (!std::holds_alternative<std::string>(m->value)) {
        throw errors::DecodeError(entity, key, "expected a string");
    }
    return std::get<std::string>(m->value);
}

std::optional<std::string> optionalString(const JSONValue::Object& obj, const char* entity, const char* key) {
    const JSONValue* m = member(obj, key);
    if (m == nullptr) {
        return std::nullopt;
    }
    if (!std::holds_alternative<std::string>(m->value)) {
        throw errors::DecodeError(entity, key, "expected a string");
    }
    return std::get<std::string>(m->value);
}

// Booleans arrive either as JSON true/false or as 1/0.
bool requireFlag(const JSONValue::Object& obj, const char* entity, const char* key) {
    const JSONValue* m = member(obj, key);
    if (m == nullptr) {
        throw errors::DecodeError(entity, key, "required member missing");
    }
    if (std::holds_alternative<bool>(m->value)) {
        return std::get<bool>(m->value);
    }
    if (std::holds_alternative<int64_t>(m->value)) {
        return std::get<int64_t>(m->value) != 0;
    }
    throw errors::DecodeError(entity, key, "expected a boolean");
}

std::optional<JSONValue> optionalAny(const JSONValue::Object& obj, const char* key) {
    const JSONValue* m = member(obj, key);
    if (m == nullptr) {
        return std::nullopt;
    }
    return *m;
}

void decodeOperationStatus(const JSONValue::Object& obj, const char* entity, Operation& out) {
    out.success = requireFlag(obj, entity, "success");
    out.errors = optionalAny(obj, "errors");
}

} // namespace

Root Root::FromJSON(const JSONValue& v) {
    const auto& obj = requireObject(v, "Root");
    Root r;
    r.namespaces = requireString(obj, "Root", "namespaces");
    return r;
}

Namespace Namespace::FromJSON(const JSONValue& v) {
    const auto& obj = requireObject(v, "Namespace");
    Namespace ns;
    ns.id = requireString(obj, "Namespace", "id");
    ns.name = requireString(obj, "Namespace", "name");
    ns.files = requireString(obj, "Namespace", "files");
    ns.xml = requireString(obj, "Namespace", "xml");
    ns.queries = requireString(obj, "Namespace", "queries");
    return ns;
}

File File::FromJSON(const JSONValue& v) {
    const auto& obj = requireObject(v, "File");
    File f;
    f.id = requireString(obj, "File", "id");
    f.name = requireString(obj, "File", "name");
    f.content = optionalString(obj, "File", "content");
    f.generatedfiles = optionalString(obj, "File", "generatedfiles");
    f.url = optionalString(obj, "File", "url");
    f.xml = optionalString(obj, "File", "xml");
    return f;
}

JSONValue File::ToJSON() const {
    JSONValue::Object obj;
    obj["id"] = std::make_shared<JSONValue>(id);
    obj["name"] = std::make_shared<JSONValue>(name);
    if (content) {
        obj["content"] = std::make_shared<JSONValue>(*content);
    }
    if (generatedfiles) {
        obj["generatedfiles"] = std::make_shared<JSONValue>(*generatedfiles);
    }
    if (url) {
        obj["url"] = std::make_shared<JSONValue>(*url);
    }
    if (xml) {
        obj["xml"] = std::make_shared<JSONValue>(*xml);
    }
    return JSONValue(std::move(obj));
}

XmlDocument XmlDocument::FromJSON(const JSONValue& v) {
    const auto& obj = requireObject(v, "XmlDocument");
    XmlDocument x;
    x.id = requireString(obj, "XmlDocument", "id");
    x.content = optionalString(obj, "XmlDocument", "content");
    return x;
}

Query Query::FromJSON(const JSONValue& v) {
    const auto& obj = requireObject(v, "Query");
    Query q;
    q.id = requireString(obj, "Query", "id");
    q.content = optionalString(obj, "Query", "content");
    q.plan = requireString(obj, "Query", "plan");
    q.cached = requireFlag(obj, "Query", "cached");
    return q;
}

FileOperation FileOperation::FromJSON(const JSONValue& v) {
    const auto& obj = requireObject(v, "FileOperation");
    FileOperation op;
    decodeOperationStatus(obj, "FileOperation", op);
    if (const JSONValue* f = member(obj, "file")) {
        op.file = File::FromJSON(*f);
    }
    return op;
}

XmlOperation XmlOperation::FromJSON(const JSONValue& v) {
    const auto& obj = requireObject(v, "XmlOperation");
    XmlOperation op;
    decodeOperationStatus(obj, "XmlOperation", op);
    if (const JSONValue* x = member(obj, "xml")) {
        op.xml = XmlDocument::FromJSON(*x);
    }
    if (const JSONValue* f = member(obj, "file")) {
        op.file = File::FromJSON(*f);
    }
    return op;
}

QueryOperation QueryOperation::FromJSON(const JSONValue& v) {
    const auto& obj = requireObject(v, "QueryOperation");
    QueryOperation op;
    decodeOperationStatus(obj, "QueryOperation", op);
    op.resultset = optionalAny(obj, "resultset");
    if (const JSONValue* q = member(obj, "query")) {
        op.query = Query::FromJSON(*q);
    }
    return op;
}

template <typename T>
std::vector<T> DecodeList(const JSONValue& v, const char* entityName) {
    if (!std::holds_alternative<JSONValue::Array>(v.value)) {
        throw errors::DecodeError(entityName, "<list>", "expected a JSON array");
    }
    const auto& arr = std::get<JSONValue::Array>(v.value);
    std::vector<T> out;
    out.reserve(arr.size());
    for (const auto& item : arr) {
        if (!item) {
            continue;
        }
        out.push_back(T::FromJSON(*item));
    }
    LOG_DEBUG("Decoded {} {} item(s)", out.size(), entityName);
    return out;
}

template std::vector<Namespace> DecodeList<Namespace>(const JSONValue&, const char*);
template std::vector<File> DecodeList<File>(const JSONValue&, const char*);

} // namespace cdev
