//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Entities.h
// Purpose: Server resources and operation results of the Caché development REST API
//==========================================================================================================

#pragma once

#include "cdev/JSONValue.h"
#include <optional>
#include <string>
#include <vector>

namespace cdev {
//==========================================================================================================
// Resource graph
// Purpose: Entities decoded from server JSON. Every "id"/locator is an opaque path issued by the server
//          and must be echoed back unmodified. Optional members are std::nullopt when the server omitted
//          them (or sent null); an empty string means the server sent an empty value.
// Decoding:
//   FromJSON throws errors::DecodeError when the value is not an object, a required member is missing,
//   or a member has the wrong JSON type.
//==========================================================================================================

///////////////////////////////////////// Root ///////////////////////////////////////////
struct Root {
    std::string namespaces;

    static Root FromJSON(const JSONValue& v);
};

///////////////////////////////////////// Namespace ///////////////////////////////////////////
struct Namespace {
    std::string id;
    std::string name;       // upper case, e.g. "USER"
    std::string files;      // locator of the files collection
    std::string xml;        // locator of the XML import collection
    std::string queries;    // locator of the queries collection

    static Namespace FromJSON(const JSONValue& v);
};

///////////////////////////////////////// File ///////////////////////////////////////////
// Class, routine or generated artifact; the extension of "name" carries the type.
struct File {
    std::string id;
    std::string name;
    std::optional<std::string> content;         // present after an individual fetch or create
    std::optional<std::string> generatedfiles;  // present after compilation
    std::optional<std::string> url;
    std::optional<std::string> xml;             // locator of the XML export

    static File FromJSON(const JSONValue& v);

    // Encodes the members that are present, as sent by an update.
    JSONValue ToJSON() const;
};

///////////////////////////////////////// XmlDocument ///////////////////////////////////////////
struct XmlDocument {
    std::string id;
    std::optional<std::string> content;

    static XmlDocument FromJSON(const JSONValue& v);
};

///////////////////////////////////////// Query ///////////////////////////////////////////
struct Query {
    std::string id;
    std::optional<std::string> content;  // SQL text
    std::string plan;                    // locator of the query plan
    bool cached = false;

    static Query FromJSON(const JSONValue& v);
};

///////////////////////////////////////// Operation results ///////////////////////////////////////////
// Outcome of one mutating or executing call. success == false is an ordinary result, not an exception;
// "errors" is kept verbatim for the caller to inspect (see errors::FormatOperationErrors).
struct Operation {
    bool success = false;
    std::optional<JSONValue> errors;
};

struct FileOperation : Operation {
    std::optional<File> file;

    static FileOperation FromJSON(const JSONValue& v);
};

// XML import/update always resolves to exactly one File on the server.
struct XmlOperation : Operation {
    std::optional<XmlDocument> xml;
    std::optional<File> file;

    static XmlOperation FromJSON(const JSONValue& v);
};

struct QueryOperation : Operation {
    std::optional<JSONValue> resultset;  // verbatim; typically carries column names and rows
    std::optional<Query> query;
    std::optional<JSONValue> plan;       // set only by Client::GetQueryPlan

    static QueryOperation FromJSON(const JSONValue& v);
};

//==========================================================================================================
// DecodeList
// Purpose: Decodes a JSON array of entities with T::FromJSON.
// Throws:
//   errors::DecodeError when the value is not an array or an element fails to decode.
// Instantiated for Namespace and File in Entities.cpp.
//==========================================================================================================
template <typename T>
std::vector<T> DecodeList(const JSONValue& v, const char* entityName);

} // namespace cdev
