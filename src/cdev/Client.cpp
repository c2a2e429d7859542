//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: Resource client implementation (discovery, request/response transport, decoding)
//==========================================================================================================

#include "cdev/Client.h"
#include "cdev/HTTPTransport.hpp"
#include "cdev/auth/BasicAuth.hpp"
#include "cdev/errors/Errors.h"
#include "cdev/version.h"
#include "logging/Logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace cdev {

namespace {

std::unique_ptr<ITransport> makeHttpTransport(const Client::Options& opts) {
    HTTPTransport::Options t;
    t.connectTimeoutMs = opts.connectTimeoutMs;
    t.readTimeoutMs = opts.readTimeoutMs;
    t.caFile = opts.caFile;
    t.caPath = opts.caPath;
    t.userAgent = std::string("cdev/") + getVersionString();
    return std::make_unique<HTTPTransport>(t);
}

// Converts entity decode failures into the protocol error callers handle.
template <typename Fn>
auto decodeOrThrow(const char* what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const errors::DecodeError& e) {
        LOG_WARN("Unexpected {} shape: {}", what, e.description());
        throw errors::ProtocolError(e.description());
    }
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::toupper(static_cast<unsigned char>(x)) == std::toupper(static_cast<unsigned char>(y));
        });
}

} // namespace

std::string NormalizeLineEndings(const std::string& text) {
    std::string out;
    out.reserve(text.size() + text.size() / 16);
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\r') {
            out += "\r\n";
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else if (c == '\n') {
            out += "\r\n";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

bool IsValidFileName(const std::string& name) {
    static const std::array<const char*, 5> kTypes = {"cls", "mac", "int", "inc", "bas"};
    const std::size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= name.size()) {
        return false;
    }
    if (name.find_first_of("/\\ \t\r\n") != std::string::npos) {
        return false;
    }
    const std::string ext = name.substr(dot + 1);
    return std::find(kTypes.begin(), kTypes.end(), ext) != kTypes.end();
}

Client::Client(const Options& opts)
    : Client(opts, makeHttpTransport(opts)) {}

Client::Client(const Options& options, std::unique_ptr<ITransport> t)
    : opts(options), transport(std::move(t)) {
    FUNC_SCOPE();
    if (!transport) {
        throw std::invalid_argument("Client requires a transport");
    }
    transport->SetErrorHandler([](const std::string& msg) { LOG_DEBUG("transport: {}", msg); });
    if (!opts.username.empty() && !opts.password.empty()) {
        transport->SetAuth(std::make_shared<auth::BasicAuth>(opts.username, opts.password));
    }
    transport->Start().get();
    discover();
}

Client::~Client() {
    if (transport && transport->IsRunning()) {
        transport->Close().get();
    }
}

std::string Client::UrlPrefix() const {
    return opts.scheme + "://" + opts.host + ":" + std::to_string(opts.port);
}

void Client::discover() {
    HttpRequest req;
    req.method = HttpMethod::Get;
    req.url = UrlPrefix() + opts.rootPath;
    LOG_DEBUG("Discovery: GET {}", req.url);

    HttpResponse res;
    try {
        res = transport->SendRequest(std::move(req)).get();
    } catch (const errors::TransportError& e) {
        LOG_ERROR("Cannot reach {}: {}", UrlPrefix(), e.description());
        throw errors::ConnectionError(e.description());
    }

    if (!res.IsSuccess()) {
        throw errors::ProtocolError("HTTP " + std::to_string(res.status) +
                                    (res.reason.empty() ? std::string() : " " + res.reason));
    }
    Root root;
    try {
        root = Root::FromJSON(ParseJSON(res.body));
    } catch (const std::exception& e) {
        throw errors::ProtocolError(e.what());
    }
    namespaces = root.namespaces;
    LOG_DEBUG("Discovery: namespaces at {}", namespaces);
}

JSONValue Client::request(const std::string& locator, HttpMethod method, const std::optional<JSONValue>& body) {
    HttpRequest req;
    req.method = method;
    req.url = UrlPrefix() + locator;
    if (body.has_value()) {
        req.body = SerializeJSON(*body);
    }
    LOG_DEBUG("{} {}", methodName(method), req.url);

    HttpResponse res = transport->SendRequest(std::move(req)).get();
    if (!res.IsSuccess()) {
        LOG_WARN("{} {} returned HTTP {}", methodName(method), locator, res.status);
        throw errors::TransportError(res.status, res.reason, res.body);
    }
    try {
        return ParseJSON(res.body);
    } catch (const std::exception& e) {
        LOG_WARN("{} {} returned a non-JSON body: {}", methodName(method), locator, e.what());
        throw errors::ProtocolError(e.what());
    }
}

std::vector<Namespace> Client::GetNamespaces() {
    FUNC_SCOPE();
    JSONValue v = request(namespaces);
    return decodeOrThrow("namespace list", [&] { return DecodeList<Namespace>(v, "Namespace"); });
}

std::optional<Namespace> Client::GetNamespace(const std::string& name) {
    FUNC_SCOPE();
    for (auto& ns : GetNamespaces()) {
        if (iequals(ns.name, name)) {
            return ns;
        }
    }
    return std::nullopt;
}

std::vector<File> Client::GetFiles(const Namespace& ns) {
    FUNC_SCOPE();
    JSONValue v = request(ns.files);
    return decodeOrThrow("file list", [&] { return DecodeList<File>(v, "File"); });
}

File Client::GetFile(const File& file) {
    FUNC_SCOPE();
    JSONValue v = request(file.id);
    return decodeOrThrow("file", [&] { return File::FromJSON(v); });
}

FileOperation Client::PutFile(const File& file) {
    FUNC_SCOPE();
    File outgoing = file;
    if (outgoing.content) {
        outgoing.content = NormalizeLineEndings(*outgoing.content);
    }
    JSONValue v = request(file.id, HttpMethod::Put, outgoing.ToJSON());
    return decodeOrThrow("file operation", [&] { return FileOperation::FromJSON(v); });
}

FileOperation Client::AddFile(const Namespace& ns, const std::string& name, const std::string& content) {
    FUNC_SCOPE();
    if (!IsValidFileName(name)) {
        throw std::invalid_argument("Invalid file name '" + name + "': expected <name>.<cls|mac|int|inc|bas>");
    }
    JSONValue body = MakeObject({{"name", name}, {"content", NormalizeLineEndings(content)}});
    JSONValue v = request(ns.files, HttpMethod::Put, body);
    return decodeOrThrow("file operation", [&] { return FileOperation::FromJSON(v); });
}

FileOperation Client::CompileFile(const File& file, const std::string& spec) {
    FUNC_SCOPE();
    JSONValue body = MakeObject({{"action", "compile"}, {"spec", spec}});
    JSONValue v = request(file.id, HttpMethod::Post, body);
    return decodeOrThrow("compile operation", [&] { return FileOperation::FromJSON(v); });
}

std::vector<File> Client::GetGeneratedFiles(const File& file) {
    FUNC_SCOPE();
    if (!file.generatedfiles) {
        return {};
    }
    JSONValue v = request(*file.generatedfiles);
    return decodeOrThrow("generated file list", [&] { return DecodeList<File>(v, "File"); });
}

XmlDocument Client::GetXml(const File& file) {
    FUNC_SCOPE();
    if (!file.xml) {
        throw std::invalid_argument("File '" + file.name + "' has no XML locator");
    }
    JSONValue v = request(*file.xml);
    return decodeOrThrow("xml", [&] { return XmlDocument::FromJSON(v); });
}

XmlOperation Client::PutXml(const XmlDocument& xml) {
    FUNC_SCOPE();
    if (!xml.content) {
        throw std::invalid_argument("XML document '" + xml.id + "' has no content");
    }
    JSONValue v = request(xml.id, HttpMethod::Put, MakeObject({{"content", *xml.content}}));
    return decodeOrThrow("xml operation", [&] { return XmlOperation::FromJSON(v); });
}

XmlOperation Client::AddXml(const Namespace& ns, const std::string& content) {
    FUNC_SCOPE();
    JSONValue v = request(ns.xml, HttpMethod::Put, MakeObject({{"content", content}}));
    return decodeOrThrow("xml operation", [&] { return XmlOperation::FromJSON(v); });
}

QueryOperation Client::AddQuery(const Namespace& ns, const std::string& sql) {
    FUNC_SCOPE();
    JSONValue v = request(ns.queries, HttpMethod::Put, MakeObject({{"content", sql}}));
    return decodeOrThrow("query operation", [&] { return QueryOperation::FromJSON(v); });
}

QueryOperation Client::ExecuteQuery(const Query& query) {
    FUNC_SCOPE();
    JSONValue v = request(query.id, HttpMethod::Post, MakeObject({{"action", "execute"}}));
    return decodeOrThrow("query operation", [&] { return QueryOperation::FromJSON(v); });
}

QueryOperation Client::GetQueryPlan(const Query& query) {
    FUNC_SCOPE();
    JSONValue v = request(query.plan);
    QueryOperation op;
    if (v.Find("success") != nullptr) {
        op = decodeOrThrow("query plan", [&] { return QueryOperation::FromJSON(v); });
    } else {
        op.success = true;
    }
    op.plan = std::move(v);
    return op;
}

} // namespace cdev
