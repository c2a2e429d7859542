//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: Resource client for the Caché development REST API
//==========================================================================================================

#pragma once

#include "cdev/Entities.h"
#include "cdev/JSONValue.h"
#include "cdev/Transport.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cdev {

//==========================================================================================================
// Client
// Purpose: Maps the server's JSON resource graph onto typed entities. Every method performs exactly one
//          synchronous HTTP round trip (GetGeneratedFiles may perform none) and blocks until it completes.
// Errors:
//   Constructor: errors::ConnectionError when the server cannot be reached, errors::ProtocolError when
//                discovery returns anything but a valid root document.
//   Methods:     errors::TransportError on network failure or non-2xx status, errors::ProtocolError when a
//                2xx body does not decode. success == false on an operation is returned, never thrown.
// Thread safety:
//   No internal locking; one client per thread, or serialize calls.
//==========================================================================================================
class Client {
public:
    //==========================================================================================================
    // Options
    // Purpose: Connection parameters.
    // Fields:
    //   scheme: "http" (default) or "https"
    //   host/port: Web server address of the instance
    //   username/password: Basic credentials; sent only when both are non-empty
    //   rootPath: Discovery path
    //   connectTimeoutMs/readTimeoutMs: Per-request timeouts
    //   caFile/caPath: Trust store for https
    //==========================================================================================================
    struct Options {
        std::string scheme{"http"};
        std::string host{"localhost"};
        unsigned int port{57772};
        std::string username;
        std::string password;
        std::string rootPath{"/csp/sys/dev/"};
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{30000};
        std::string caFile;
        std::string caPath;
    };

    // Connects over HTTPTransport and performs discovery.
    explicit Client(const Options& opts);

    // Performs discovery over the given transport (which this client starts and owns).
    Client(const Options& opts, std::unique_ptr<ITransport> transport);

    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    //==========================================================================================================
    // "{scheme}://{host}:{port}"; every request URL is this prefix followed by a server locator.
    //==========================================================================================================
    std::string UrlPrefix() const;

    // Locator of the namespaces collection learned during discovery.
    const std::string& NamespacesLocator() const { return namespaces; }

    ////////////////////////////////////////// Namespaces //////////////////////////////////////////
    std::vector<Namespace> GetNamespaces();

    //==========================================================================================================
    // Finds a namespace by its human-readable name (case-insensitive).
    // Returns:
    //   The namespace, or std::nullopt when the server does not list it.
    //==========================================================================================================
    std::optional<Namespace> GetNamespace(const std::string& name);

    ////////////////////////////////////////// Files //////////////////////////////////////////
    // Listed files carry no content.
    std::vector<File> GetFiles(const Namespace& ns);

    // Fetches one file with its content.
    File GetFile(const File& file);

    //==========================================================================================================
    // Updates a file from its present members. Line endings of content are sent as CRLF.
    //==========================================================================================================
    FileOperation PutFile(const File& file);

    //==========================================================================================================
    // Creates (or overwrites) a file in a namespace.
    // Args:
    //   name: File name with a lowercase type extension (cls, mac, int, inc, bas). For classes the
    //         name must match the class defined in content.
    //   content: Source text. Line endings are sent as CRLF.
    // Throws:
    //   std::invalid_argument when name is not a valid file name (no request is sent).
    //==========================================================================================================
    FileOperation AddFile(const Namespace& ns, const std::string& name, const std::string& content);

    //==========================================================================================================
    // Compiles a file.
    // Args:
    //   spec: Compiler flags/qualifiers (e.g. "ck"); empty lets the server choose.
    //==========================================================================================================
    FileOperation CompileFile(const File& file, const std::string& spec = "");

    // Files generated by compilation; empty without a request when the file has no generatedfiles locator.
    std::vector<File> GetGeneratedFiles(const File& file);

    ////////////////////////////////////////// XML //////////////////////////////////////////
    // Fetches the XML export of a file. Throws std::invalid_argument when the file has no xml locator.
    XmlDocument GetXml(const File& file);

    // Re-imports an XML document. Throws std::invalid_argument when xml has no content.
    XmlOperation PutXml(const XmlDocument& xml);

    // Imports XML into a namespace; the result names the File it resolved to.
    XmlOperation AddXml(const Namespace& ns, const std::string& content);

    ////////////////////////////////////////// Queries //////////////////////////////////////////
    QueryOperation AddQuery(const Namespace& ns, const std::string& sql);

    // Executes (or re-executes) a query; the result carries the resultset.
    QueryOperation ExecuteQuery(const Query& query);

    //==========================================================================================================
    // Fetches the query plan.
    // Returns:
    //   QueryOperation with plan set to the decoded response body. success is true unless the body is an
    //   object carrying its own "success" member, in which case that member and "errors" are used.
    //==========================================================================================================
    QueryOperation GetQueryPlan(const Query& query);

private:
    void discover();
    JSONValue request(const std::string& locator, HttpMethod method = HttpMethod::Get,
                      const std::optional<JSONValue>& body = std::nullopt);

    Options opts;
    std::unique_ptr<ITransport> transport;
    std::string namespaces;
};

//==========================================================================================================
// NormalizeLineEndings
// Purpose: Converts LF and lone CR line endings to CRLF; existing CRLF pairs are kept.
//==========================================================================================================
std::string NormalizeLineEndings(const std::string& text);

//==========================================================================================================
// IsValidFileName
// Purpose: True for "<base>.<ext>" with a non-empty base and ext one of cls, mac, int, inc, bas.
//==========================================================================================================
bool IsValidFileName(const std::string& name);

} // namespace cdev
