//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Commands.h
// Purpose: Command-line front end (argument parsing, connection resolution, subcommands)
//==========================================================================================================
#pragma once

#include "cdev/Client.h"
#include "cdev/Entities.h"

#include <filesystem>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace cdev {
namespace cli {

// Process exit codes.
enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_OPERATION_FAILED = 1,
    EXIT_USAGE = 2,
    EXIT_CLIENT_ERROR = 3
};

// Raised for malformed command lines and unresolvable connection settings.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

//==========================================================================================================
// GlobalOptions
// Purpose: Parsed command line. Connection flags are std::nullopt when not given so that environment
//          defaults can apply (see ResolveConnection).
//==========================================================================================================
struct GlobalOptions {
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> ns;
    std::optional<std::string> instance;
    std::optional<std::string> host;
    std::optional<unsigned int> port;
    bool verbose{false};
    bool help{false};
    bool version{false};
    std::string command;
    std::vector<std::string> args;  // everything after the subcommand name, in order
};

//==========================================================================================================
// ParseGlobalOptions
// Purpose: Parses global flags and splits off the subcommand and its arguments.
// Args:
//   args: Command-line arguments without the program name.
// Throws:
//   UsageError on unknown or malformed global flags, or when -I is combined with -H/-W.
//==========================================================================================================
GlobalOptions ParseGlobalOptions(const std::vector<std::string>& args);

//==========================================================================================================
// ResolveConnection
// Purpose: Produces client options. Precedence: flag, then environment (CDEV_HOST, CDEV_PORT,
//          CDEV_USERNAME, CDEV_PASSWORD), then built-in defaults (localhost:57772, _SYSTEM/SYS).
//          -I NAME reads CDEV_INSTANCE_<NAME> ("host:port" or "host"). CDEV_SCHEME selects https.
// Throws:
//   UsageError when the instance is unknown or a port is not a number.
//==========================================================================================================
Client::Options ResolveConnection(const GlobalOptions& opts);

// Namespace from -N, then CDEV_NAMESPACE, then "USER".
std::string ResolveNamespace(const GlobalOptions& opts);

// Usage text for the whole program.
std::string UsageText();

////////////////////////////////////////// Listing helpers //////////////////////////////////////////
// System items are those whose name starts with '%'.
bool IsSystemName(const std::string& name);

// Extension of a file name after the last '.', or "" when there is none.
std::string FileType(const std::string& name);

// Names of class files (.cls), optionally without system classes.
std::vector<std::string> FilterClasses(const std::vector<File>& files, bool includeSystem);

//==========================================================================================================
// FilterRoutines
// Purpose: Names of routine files (mac, int, obj, inc, bas).
// Args:
//   types: When non-empty, only these extensions are listed.
//   includeSystem: When false, names starting with '%' are skipped.
//==========================================================================================================
std::vector<std::string> FilterRoutines(const std::vector<File>& files, const std::vector<std::string>& types,
                                        bool includeSystem);

//==========================================================================================================
// CommandContext
// Purpose: What a subcommand runs against.
// Fields:
//   client/ns: Connected client and the selected namespace
//   out/err: Command output and diagnostics
//   workDir: Directory that download writes into and relative paths resolve against
//   editor: Editor command for edit (from $EDITOR, default "vi")
//==========================================================================================================
struct CommandContext {
    Client& client;
    Namespace ns;
    std::ostream& out;
    std::ostream& err;
    std::filesystem::path workDir;
    std::string editor;
};

//==========================================================================================================
// RunCommand
// Purpose: Dispatches one subcommand (list, download, upload, export, import, edit).
// Returns:
//   EXIT_OK, or EXIT_OPERATION_FAILED when any server operation reported failure or a named file is
//   missing.
// Throws:
//   UsageError on bad subcommand arguments; errors::CdevError subclasses from the client.
//==========================================================================================================
int RunCommand(CommandContext& ctx, const std::string& command, const std::vector<std::string>& args);

//==========================================================================================================
// Run
// Purpose: Entry point of the executable: parse, configure logging, connect, select the namespace and
//          dispatch. Usage, client and filesystem errors are reported on err and mapped to an ExitCode.
//==========================================================================================================
int Run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace cli
} // namespace cdev
