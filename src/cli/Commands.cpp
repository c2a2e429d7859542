//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Commands.cpp
// Purpose: Command-line front end (argument parsing, connection resolution, subcommands)
//==========================================================================================================

#include "cdev/cli/Commands.h"
#include "cdev/errors/Errors.h"
#include "cdev/version.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <map>
#include <random>
#include <sstream>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace cdev {
namespace cli {

namespace {

const std::array<const char*, 5> kRoutineTypes = {"mac", "int", "obj", "inc", "bas"};

constexpr int kStyle = po::command_line_style::default_style & ~po::command_line_style::allow_guessing;

unsigned int parsePort(const std::string& text, const std::string& origin) {
    try {
        std::size_t pos = 0;
        const unsigned long v = std::stoul(text, &pos);
        if (pos != text.size() || v == 0 || v > 65535) {
            throw std::out_of_range(text);
        }
        return static_cast<unsigned int>(v);
    } catch (const std::logic_error&) {
        throw UsageError("Invalid port '" + text + "' in " + origin);
    }
}

std::string upper(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

// Parses subcommand arguments; positional values land in "names".
po::variables_map parseSubcommand(const std::string& command, const std::vector<std::string>& args,
                                  po::options_description& desc) {
    desc.add_options()("names", po::value<std::vector<std::string>>()->composing(), "Names");
    po::positional_options_description pos;
    pos.add("names", -1);
    po::variables_map vm;
    try {
        po::store(po::command_line_parser(args).options(desc).positional(pos).style(kStyle).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw UsageError(command + ": " + e.what());
    }
    return vm;
}

std::vector<std::string> namesOf(const po::variables_map& vm) {
    if (!vm.count("names")) {
        return {};
    }
    return vm["names"].as<std::vector<std::string>>();
}

std::vector<std::string> requireNames(const std::string& command, const po::variables_map& vm) {
    auto names = namesOf(vm);
    if (names.empty()) {
        throw UsageError(command + ": at least one argument is required");
    }
    return names;
}

std::filesystem::path resolvePath(const CommandContext& ctx, const std::string& p) {
    std::filesystem::path path(p);
    return path.is_absolute() ? path : ctx.workDir / path;
}

bool readFile(const std::filesystem::path& path, std::string& content) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    content = oss.str();
    return true;
}

bool writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out << content;
    return static_cast<bool>(out);
}

void reportFailure(CommandContext& ctx, const std::string& what, const Operation& op) {
    ctx.err << what << " failed";
    if (op.errors) {
        ctx.err << ":\n" << errors::FormatOperationErrors(*op.errors);
    }
    ctx.err << "\n";
}

// Looks up files of the namespace by name; missing names are reported and counted.
std::vector<File> findFiles(CommandContext& ctx, const std::vector<std::string>& names, int& rc) {
    const auto listed = ctx.client.GetFiles(ctx.ns);
    std::vector<File> found;
    for (const auto& name : names) {
        auto it = std::find_if(listed.begin(), listed.end(), [&](const File& f) { return f.name == name; });
        if (it == listed.end()) {
            ctx.err << "File not found in " << ctx.ns.name << ": " << name << "\n";
            rc = EXIT_OPERATION_FAILED;
            continue;
        }
        found.push_back(*it);
    }
    return found;
}

// Compiles a file the server just stored and reports the outcome.
bool compileAndReport(CommandContext& ctx, const File& file) {
    FileOperation compiled = ctx.client.CompileFile(file);
    if (!compiled.success) {
        reportFailure(ctx, "Compile of " + file.name, compiled);
        return false;
    }
    ctx.out << "Compiled " << file.name << "\n";
    return true;
}

std::string shellQuote(const std::string& s) {
    std::string q = "'";
    for (char c : s) {
        if (c == '\'') {
            q += "'\\''";
        } else {
            q.push_back(c);
        }
    }
    q += "'";
    return q;
}

////////////////////////////////////////// Subcommands //////////////////////////////////////////

int cmdList(CommandContext& ctx, const std::vector<std::string>& args) {
    if (args.empty()) {
        throw UsageError("list: expected one of: namespaces, classes, routines");
    }
    const std::string what = args.front();
    const std::vector<std::string> rest(args.begin() + 1, args.end());

    po::options_description desc("list options");
    bool noSystem = false;
    std::vector<std::string> types;
    desc.add_options()
        ("noSystem,s", po::bool_switch(&noSystem), "Hide system items (names starting with %)")
        ("type,t", po::value<std::vector<std::string>>(&types)->composing(), "mac|int|obj|inc|bas");
    auto vm = parseSubcommand("list " + what, rest, desc);
    if (!namesOf(vm).empty()) {
        throw UsageError("list " + what + ": unexpected argument '" + namesOf(vm).front() + "'");
    }

    if (what == "namespaces") {
        for (const auto& ns : ctx.client.GetNamespaces()) {
            ctx.out << ns.name << "\n";
        }
        return EXIT_OK;
    }
    if (what == "classes") {
        if (!types.empty()) {
            throw UsageError("list classes: -t applies to routines only");
        }
        for (const auto& name : FilterClasses(ctx.client.GetFiles(ctx.ns), !noSystem)) {
            ctx.out << name << "\n";
        }
        return EXIT_OK;
    }
    if (what == "routines") {
        for (const auto& t : types) {
            if (std::find(kRoutineTypes.begin(), kRoutineTypes.end(), t) == kRoutineTypes.end()) {
                throw UsageError("list routines: invalid type '" + t + "' (expected mac|int|obj|inc|bas)");
            }
        }
        for (const auto& name : FilterRoutines(ctx.client.GetFiles(ctx.ns), types, !noSystem)) {
            ctx.out << name << "\n";
        }
        return EXIT_OK;
    }
    throw UsageError("list: unknown item '" + what + "'");
}

int cmdDownload(CommandContext& ctx, const std::vector<std::string>& args) {
    po::options_description desc("download options");
    const auto names = requireNames("download", parseSubcommand("download", args, desc));
    int rc = EXIT_OK;
    for (const auto& listed : findFiles(ctx, names, rc)) {
        File file = ctx.client.GetFile(listed);
        const auto target = ctx.workDir / std::filesystem::path(file.name).filename();
        if (!writeFile(target, file.content.value_or(""))) {
            ctx.err << "Cannot write " << target.string() << "\n";
            rc = EXIT_OPERATION_FAILED;
            continue;
        }
        ctx.out << "Downloaded " << file.name << "\n";
    }
    return rc;
}

int cmdUpload(CommandContext& ctx, const std::vector<std::string>& args) {
    po::options_description desc("upload options");
    const auto paths = requireNames("upload", parseSubcommand("upload", args, desc));
    int rc = EXIT_OK;
    for (const auto& p : paths) {
        const auto path = resolvePath(ctx, p);
        std::string content;
        if (!readFile(path, content)) {
            ctx.err << "Cannot read " << p << "\n";
            rc = EXIT_OPERATION_FAILED;
            continue;
        }
        const std::string name = path.filename().string();
        FileOperation added;
        try {
            added = ctx.client.AddFile(ctx.ns, name, content);
        } catch (const std::invalid_argument& e) {
            ctx.err << e.what() << "\n";
            rc = EXIT_OPERATION_FAILED;
            continue;
        }
        if (!added.success) {
            reportFailure(ctx, "Upload of " + name, added);
            rc = EXIT_OPERATION_FAILED;
            continue;
        }
        ctx.out << "Uploaded " << name << "\n";

        std::optional<File> stored = added.file;
        if (!stored) {
            int missing = EXIT_OK;
            auto found = findFiles(ctx, {name}, missing);
            if (!found.empty()) {
                stored = found.front();
            }
        }
        if (!stored || !compileAndReport(ctx, *stored)) {
            rc = EXIT_OPERATION_FAILED;
        }
    }
    return rc;
}

int cmdExport(CommandContext& ctx, const std::vector<std::string>& args) {
    po::options_description desc("export options");
    std::string output;
    desc.add_options()("output,o", po::value<std::string>(&output), "File to write to (default: standard output)");
    const auto names = requireNames("export", parseSubcommand("export", args, desc));

    std::ofstream file;
    if (!output.empty()) {
        file.open(resolvePath(ctx, output), std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file) {
            ctx.err << "Cannot write " << output << "\n";
            return EXIT_OPERATION_FAILED;
        }
    }
    std::ostream& sink = output.empty() ? ctx.out : file;

    int rc = EXIT_OK;
    for (const auto& listed : findFiles(ctx, names, rc)) {
        if (!listed.xml) {
            ctx.err << listed.name << " has no XML export\n";
            rc = EXIT_OPERATION_FAILED;
            continue;
        }
        XmlDocument xml = ctx.client.GetXml(listed);
        sink << xml.content.value_or("");
    }
    return rc;
}

int cmdImport(CommandContext& ctx, const std::vector<std::string>& args) {
    po::options_description desc("import options");
    const auto paths = requireNames("import", parseSubcommand("import", args, desc));
    int rc = EXIT_OK;
    for (const auto& p : paths) {
        std::string content;
        if (!readFile(resolvePath(ctx, p), content)) {
            ctx.err << "Cannot read " << p << "\n";
            rc = EXIT_OPERATION_FAILED;
            continue;
        }
        XmlOperation op = ctx.client.AddXml(ctx.ns, content);
        if (!op.success) {
            reportFailure(ctx, "Import of " + p, op);
            rc = EXIT_OPERATION_FAILED;
            continue;
        }
        ctx.out << "Imported " << (op.file ? op.file->name : p) << "\n";
    }
    return rc;
}

// Scratch directory for edit under the system temp directory. Removed on scope exit unless Keep() was called.
class EditDirectory {
public:
    EditDirectory() {
        std::random_device rd;
        std::ostringstream name;
        name << "cdev-edit-" << std::hex << rd() << rd();
        path = std::filesystem::temp_directory_path() / name.str();
        std::filesystem::create_directories(path);
    }

    ~EditDirectory() {
        if (keep) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        if (ec) {
            LOG_WARN("edit: could not remove {}: {}", path.string(), ec.message());
        }
    }

    EditDirectory(const EditDirectory&) = delete;
    EditDirectory& operator=(const EditDirectory&) = delete;

    const std::filesystem::path& Path() const { return path; }
    void Keep() { keep = true; }

private:
    std::filesystem::path path;
    bool keep{false};
};

int cmdEdit(CommandContext& ctx, const std::vector<std::string>& args) {
    po::options_description desc("edit options");
    const auto names = requireNames("edit", parseSubcommand("edit", args, desc));
    int rc = EXIT_OK;
    const auto listed = findFiles(ctx, names, rc);
    if (listed.empty()) {
        return rc;
    }

    EditDirectory workspace;
    const auto& dir = workspace.Path();

    struct Working {
        File file;
        std::filesystem::path path;
        std::string original;
    };
    std::vector<Working> working;
    std::string command = ctx.editor;
    for (const auto& l : listed) {
        File file = ctx.client.GetFile(l);
        Working w{file, dir / std::filesystem::path(file.name).filename(), file.content.value_or("")};
        if (!writeFile(w.path, w.original)) {
            ctx.err << "Cannot write " << w.path.string() << "\n";
            rc = EXIT_OPERATION_FAILED;
            continue;
        }
        command += " " + shellQuote(w.path.string());
        working.push_back(std::move(w));
    }

    if (!working.empty()) {
        LOG_DEBUG("edit: running {}", command);
        const int status = std::system(command.c_str());
        if (status != 0) {
            ctx.err << "Editor '" << ctx.editor << "' exited with status " << status << "; nothing uploaded\n";
            rc = EXIT_OPERATION_FAILED;
            working.clear();
        }
    }

    bool uploadFailed = false;
    try {
        for (auto& w : working) {
            std::string edited;
            if (!readFile(w.path, edited)) {
                ctx.err << "Cannot read " << w.path.string() << "\n";
                rc = EXIT_OPERATION_FAILED;
                continue;
            }
            if (edited == w.original) {
                ctx.out << "Unchanged " << w.file.name << "\n";
                continue;
            }
            w.file.content = edited;
            FileOperation put = ctx.client.PutFile(w.file);
            if (!put.success) {
                reportFailure(ctx, "Upload of " + w.file.name, put);
                rc = EXIT_OPERATION_FAILED;
                uploadFailed = true;
                continue;
            }
            ctx.out << "Uploaded " << w.file.name << "\n";
            if (!compileAndReport(ctx, put.file.value_or(w.file))) {
                rc = EXIT_OPERATION_FAILED;
            }
        }
    } catch (const errors::CdevError&) {
        workspace.Keep();
        ctx.err << "Edited files kept in " << dir.string() << "\n";
        throw;
    }
    if (uploadFailed) {
        workspace.Keep();
        ctx.err << "Edited files kept in " << dir.string() << "\n";
    }
    return rc;
}

// Global options that take a value.
struct ValueOption {
    const char* spec;  // "long,s"
    const char* help;
};

const std::array<ValueOption, 6> kValueOptions = {{
    {"username,U", "User name (default _SYSTEM)"},
    {"password,P", "Password (default SYS)"},
    {"namespace,N", "Namespace (default USER)"},
    {"instance,I", "Named instance (CDEV_INSTANCE_<NAME>=host:port)"},
    {"host,H", "Host (default localhost)"},
    {"web-server-port,W", "Web server port (default 57772)"},
}};

// True for "-U" or "--username" style tokens whose value is the next argument.
bool valueInNextToken(const std::string& token) {
    for (const auto& o : kValueOptions) {
        const std::string spec = o.spec;
        const std::size_t comma = spec.find(',');
        if (token == "--" + spec.substr(0, comma) || token == "-" + spec.substr(comma + 1)) {
            return true;
        }
    }
    return false;
}

// Index of the subcommand name: the first argument that is neither a global option nor its value.
std::size_t findCommand(const std::vector<std::string>& args) {
    std::size_t i = 0;
    while (i < args.size() && args[i].size() > 1 && args[i][0] == '-') {
        i += valueInNextToken(args[i]) ? 2 : 1;
    }
    return std::min(i, args.size());
}

using CommandFn = int (*)(CommandContext&, const std::vector<std::string>&);

const std::map<std::string, CommandFn>& commandTable() {
    static const std::map<std::string, CommandFn> table = {
        {"list", &cmdList},
        {"download", &cmdDownload},
        {"upload", &cmdUpload},
        {"export", &cmdExport},
        {"import", &cmdImport},
        {"edit", &cmdEdit},
    };
    return table;
}

} // namespace

GlobalOptions ParseGlobalOptions(const std::vector<std::string>& args) {
    GlobalOptions opts;
    po::options_description global("Global options");
    global.add_options()
        ("help,h", "Show this help")
        ("version", "Show the version")
        ("verbose,V", "Output details (debug logging)");
    for (const auto& o : kValueOptions) {
        global.add_options()(o.spec, po::value<std::string>(), o.help);
    }

    // Everything from the subcommand name on is handed to the subcommand unparsed.
    const std::size_t commandAt = findCommand(args);
    const std::vector<std::string> head(args.begin(), args.begin() + static_cast<std::ptrdiff_t>(commandAt));
    po::variables_map vm;
    try {
        po::store(po::command_line_parser(head).options(global).style(kStyle).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw UsageError(e.what());
    }
    if (commandAt < args.size()) {
        opts.command = args[commandAt];
        if (commandTable().count(opts.command) == 0) {
            throw UsageError("unknown command '" + opts.command + "'");
        }
        opts.args.assign(args.begin() + static_cast<std::ptrdiff_t>(commandAt) + 1, args.end());
    }

    opts.help = vm.count("help") != 0;
    opts.version = vm.count("version") != 0;
    opts.verbose = vm.count("verbose") != 0;
    if (vm.count("username")) opts.username = vm["username"].as<std::string>();
    if (vm.count("password")) opts.password = vm["password"].as<std::string>();
    if (vm.count("namespace")) opts.ns = vm["namespace"].as<std::string>();
    if (vm.count("instance")) opts.instance = vm["instance"].as<std::string>();
    if (vm.count("host")) opts.host = vm["host"].as<std::string>();
    if (vm.count("web-server-port")) {
        opts.port = parsePort(vm["web-server-port"].as<std::string>(), "--web-server-port");
    }
    if (opts.instance && (opts.host || opts.port)) {
        throw UsageError("-I/--instance cannot be combined with -H/--host or -W/--web-server-port");
    }
    return opts;
}

Client::Options ResolveConnection(const GlobalOptions& opts) {
    Client::Options c;
    c.username = opts.username.value_or(GetEnvOrDefault("CDEV_USERNAME", "_SYSTEM"));
    c.password = opts.password.value_or(GetEnvOrDefault("CDEV_PASSWORD", "SYS"));
    c.scheme = GetEnvOrDefault("CDEV_SCHEME", c.scheme);
    if (c.scheme != "http" && c.scheme != "https") {
        throw UsageError("CDEV_SCHEME must be http or https, not '" + c.scheme + "'");
    }

    if (opts.instance) {
        const std::string var = "CDEV_INSTANCE_" + upper(*opts.instance);
        auto location = GetEnvOptional(var);
        if (!location) {
            throw UsageError("unknown instance '" + *opts.instance + "' (set " + var + "=host:port)");
        }
        const auto colon = location->rfind(':');
        if (colon == std::string::npos) {
            c.host = *location;
        } else {
            c.host = location->substr(0, colon);
            c.port = parsePort(location->substr(colon + 1), var);
        }
        if (c.host.empty()) {
            throw UsageError(var + " has no host");
        }
        return c;
    }

    c.host = opts.host.value_or(GetEnvOrDefault("CDEV_HOST", c.host));
    if (opts.port) {
        c.port = *opts.port;
    } else if (auto envPort = GetEnvOptional("CDEV_PORT")) {
        c.port = parsePort(*envPort, "CDEV_PORT");
    }
    return c;
}

std::string ResolveNamespace(const GlobalOptions& opts) {
    return opts.ns.value_or(GetEnvOrDefault("CDEV_NAMESPACE", "USER"));
}

std::string UsageText() {
    std::ostringstream oss;
    oss << "Usage: cdev [global options] <command> [command options] [args...]\n"
        << "\n"
        << "Global options:\n"
        << "  -h, --help                 Show this help\n"
        << "      --version              Show the version\n"
        << "  -V, --verbose              Output details\n"
        << "  -U, --username USER        User name (default _SYSTEM, env CDEV_USERNAME)\n"
        << "  -P, --password PASS        Password (default SYS, env CDEV_PASSWORD)\n"
        << "  -N, --namespace NS         Namespace (default USER, env CDEV_NAMESPACE)\n"
        << "  -I, --instance NAME        Named instance from CDEV_INSTANCE_<NAME>=host:port\n"
        << "  -H, --host HOST            Host (default localhost, env CDEV_HOST)\n"
        << "  -W, --web-server-port N    Web server port (default 57772, env CDEV_PORT)\n"
        << "\n"
        << "Commands:\n"
        << "  list namespaces                       List namespaces\n"
        << "  list classes [-s]                     List classes (-s hides system classes)\n"
        << "  list routines [-t TYPE]... [-s]       List routines (TYPE: mac|int|obj|inc|bas)\n"
        << "  download NAME...                      Download classes or routines\n"
        << "  upload FILE...                        Upload and compile classes or routines\n"
        << "  export [-o FILE] NAME...              Export classes or routines as XML\n"
        << "  import FILE...                        Import XML exports\n"
        << "  edit NAME...                          Edit in $EDITOR, then upload and compile\n";
    return oss.str();
}

bool IsSystemName(const std::string& name) {
    return !name.empty() && name.front() == '%';
}

std::string FileType(const std::string& name) {
    const auto dot = name.rfind('.');
    return dot == std::string::npos ? std::string() : name.substr(dot + 1);
}

std::vector<std::string> FilterClasses(const std::vector<File>& files, bool includeSystem) {
    std::vector<std::string> names;
    for (const auto& f : files) {
        if (FileType(f.name) == "cls" && (includeSystem || !IsSystemName(f.name))) {
            names.push_back(f.name);
        }
    }
    return names;
}

std::vector<std::string> FilterRoutines(const std::vector<File>& files, const std::vector<std::string>& types,
                                        bool includeSystem) {
    std::vector<std::string> names;
    for (const auto& f : files) {
        const std::string type = FileType(f.name);
        const bool routine = std::find(kRoutineTypes.begin(), kRoutineTypes.end(), type) != kRoutineTypes.end();
        const bool wanted = types.empty() || std::find(types.begin(), types.end(), type) != types.end();
        if (routine && wanted && (includeSystem || !IsSystemName(f.name))) {
            names.push_back(f.name);
        }
    }
    return names;
}

int RunCommand(CommandContext& ctx, const std::string& command, const std::vector<std::string>& args) {
    auto it = commandTable().find(command);
    if (it == commandTable().end()) {
        throw UsageError("unknown command '" + command + "'");
    }
    LOG_DEBUG("Running '{}' in namespace {}", command, ctx.ns.name);
    return it->second(ctx, args);
}

int Run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    GlobalOptions opts;
    try {
        opts = ParseGlobalOptions(args);
    } catch (const UsageError& e) {
        err << "cdev: " << e.what() << "\n\n" << UsageText();
        return EXIT_USAGE;
    }
    if (opts.help) {
        out << UsageText();
        return EXIT_OK;
    }
    if (opts.version) {
        out << "cdev " << getVersionString() << "\n";
        return EXIT_OK;
    }
    if (opts.command.empty()) {
        err << "cdev: no command given\n\n" << UsageText();
        return EXIT_USAGE;
    }

    Logger::setUseStderr(GetEnvFlag("CDEV_LOG_STDERR", true));
    Logger::setLogLevel(opts.verbose ? LogLevel::LOG_DEBUG_LEVEL
                                     : Logger::levelFromString(GetEnvOrDefault("CDEV_LOG_LEVEL", "WARN")));
    if (auto logFile = GetEnvOptional("CDEV_LOG_FILE")) {
        Logger::setLogFile(*logFile);
    }

    try {
        Client client(ResolveConnection(opts));
        const std::string nsName = ResolveNamespace(opts);
        auto ns = client.GetNamespace(nsName);
        if (!ns) {
            err << "cdev: namespace not found: " << nsName << "\n";
            return EXIT_OPERATION_FAILED;
        }
        CommandContext ctx{client, *ns, out, err, std::filesystem::current_path(), GetEnvOrDefault("EDITOR", "vi")};
        return RunCommand(ctx, opts.command, opts.args);
    } catch (const UsageError& e) {
        err << "cdev: " << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const errors::CdevError& e) {
        LOG_DEBUG("{} error: {}", errors::categoryName(e.category()), e.description());
        err << e.what() << "\n";
        return EXIT_CLIENT_ERROR;
    } catch (const std::filesystem::filesystem_error& e) {
        err << "cdev: " << e.what() << "\n";
        return EXIT_OPERATION_FAILED;
    }
}

} // namespace cli
} // namespace cdev
