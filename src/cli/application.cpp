#include "cli/application.hpp"

#include "archive/manifest.hpp"
#include "config/batch_config.hpp"
#include "container/container_reader.hpp"
#include "container/container_writer.hpp"
#include "container/data_store.hpp"
#include "container/dependency_resolver.hpp"
#include "core/errors.hpp"
#include "report/report.hpp"
#include "utils/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <exception>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace blobkit::cli {
namespace {

using container::ContainerKind;

struct Arguments {
    std::map<std::string, std::vector<std::string>> values;
    std::set<std::string> switches;

    bool has(const std::string& name) const { return values.count(name) != 0U; }
    bool flag(const std::string& name) const { return switches.count(name) != 0U; }

    const std::string& required(const std::string& name) const
    {
        const auto it = values.find(name);
        if (it == values.end()) {
            throw std::invalid_argument("Missing required " + name + " argument");
        }
        return it->second.back();
    }

    std::string valueOr(const std::string& name, std::string fallback) const
    {
        const auto it = values.find(name);
        return it == values.end() ? std::move(fallback) : it->second.back();
    }

    std::vector<std::string> all(const std::string& name) const
    {
        const auto it = values.find(name);
        return it == values.end() ? std::vector<std::string> {} : it->second;
    }
};

using Handler = std::function<int(const Arguments&, std::ostream&)>;

struct Command {
    std::string group;
    std::string name;
    std::vector<std::string> options;
    std::vector<std::string> switches;
    std::string usage;
    Handler handler;
};

using CommandTable = std::vector<Command>;

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(const std::string& value)
{
    const auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

std::vector<std::string> splitList(const std::string& value)
{
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::uint64_t parseUnsigned(const std::string& name, const std::string& value)
{
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Invalid " + name + " value: " + value);
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Invalid " + name + " value: " + value);
    }
}

container::EnvironmentVariables parseEnvironment(const std::vector<std::string>& assignments)
{
    container::EnvironmentVariables env;
    for (const auto& assignment : assignments) {
        const auto separator = assignment.find('=');
        if (separator == std::string::npos || separator == 0) {
            throw std::invalid_argument("Invalid --env value, expected KEY=VALUE: " + assignment);
        }
        env.emplace_back(assignment.substr(0, separator), assignment.substr(separator + 1));
    }
    return env;
}

std::string timestampSuffix()
{
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local {};
    localtime_r(&now, &local);
    std::ostringstream stream;
    stream << std::put_time(&local, "%Y%m%d-%H%M%S");
    return stream.str();
}

bool blobExists(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

void requireBlob(const std::filesystem::path& path)
{
    if (!blobExists(path)) {
        throw std::runtime_error("Blob not found: " + path.string());
    }
}

container::ContainerWriter openOrCreate(ContainerKind kind, const std::filesystem::path& blob)
{
    if (blobExists(blob)) {
        return container::ContainerWriter::loadExisting(blob, kind);
    }
    return container::ContainerWriter(kind, blob);
}

container::DataStore openOrCreateStore(const std::filesystem::path& blob)
{
    return blobExists(blob) ? container::DataStore::open(blob) : container::DataStore::create(blob);
}

int buildAndReport(container::ContainerWriter& writer, std::ostream& out)
{
    const auto summary = writer.build();
    report::printBuildSummary(out, writer.kind(), writer.outputPath(), writer.index(), summary);
    return 0;
}

// Shared by every kind.

int listEntries(ContainerKind kind, const Arguments& args, std::ostream& out)
{
    const std::filesystem::path blob = args.required("--blob");
    requireBlob(blob);
    container::ContainerReader reader(blob, kind);
    report::printEntryList(out, reader.index(), blob);
    return 0;
}

int showInfo(ContainerKind kind, const std::string& keyOption, const Arguments& args, std::ostream& out)
{
    const std::filesystem::path blob = args.required("--blob");
    requireBlob(blob);
    container::ContainerReader reader(blob, kind);
    report::printEntryInfo(out, reader.getMetadata(args.required(keyOption)));
    return 0;
}

int extractEntries(ContainerKind kind, const std::string& keysOption, const Arguments& args, std::ostream& out)
{
    const std::filesystem::path blob = args.required("--blob");
    requireBlob(blob);
    const auto keys = splitList(args.required(keysOption));
    if (keys.empty()) {
        throw std::invalid_argument("No keys given to " + keysOption);
    }

    container::ContainerReader reader(blob, kind);
    const auto extraction = reader.extractMany(keys, args.required("--output"), !args.flag("--no-deps"),
                                               !args.flag("--no-verify"));
    report::printExtractionReport(out, extraction);
    return extraction.succeeded() ? 0 : 1;
}

int verifyEntries(ContainerKind kind, const Arguments& args, std::ostream& out)
{
    const std::filesystem::path blob = args.required("--blob");
    requireBlob(blob);
    container::ContainerReader reader(blob, kind);
    out << "\nVerifying " << blob.string() << "\n\n";
    const auto verification = reader.verifyAll();
    report::printVerificationReport(out, verification);
    return verification.allValid() ? 0 : 1;
}

int createEmpty(ContainerKind kind, const Arguments& args, std::ostream& out)
{
    const std::filesystem::path output = args.required("--output");
    if (blobExists(output) && !args.flag("--force")) {
        throw std::runtime_error("Blob already exists: " + output.string() + " (use --force to overwrite)");
    }
    container::ContainerWriter writer(kind, output);
    return buildAndReport(writer, out);
}

int buildCatalogFromConfig(ContainerKind kind, const Arguments& args, std::ostream& out)
{
    const std::filesystem::path output = args.required("--output");
    const auto result = config::buildFromConfig(kind, args.required("--config"), output);
    report::printBuildSummary(out, kind, output, result.index, result.summary);
    if (!result.skipped.empty()) {
        out << "\n  Skipped (source not found):";
        for (const auto& key : result.skipped) {
            out << " " << key;
        }
        out << "\n";
    }
    return 0;
}

int initConfig(ContainerKind kind, const std::string& fallback, const Arguments& args, std::ostream& out)
{
    const std::filesystem::path output = args.valueOr("--output", fallback);
    config::writeSampleConfig(kind, output);
    out << "Created sample config: " << output.string() << "\n";
    return 0;
}

// app

int appAdd(const Arguments& args, std::ostream& out)
{
    const auto& key = args.required("--key");
    container::ApplicationEntry prototype {};
    prototype.name = args.valueOr("--name", key);
    prototype.version = args.valueOr("--version", "1.0.0");
    prototype.record.description = args.valueOr("--description", "");
    prototype.record.dependencies = splitList(args.valueOr("--dependencies", ""));

    auto writer = openOrCreate(ContainerKind::Application, args.required("--blob"));
    writer.addEntry(key, args.required("--source"), std::move(prototype));
    return buildAndReport(writer, out);
}

// bin

int binAdd(const Arguments& args, std::ostream& out)
{
    const auto& key = args.required("--key");
    const std::filesystem::path source = args.required("--source");

    container::BinaryEntry prototype {};
    prototype.version = args.valueOr("--version", "1.0.0");
    prototype.record.description = args.valueOr("--description", "");
    prototype.record.dependencies = splitList(args.valueOr("--dependencies", ""));
    prototype.provides = splitList(args.valueOr("--provides", ""));
    prototype.envVars = parseEnvironment(args.all("--env"));
    prototype.architecture = args.valueOr("--architecture", "x86_64");
    prototype.osType = args.valueOr("--os", "linux");

    if (args.flag("--auto-detect") && prototype.provides.empty()) {
        std::error_code ec;
        if (std::filesystem::is_directory(source, ec)) {
            prototype.provides = archive::detectProvides(source);
        }
        out << "Auto-detected provides:";
        for (const auto& command : prototype.provides) {
            out << " " << command;
        }
        out << (prototype.provides.empty() ? " (none)\n" : "\n");
    }

    auto writer = openOrCreate(ContainerKind::Binary, args.required("--blob"));
    writer.addEntry(key, source, std::move(prototype));
    return buildAndReport(writer, out);
}

int binDeps(const Arguments& args, std::ostream& out)
{
    const std::filesystem::path blob = args.required("--blob");
    requireBlob(blob);
    container::ContainerReader reader(blob, ContainerKind::Binary);
    const auto& key = args.required("--key");
    if (reader.find(key) == nullptr) {
        throw NotFoundError("Entry '" + key + "' not found");
    }

    out << "\nDependency tree for " << key << ":\n\n";
    report::printDependencyTree(out, container::dependencyTree(reader.index(), key));

    const auto resolution = reader.resolveDependencies({key});
    out << "\nAll required (" << resolution.keys.size() << "):";
    for (const auto& resolved : resolution.keys) {
        out << " " << resolved;
    }
    out << "\n";
    return resolution.missing.empty() ? 0 : 1;
}

// user

int userCreate(const Arguments& args, std::ostream& out)
{
    return createEmpty(ContainerKind::UserData, args, out);
}

int userAdd(const Arguments& args, std::ostream& out)
{
    std::optional<std::uint64_t> quota;
    if (args.has("--quota")) {
        quota = parseUnsigned("--quota", args.required("--quota"));
    }

    auto store = openOrCreateStore(args.required("--blob"));
    store.add(args.required("--user-id"), args.required("--source"), args.valueOr("--description", ""), quota);
    const auto summary = store.build();
    report::printBuildSummary(out, ContainerKind::UserData, store.path(), store.writer().index(), summary);
    return 0;
}

int userUpdate(const Arguments& args, std::ostream& out)
{
    const std::filesystem::path blob = args.required("--blob");
    requireBlob(blob);
    const auto mode = container::parseUpdateMode(args.valueOr("--mode", "replace"));

    auto store = container::DataStore::open(blob);
    const auto& updated = store.update(args.required("--user-id"), args.required("--source"), mode);
    out << "Updated " << updated.record.key << " (" << container::updateModeName(mode) << "), now v" << updated.revision
        << "\n";
    const auto summary = store.build();
    report::printBuildSummary(out, ContainerKind::UserData, store.path(), store.writer().index(), summary);
    return 0;
}

int userRemove(const Arguments& args, std::ostream& out)
{
    const std::filesystem::path blob = args.required("--blob");
    requireBlob(blob);

    auto store = container::DataStore::open(blob);
    const auto& userId = args.required("--user-id");
    store.remove(userId);
    const auto summary = store.build();
    out << "Removed " << userId << "; its bytes stay in the file until 'user compact'\n";
    report::printBuildSummary(out, ContainerKind::UserData, store.path(), store.writer().index(), summary);
    return 0;
}

int userCheckpoint(const Arguments& args, std::ostream& out)
{
    const std::filesystem::path blob = args.required("--blob");
    requireBlob(blob);

    std::filesystem::path destination = args.valueOr("--output", "");
    if (destination.empty()) {
        destination = blob.parent_path() / (blob.stem().string() + "-checkpoint-" + timestampSuffix() + blob.extension().string());
    }

    const auto store = container::DataStore::open(blob);
    store.checkpoint(destination);
    out << "Checkpoint created: " << destination.string() << " (" << report::groupDigits(std::filesystem::file_size(destination))
        << " bytes)\n";
    return 0;
}

int userCompact(const Arguments& args, std::ostream& out)
{
    const std::filesystem::path blob = args.required("--blob");
    requireBlob(blob);

    auto store = container::DataStore::open(blob);
    const auto reclaimed = store.compact();
    const auto summary = store.build();
    out << "Reclaimed " << report::groupDigits(reclaimed) << " bytes\n";
    report::printBuildSummary(out, ContainerKind::UserData, store.path(), store.writer().index(), summary);
    return 0;
}

CommandTable makeCommandTable()
{
    using namespace std::placeholders;

    CommandTable table;

    table.push_back({"app", "build", {"--config", "--output"}, {}, "--config <file> --output <blob>",
                     std::bind(buildCatalogFromConfig, ContainerKind::Application, _1, _2)});
    table.push_back({"app", "add", {"--blob", "--key", "--source", "--name", "--version", "--description", "--dependencies"}, {},
                     "--blob <blob> --key <key> --source <path> [--name <n>] [--version <v>] [--dependencies a,b]", appAdd});
    table.push_back({"app", "list", {"--blob"}, {}, "--blob <blob>", std::bind(listEntries, ContainerKind::Application, _1, _2)});
    table.push_back({"app", "info", {"--blob", "--app"}, {}, "--blob <blob> --app <key>",
                     std::bind(showInfo, ContainerKind::Application, "--app", _1, _2)});
    table.push_back({"app", "extract", {"--blob", "--apps", "--output"}, {"--no-deps", "--no-verify"},
                     "--blob <blob> --apps a,b --output <dir> [--no-deps] [--no-verify]",
                     std::bind(extractEntries, ContainerKind::Application, "--apps", _1, _2)});
    table.push_back({"app", "verify", {"--blob"}, {}, "--blob <blob>", std::bind(verifyEntries, ContainerKind::Application, _1, _2)});
    table.push_back({"app", "init", {"--output"}, {}, "[--output <file>]",
                     std::bind(initConfig, ContainerKind::Application, "app-blob-config.json", _1, _2)});

    table.push_back({"bin", "create", {"--output"}, {"--force"}, "--output <blob> [--force]",
                     std::bind(createEmpty, ContainerKind::Binary, _1, _2)});
    table.push_back({"bin", "add",
                     {"--blob", "--key", "--source", "--provides", "--version", "--description", "--env", "--dependencies",
                      "--architecture", "--os"},
                     {"--auto-detect"},
                     "--blob <blob> --key <key> --source <path> [--provides a,b] [--env K=V]... [--auto-detect]", binAdd});
    table.push_back({"bin", "list", {"--blob"}, {}, "--blob <blob>", std::bind(listEntries, ContainerKind::Binary, _1, _2)});
    table.push_back({"bin", "info", {"--blob", "--key"}, {}, "--blob <blob> --key <key>",
                     std::bind(showInfo, ContainerKind::Binary, "--key", _1, _2)});
    table.push_back({"bin", "deps", {"--blob", "--key"}, {}, "--blob <blob> --key <key>", binDeps});
    table.push_back({"bin", "build-from-config", {"--config", "--output"}, {}, "--config <file> --output <blob>",
                     std::bind(buildCatalogFromConfig, ContainerKind::Binary, _1, _2)});
    table.push_back({"bin", "extract", {"--blob", "--keys", "--output"}, {"--no-deps", "--no-verify"},
                     "--blob <blob> --keys a,b --output <dir> [--no-deps] [--no-verify]",
                     std::bind(extractEntries, ContainerKind::Binary, "--keys", _1, _2)});
    table.push_back({"bin", "verify", {"--blob"}, {}, "--blob <blob>", std::bind(verifyEntries, ContainerKind::Binary, _1, _2)});
    table.push_back({"bin", "init", {"--output"}, {}, "[--output <file>]",
                     std::bind(initConfig, ContainerKind::Binary, "binary-blob-config.json", _1, _2)});

    table.push_back({"user", "create", {"--output"}, {"--force"}, "--output <blob> [--force]", userCreate});
    table.push_back({"user", "add-user", {"--blob", "--user-id", "--source", "--description", "--quota"}, {},
                     "--blob <blob> --user-id <id> --source <path> [--description <d>] [--quota <mb>]", userAdd});
    table.push_back({"user", "update-user", {"--blob", "--user-id", "--source", "--mode"}, {},
                     "--blob <blob> --user-id <id> --source <path> [--mode replace|merge]", userUpdate});
    table.push_back({"user", "remove-user", {"--blob", "--user-id"}, {}, "--blob <blob> --user-id <id>", userRemove});
    table.push_back({"user", "list", {"--blob"}, {}, "--blob <blob>", std::bind(listEntries, ContainerKind::UserData, _1, _2)});
    table.push_back({"user", "info", {"--blob", "--user-id"}, {}, "--blob <blob> --user-id <id>",
                     std::bind(showInfo, ContainerKind::UserData, "--user-id", _1, _2)});
    table.push_back({"user", "checkpoint", {"--blob", "--output"}, {}, "--blob <blob> [--output <file>]", userCheckpoint});
    table.push_back({"user", "compact", {"--blob"}, {}, "--blob <blob>", userCompact});

    return table;
}

void printUsage(const CommandTable& table, std::ostream& out)
{
    out << "Usage:\n"
        << "  blobkit help\n"
        << "  blobkit <app|bin|user> <command> [options] [--verbose|--quiet]\n\n"
        << "Commands:\n";
    for (const auto& command : table) {
        out << "  blobkit " << command.group << " " << command.name << " " << command.usage << "\n";
    }
    out << "\nShort forms: -b --blob, -o --output, -c --config, -s --source.\n";
}

std::string expandShortOption(const std::string& argument)
{
    static const std::map<std::string, std::string> kShortOptions = {
        {"-b", "--blob"}, {"-o", "--output"}, {"-c", "--config"}, {"-s", "--source"},
    };
    const auto it = kShortOptions.find(argument);
    return it == kShortOptions.end() ? argument : it->second;
}

Arguments parseArguments(const Command& command, const std::vector<std::string>& arguments, std::size_t first)
{
    Arguments parsed {};
    for (std::size_t index = first; index < arguments.size(); ++index) {
        const auto argument = expandShortOption(arguments[index]);

        if (argument == "--verbose" || argument == "--quiet") {
            continue;
        }
        if (std::find(command.switches.begin(), command.switches.end(), argument) != command.switches.end()) {
            parsed.switches.insert(argument);
            continue;
        }
        if (std::find(command.options.begin(), command.options.end(), argument) != command.options.end()) {
            if (index + 1 >= arguments.size()) {
                throw std::invalid_argument("Missing value for " + argument);
            }
            parsed.values[argument].push_back(arguments[++index]);
            continue;
        }
        throw std::invalid_argument("Unrecognized argument: " + arguments[index]);
    }
    return parsed;
}

utils::LogLevel requestedLogLevel(const std::vector<std::string>& arguments)
{
    auto level = utils::LogLevel::Warning;
    for (const auto& argument : arguments) {
        if (argument == "--verbose") {
            level = utils::LogLevel::Info;
        } else if (argument == "--quiet") {
            level = utils::LogLevel::Error;
        }
    }
    return level;
}

int dispatch(const CommandTable& table, const std::vector<std::string>& arguments, std::ostream& out)
{
    if (arguments.empty()) {
        printUsage(table, out);
        return 0;
    }

    const auto group = toLower(arguments[0]);
    if (group == "help" || group == "--help" || group == "-h") {
        printUsage(table, out);
        return 0;
    }
    if (arguments.size() < 2) {
        throw std::invalid_argument("Missing command for '" + arguments[0] + "'");
    }

    const auto name = toLower(arguments[1]);
    const auto it = std::find_if(table.begin(), table.end(), [&group, &name](const Command& command) {
        return command.group == group && command.name == name;
    });
    if (it == table.end()) {
        throw std::invalid_argument("Unknown command: " + arguments[0] + " " + arguments[1]);
    }

    const auto parsed = parseArguments(*it, arguments, 2);
    return it->handler(parsed, out);
}

} // namespace

int run(const std::vector<std::string>& arguments, std::ostream& out, std::ostream& err)
{
    const auto table = makeCommandTable();
    try {
        utils::setLogLevel(requestedLogLevel(arguments));
        return dispatch(table, arguments, out);
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return 1;
    }
}

int run(int argc, char** argv)
{
    std::vector<std::string> arguments;
    for (int index = 1; index < argc; ++index) {
        arguments.emplace_back(argv[index]);
    }
    return run(arguments, std::cout, std::cerr);
}

} // namespace blobkit::cli
