#include "config/batch_config.hpp"

#include "utils/file_io.hpp"
#include "utils/log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace blobkit::config {
namespace {

using json = nlohmann::ordered_json;

const char* sectionName(container::ContainerKind kind)
{
    switch (kind) {
    case container::ContainerKind::Application:
        return "applications";
    case container::ContainerKind::Binary:
        return "binaries";
    case container::ContainerKind::UserData:
        break;
    }
    throw std::invalid_argument("Batch configuration is only supported for application and binary catalogs");
}

std::string describeRecord(std::size_t position, const std::string& key)
{
    return key.empty() ? "record #" + std::to_string(position + 1) : "record '" + key + "'";
}

template <class T>
T requiredValue(const json& object, const char* field, const std::string& where)
{
    const auto it = object.find(field);
    if (it == object.end() || it->is_null()) {
        throw std::invalid_argument("Batch " + where + " is missing '" + field + "'");
    }
    try {
        return it->get<T>();
    } catch (const json::exception&) {
        throw std::invalid_argument("Batch " + where + " has a wrong type for '" + field + "'");
    }
}

template <class T>
T optionalValue(const json& object, const char* field, const std::string& where, T fallback)
{
    const auto it = object.find(field);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    return requiredValue<T>(object, field, where);
}

container::EnvironmentVariables environmentFrom(const json& object, const std::string& where)
{
    container::EnvironmentVariables env;
    const auto it = object.find("env");
    if (it == object.end() || it->is_null()) {
        return env;
    }
    if (!it->is_object()) {
        throw std::invalid_argument("Batch " + where + " field 'env' must be an object");
    }
    for (const auto& [name, value] : it->items()) {
        if (!value.is_string()) {
            throw std::invalid_argument("Batch " + where + " env value of " + name + " must be a string");
        }
        env.emplace_back(name, value.get<std::string>());
    }
    return env;
}

BatchRecord applicationRecord(const json& item, const std::string& where)
{
    container::ApplicationEntry entry {};
    BatchRecord batch {requiredValue<std::string>(item, "key", where), {}, {}};
    batch.source = requiredValue<std::string>(item, "path", where);

    entry.record.key = batch.key;
    entry.record.description = optionalValue<std::string>(item, "description", where, "");
    entry.record.dependencies = optionalValue<std::vector<std::string>>(item, "dependencies", where, {});
    entry.name = optionalValue<std::string>(item, "name", where, batch.key);
    entry.version = optionalValue<std::string>(item, "version", where, "1.0.0");
    batch.prototype = std::move(entry);
    return batch;
}

BatchRecord binaryRecord(const json& item, const std::string& where)
{
    container::BinaryEntry entry {};
    BatchRecord batch {requiredValue<std::string>(item, "key", where), {}, {}};
    batch.source = requiredValue<std::string>(item, "source", where);

    entry.record.key = batch.key;
    entry.record.description = optionalValue<std::string>(item, "description", where, "");
    entry.record.dependencies = optionalValue<std::vector<std::string>>(item, "dependencies", where, {});
    entry.version = optionalValue<std::string>(item, "version", where, "1.0.0");
    entry.provides = optionalValue<std::vector<std::string>>(item, "provides", where, {});
    entry.envVars = environmentFrom(item, where);
    entry.architecture = optionalValue<std::string>(item, "architecture", where, "x86_64");
    entry.osType = optionalValue<std::string>(item, "os", where, "linux");
    batch.prototype = std::move(entry);
    return batch;
}

json sampleDocument(container::ContainerKind kind)
{
    if (kind == container::ContainerKind::UserData) {
        throw std::invalid_argument("There is no sample batch configuration for a user data store");
    }
    if (kind == container::ContainerKind::Application) {
        return json {{"applications",
                      json::array({
                          {{"key", "webserver"}, {"name", "Web Server"}, {"path", "./apps/webserver"},
                           {"version", "2.1.0"}, {"dependencies", json::array()}},
                          {{"key", "api-gateway"}, {"name", "API Gateway"}, {"path", "./apps/api-gateway"},
                           {"version", "1.5.0"}, {"dependencies", {"shared-lib"}}},
                          {{"key", "shared-lib"}, {"name", "Shared Library"}, {"path", "./apps/shared-lib"},
                           {"version", "1.0.0"}, {"dependencies", json::array()}},
                      })}};
    }

    return json {{"binaries",
                  json::array({
                      {{"key", "python3.11"}, {"source", "./binaries/python3.11"}, {"provides", {"python3", "python"}},
                       {"version", "3.11.0"}, {"description", "Python interpreter"},
                       {"env", {{"PYTHONHOME", "/opt/python3.11"}}}, {"dependencies", json::array()},
                       {"architecture", "x86_64"}, {"os", "linux"}},
                      {{"key", "postgres-client"}, {"source", "./binaries/postgres-client"}, {"provides", {"psql"}},
                       {"version", "15.4"}, {"description", "PostgreSQL client tools"},
                       {"dependencies", {"openssl-libs"}}},
                      {{"key", "openssl-libs"}, {"source", "./binaries/openssl-libs"}, {"version", "3.0.0"},
                       {"description", "Shared OpenSSL libraries"}},
                  })}};
}

} // namespace

std::vector<BatchRecord> parseBatchConfig(const std::string& text, container::ContainerKind kind)
{
    const char* section = sectionName(kind);

    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& error) {
        throw std::invalid_argument(std::string("Malformed batch configuration: ") + error.what());
    }
    if (!document.is_object()) {
        throw std::invalid_argument("Batch configuration must be a JSON object");
    }

    std::vector<BatchRecord> records;
    const auto items = document.find(section);
    if (items == document.end() || items->is_null()) {
        return records;
    }
    if (!items->is_array()) {
        throw std::invalid_argument(std::string("Batch configuration '") + section + "' must be an array");
    }

    for (std::size_t position = 0; position < items->size(); ++position) {
        const auto& item = (*items)[position];
        std::string key;
        if (item.is_object() && item.contains("key") && item["key"].is_string()) {
            key = item["key"].get<std::string>();
        }
        const auto where = describeRecord(position, key);
        if (!item.is_object()) {
            throw std::invalid_argument("Batch " + where + " is not an object");
        }
        records.push_back(kind == container::ContainerKind::Application ? applicationRecord(item, where)
                                                                         : binaryRecord(item, where));
    }
    return records;
}

std::vector<BatchRecord> loadBatchConfig(const std::filesystem::path& path, container::ContainerKind kind)
{
    std::ifstream input(path);
    if (!input) {
        throw std::filesystem::filesystem_error("Config file not found", path,
                                                std::make_error_code(std::errc::no_such_file_or_directory));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parseBatchConfig(buffer.str(), kind);
}

BatchBuildResult buildFromConfig(container::ContainerKind kind, const std::filesystem::path& configPath,
                                 const std::filesystem::path& outputPath, int compressionLevel)
{
    utils::logInfo("Building from config: " + configPath.string());
    auto records = loadBatchConfig(configPath, kind);

    BatchBuildResult result {};
    container::ContainerWriter writer(kind, outputPath, compressionLevel);
    for (auto& record : records) {
        std::error_code ec;
        if (!std::filesystem::exists(record.source, ec)) {
            utils::logWarning("Path '" + record.source.string() + "' not found, skipping " + record.key);
            result.skipped.push_back(record.key);
            continue;
        }
        writer.addEntry(record.key, record.source, std::move(record.prototype));
        result.added.push_back(record.key);
    }

    result.summary = writer.build();
    result.index = writer.index();
    return result;
}

void writeSampleConfig(container::ContainerKind kind, const std::filesystem::path& path)
{
    const auto document = sampleDocument(kind);
    utils::ensureParentDirectory(path);

    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    output << document.dump(2) << "\n";
    if (!output) {
        throw std::runtime_error("Failed to write sample config: " + path.string());
    }
}

} // namespace blobkit::config
