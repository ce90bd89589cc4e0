#include "container/entry_index.hpp"

#include "core/errors.hpp"
#include "integrity/sha256.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace blobkit::container {
namespace {

using json = nlohmann::ordered_json;

const char* keyFieldName(ContainerKind kind) noexcept
{
    return kind == ContainerKind::UserData ? "user_id" : "key";
}

std::string describeField(const std::string& key, const char* field)
{
    return "entry '" + key + "' field '" + field + "'";
}

template <class T>
T requiredField(const json& object, const char* field, const std::string& key)
{
    const auto it = object.find(field);
    if (it == object.end() || it->is_null()) {
        throw IndexParseError("Index " + describeField(key, field) + " is missing");
    }
    if constexpr (std::is_same_v<T, bool>) {
        if (!it->is_boolean()) {
            throw IndexParseError("Index " + describeField(key, field) + " must be a boolean");
        }
    } else if constexpr (std::is_unsigned_v<T>) {
        if (!it->is_number_unsigned()) {
            throw IndexParseError("Index " + describeField(key, field) + " must be a non-negative integer");
        }
    }
    try {
        return it->get<T>();
    } catch (const json::exception& error) {
        throw IndexParseError("Index " + describeField(key, field) + " has the wrong type: " + error.what());
    }
}

template <class T>
T optionalField(const json& object, const char* field, const std::string& key, T fallback)
{
    const auto it = object.find(field);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    return requiredField<T>(object, field, key);
}

bool isDigest(const std::string& value)
{
    if (value.size() != integrity::kDigestHexLength) {
        return false;
    }
    for (const char ch : value) {
        const bool digit = ch >= '0' && ch <= '9';
        const bool hex = ch >= 'a' && ch <= 'f';
        if (!digit && !hex) {
            return false;
        }
    }
    return true;
}

json filesToJson(const std::vector<archive::ManifestFile>& files)
{
    json array = json::array();
    for (const auto& file : files) {
        array.push_back(json {{"path", file.path}, {"size", file.size}, {"executable", file.executable}});
    }
    return array;
}

// Accepts both bare path strings and {"path", "size", "executable"} objects.
std::vector<archive::ManifestFile> filesFromJson(const json& object, const std::string& key)
{
    std::vector<archive::ManifestFile> files;
    const auto it = object.find("files");
    if (it == object.end() || it->is_null()) {
        return files;
    }
    if (!it->is_array()) {
        throw IndexParseError("Index " + describeField(key, "files") + " must be an array");
    }

    for (const auto& item : *it) {
        archive::ManifestFile file {};
        if (item.is_string()) {
            file.path = item.get<std::string>();
        } else if (item.is_object()) {
            file.path = requiredField<std::string>(item, "path", key);
            file.size = optionalField<std::uint64_t>(item, "size", key, 0);
            file.executable = optionalField<bool>(item, "executable", key, false);
        } else {
            throw IndexParseError("Index " + describeField(key, "files") + " holds an item that is neither a path nor an object");
        }
        files.push_back(std::move(file));
    }
    return files;
}

void writeCommon(json& object, const EntryRecord& record)
{
    object["description"] = record.description;
    object["size"] = record.size;
    object["compressed_size"] = record.compressedSize;
    object["offset"] = record.offset;
    object["checksum"] = record.checksum;
    object["dependencies"] = record.dependencies;
    object["files"] = filesToJson(record.files);
    object["created_at"] = record.createdAt;
}

EntryRecord readCommon(const json& object, const std::string& key)
{
    EntryRecord record {};
    record.key = key;
    record.description = optionalField<std::string>(object, "description", key, "");
    record.size = requiredField<std::uint64_t>(object, "size", key);
    record.compressedSize = requiredField<std::uint64_t>(object, "compressed_size", key);
    record.offset = requiredField<std::uint64_t>(object, "offset", key);
    record.checksum = requiredField<std::string>(object, "checksum", key);
    record.dependencies = optionalField<std::vector<std::string>>(object, "dependencies", key, {});
    record.files = filesFromJson(object, key);
    record.createdAt = optionalField<std::string>(object, "created_at", key, "");

    if (!isDigest(record.checksum)) {
        throw IndexParseError("Index " + describeField(key, "checksum") + " is not a SHA-256 hex digest");
    }
    return record;
}

json entryToJson(const Entry& entry)
{
    json object = json::object();

    std::visit([&object](const auto& alternative) {
        using T = std::decay_t<decltype(alternative)>;
        const auto& record = alternative.record;

        if constexpr (std::is_same_v<T, ApplicationEntry>) {
            object["key"] = record.key;
            object["name"] = alternative.name;
            object["version"] = alternative.version;
            writeCommon(object, record);
        } else if constexpr (std::is_same_v<T, BinaryEntry>) {
            object["key"] = record.key;
            object["version"] = alternative.version;
            writeCommon(object, record);
            object["provides"] = alternative.provides;
            object["executables"] = alternative.executables;
            object["libraries"] = alternative.libraries;
            json env = json::object();
            for (const auto& [name, value] : alternative.envVars) {
                env[name] = value;
            }
            object["env_vars"] = env;
            object["architecture"] = alternative.architecture;
            object["os_type"] = alternative.osType;
        } else {
            object["user_id"] = record.key;
            writeCommon(object, record);
            object["file_count"] = alternative.fileCount;
            object["quota_mb"] = alternative.quotaMb ? json(*alternative.quotaMb) : json(nullptr);
            object["updated_at"] = alternative.updatedAt;
            object["version"] = alternative.revision;
        }
    }, entry);

    return object;
}

Entry entryFromJson(ContainerKind kind, const std::string& key, const json& object)
{
    if (!object.is_object()) {
        throw IndexParseError("Index entry '" + key + "' is not an object");
    }

    const auto storedKey = requiredField<std::string>(object, keyFieldName(kind), key);
    if (storedKey != key) {
        throw IndexParseError("Index entry '" + key + "' records a different key '" + storedKey + "'");
    }

    switch (kind) {
    case ContainerKind::Application: {
        ApplicationEntry entry {};
        entry.record = readCommon(object, key);
        entry.name = optionalField<std::string>(object, "name", key, key);
        entry.version = optionalField<std::string>(object, "version", key, "1.0.0");
        return entry;
    }
    case ContainerKind::Binary: {
        BinaryEntry entry {};
        entry.record = readCommon(object, key);
        entry.version = optionalField<std::string>(object, "version", key, "1.0.0");
        entry.provides = optionalField<std::vector<std::string>>(object, "provides", key, {});
        entry.executables = optionalField<std::vector<std::string>>(object, "executables", key, {});
        entry.libraries = optionalField<std::vector<std::string>>(object, "libraries", key, {});
        entry.architecture = optionalField<std::string>(object, "architecture", key, "x86_64");
        entry.osType = optionalField<std::string>(object, "os_type", key, "linux");

        const auto env = object.find("env_vars");
        if (env != object.end() && !env->is_null()) {
            if (!env->is_object()) {
                throw IndexParseError("Index " + describeField(key, "env_vars") + " must be an object");
            }
            for (const auto& [name, value] : env->items()) {
                if (!value.is_string()) {
                    throw IndexParseError("Index " + describeField(key, "env_vars") + " value of " + name + " must be a string");
                }
                entry.envVars.emplace_back(name, value.get<std::string>());
            }
        }
        return entry;
    }
    case ContainerKind::UserData: {
        UserRecord entry {};
        entry.record = readCommon(object, key);
        entry.fileCount = optionalField<std::uint64_t>(object, "file_count", key, entry.record.files.size());
        const auto quota = object.find("quota_mb");
        if (quota != object.end() && !quota->is_null()) {
            entry.quotaMb = requiredField<std::uint64_t>(object, "quota_mb", key);
        }
        entry.updatedAt = optionalField<std::string>(object, "updated_at", key, entry.record.createdAt);
        entry.revision = optionalField<std::uint64_t>(object, "version", key, 1);
        return entry;
    }
    }
    throw IndexParseError("Unknown container kind");
}

} // namespace

const Entry& EntryIndex::insert(Entry entry)
{
    const auto key = record(entry).key;
    if (positions_.count(key) != 0U) {
        throw DuplicateKeyError("Entry '" + key + "' already exists");
    }
    positions_.emplace(key, entries_.size());
    entries_.push_back(std::move(entry));
    return entries_.back();
}

const Entry& EntryIndex::replace(Entry entry)
{
    const auto key = record(entry).key;
    const auto it = positions_.find(key);
    if (it == positions_.end()) {
        throw NotFoundError("Entry '" + key + "' not found");
    }
    entries_[it->second] = std::move(entry);
    return entries_[it->second];
}

void EntryIndex::erase(const std::string& key)
{
    const auto it = positions_.find(key);
    if (it == positions_.end()) {
        throw NotFoundError("Entry '" + key + "' not found");
    }

    const auto position = it->second;
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(position));
    positions_.erase(it);
    for (auto& [otherKey, otherPosition] : positions_) {
        if (otherPosition > position) {
            --otherPosition;
        }
    }
}

const Entry* EntryIndex::find(const std::string& key) const noexcept
{
    const auto it = positions_.find(key);
    return it == positions_.end() ? nullptr : &entries_[it->second];
}

Entry* EntryIndex::find(const std::string& key) noexcept
{
    const auto it = positions_.find(key);
    return it == positions_.end() ? nullptr : &entries_[it->second];
}

const Entry& EntryIndex::at(const std::string& key) const
{
    const auto* entry = find(key);
    if (entry == nullptr) {
        throw NotFoundError("Entry '" + key + "' not found");
    }
    return *entry;
}

bool EntryIndex::contains(const std::string& key) const noexcept
{
    return positions_.count(key) != 0U;
}

std::vector<std::string> EntryIndex::keys() const
{
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(record(entry).key);
    }
    return result;
}

std::string serializeIndex(const EntryIndex& index, ContainerKind kind, const std::string& createdAt)
{
    json entries = json::object();
    for (const auto& entry : index) {
        if (kindOf(entry) != kind) {
            throw std::invalid_argument("Entry '" + record(entry).key + "' does not belong in a " + kindName(kind));
        }
        entries[record(entry).key] = entryToJson(entry);
    }

    json document = json::object();
    document["version"] = kFormatVersion;
    document["blob_type"] = blobTypeName(kind);
    document["created_at"] = createdAt;
    document["entry_count"] = index.size();
    document[collectionName(kind)] = std::move(entries);
    return document.dump(2);
}

ParsedIndex parseIndex(ContainerKind kind, const std::string& text)
{
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& error) {
        throw IndexParseError(std::string("Malformed index: ") + error.what());
    }

    if (!document.is_object()) {
        throw IndexParseError("Malformed index: top level is not an object");
    }

    const auto blobType = document.find("blob_type");
    if (blobType != document.end() && (!blobType->is_string() || blobType->get<std::string>() != blobTypeName(kind))) {
        throw IndexParseError("Index blob_type does not match a " + kindName(kind));
    }

    const auto entries = document.find(collectionName(kind));
    if (entries == document.end() || !entries->is_object()) {
        throw IndexParseError(std::string("Index is missing the '") + collectionName(kind) + "' object");
    }

    ParsedIndex parsed {};
    const auto createdAt = document.find("created_at");
    if (createdAt != document.end() && createdAt->is_string()) {
        parsed.createdAt = createdAt->get<std::string>();
    }

    for (const auto& [key, value] : entries->items()) {
        try {
            parsed.index.insert(entryFromJson(kind, key, value));
        } catch (const DuplicateKeyError&) {
            throw IndexParseError("Index lists entry '" + key + "' twice");
        }
    }

    const auto count = document.find("entry_count");
    if (count != document.end()) {
        if (!count->is_number_unsigned() || count->get<std::uint64_t>() != parsed.index.size()) {
            throw IndexParseError("Index entry_count does not match the number of entries");
        }
    }

    return parsed;
}

} // namespace blobkit::container
