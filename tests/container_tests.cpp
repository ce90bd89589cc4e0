#include "archive/tree_archive.hpp"
#include "container/container_reader.hpp"
#include "container/container_writer.hpp"
#include "container/layout.hpp"
#include "core/errors.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

using blobkit::container::ContainerKind;

class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& prefix)
    {
        const auto unique = prefix + "_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count());
        path_ = std::filesystem::temp_directory_path() / unique;
        std::filesystem::create_directories(path_);
    }

    ~ScopedTempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

void writeBinaryFile(const std::filesystem::path& path, const std::string& content)
{
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

std::string readBinaryFile(const std::filesystem::path& path)
{
    std::ifstream input(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

std::set<std::filesystem::path> collectFiles(const std::filesystem::path& root)
{
    std::set<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            files.insert(std::filesystem::relative(entry.path(), root));
        }
    }
    return files;
}

blobkit::container::ApplicationEntry application(const std::vector<std::string>& dependencies = {})
{
    blobkit::container::ApplicationEntry entry {};
    entry.version = "1.2.3";
    entry.record.dependencies = dependencies;
    return entry;
}

// shared-lib <- db-client, each with a couple of files.
std::filesystem::path buildCatalog(const std::filesystem::path& root)
{
    writeBinaryFile(root / "src" / "shared-lib" / "lib" / "libshared.so", "shared library bytes");
    writeBinaryFile(root / "src" / "db-client" / "bin" / "db", "database client");
    writeBinaryFile(root / "src" / "db-client" / "etc" / "db.conf", "host=localhost\n");

    const auto blob = root / "apps.blob";
    blobkit::container::ContainerWriter writer(ContainerKind::Application, blob);
    writer.addEntry("shared-lib", root / "src" / "shared-lib", application());
    writer.addEntry("db-client", root / "src" / "db-client", application({"shared-lib"}));
    writer.build();
    return blob;
}

void flipPayloadByte(const std::filesystem::path& blob, std::uint64_t position)
{
    std::fstream file(blob, std::ios::binary | std::ios::in | std::ios::out);
    file.seekg(static_cast<std::streamoff>(position));
    char byte = 0;
    file.read(&byte, 1);
    byte = static_cast<char>(byte ^ 0x5A);
    file.seekp(static_cast<std::streamoff>(position));
    file.write(&byte, 1);
}

// Rewrites the index of blob through edit, keeping the payload region as is.
template <class Edit>
void rewriteIndex(const std::filesystem::path& blob, ContainerKind kind, Edit edit)
{
    std::string payload;
    nlohmann::ordered_json document;
    {
        std::ifstream input(blob, std::ios::binary);
        const auto header = blobkit::container::readHeader(input, kind);
        document = nlohmann::ordered_json::parse(blobkit::container::readIndexBlock(input, header));
        payload.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    }
    edit(document);

    const auto text = document.dump(2);
    std::ofstream output(blob, std::ios::binary | std::ios::trunc);
    blobkit::container::writeHeader(output, kind, static_cast<std::uint32_t>(text.size()));
    output << text << payload;
}

} // namespace

TEST(ContainerWriterTest, AddFillsWriterOwnedFields)
{
    ScopedTempDir temp("writer_fields");
    writeBinaryFile(temp.path() / "a" / "one.txt", "first entry");
    writeBinaryFile(temp.path() / "b" / "two.txt", "second entry, a little longer");

    blobkit::container::ContainerWriter writer(ContainerKind::Application, temp.path() / "out.blob");
    const auto& first = blobkit::container::record(writer.addEntry("a", temp.path() / "a", application()));
    EXPECT_EQ(first.key, "a");
    EXPECT_EQ(first.offset, 0U);
    EXPECT_GT(first.size, 0U);
    EXPECT_EQ(first.checksum.size(), 64U);
    EXPECT_FALSE(first.createdAt.empty());
    ASSERT_EQ(first.files.size(), 1U);
    EXPECT_EQ(first.files[0].path, "one.txt");
    const auto firstCompressed = first.compressedSize;

    const auto& second = blobkit::container::record(writer.addEntry("b", temp.path() / "b", application()));
    EXPECT_EQ(second.offset, firstCompressed);
    EXPECT_EQ(writer.payloadSize(), firstCompressed + second.compressedSize);
    EXPECT_EQ(writer.listKeys(), (std::vector<std::string>{"a", "b"}));
    EXPECT_FALSE(std::filesystem::exists(temp.path() / "out.blob"));
}

TEST(ContainerWriterTest, RejectsDuplicatesMissingSourcesAndWrongKinds)
{
    ScopedTempDir temp("writer_errors");
    writeBinaryFile(temp.path() / "src" / "file.txt", "content");

    blobkit::container::ContainerWriter writer(ContainerKind::Application, temp.path() / "out.blob");
    writer.addEntry("app", temp.path() / "src", application());

    EXPECT_THROW(writer.addEntry("app", temp.path() / "src", application()), blobkit::DuplicateKeyError);
    EXPECT_THROW(writer.addEntry("ghost", temp.path() / "missing", application()), blobkit::SourceNotFoundError);
    EXPECT_THROW(writer.addEntry("bin", temp.path() / "src", blobkit::container::BinaryEntry {}), std::invalid_argument);
    EXPECT_THROW(writer.removeEntry("ghost"), blobkit::NotFoundError);
    EXPECT_EQ(writer.index().size(), 1U);

    EXPECT_THROW(blobkit::container::ContainerWriter(ContainerKind::Application, temp.path() / "x.blob", 11),
                 std::invalid_argument);
}

TEST(ContainerWriterTest, BinaryEntriesAreClassified)
{
    ScopedTempDir temp("writer_binary");
    const auto source = temp.path() / "pg";
    writeBinaryFile(source / "bin" / "psql", "elf");
    writeBinaryFile(source / "lib" / "libpq.so.5", "lib");
    std::filesystem::permissions(source / "bin" / "psql", std::filesystem::perms::owner_exec,
                                 std::filesystem::perm_options::add);

    blobkit::container::BinaryEntry prototype {};
    prototype.provides = {"psql"};
    blobkit::container::ContainerWriter writer(ContainerKind::Binary, temp.path() / "bin.blob");
    const auto& entry = std::get<blobkit::container::BinaryEntry>(writer.addEntry("pg", source, prototype));

    EXPECT_EQ(entry.executables, (std::vector<std::string>{"bin/psql"}));
    EXPECT_EQ(entry.libraries, (std::vector<std::string>{"lib/libpq.so.5"}));
    EXPECT_EQ(entry.provides, (std::vector<std::string>{"psql"}));
}

TEST(ContainerRoundTripTest, ExtractRestoresSourceTree)
{
    ScopedTempDir temp("roundtrip");
    const auto blob = buildCatalog(temp.path());

    blobkit::container::ContainerReader reader(blob, ContainerKind::Application);
    EXPECT_EQ(reader.kind(), ContainerKind::Application);
    EXPECT_EQ(reader.listKeys(), (std::vector<std::string>{"shared-lib", "db-client"}));
    EXPECT_FALSE(reader.createdAt().empty());

    const auto& meta = std::get<blobkit::container::ApplicationEntry>(reader.getMetadata("db-client"));
    EXPECT_EQ(meta.version, "1.2.3");
    EXPECT_EQ(meta.record.dependencies, (std::vector<std::string>{"shared-lib"}));
    EXPECT_THROW(reader.getMetadata("nope"), blobkit::NotFoundError);

    const auto destination = reader.extract("db-client", temp.path() / "out");
    EXPECT_EQ(destination.string(), (temp.path() / "out" / "db-client").string());

    const auto source = temp.path() / "src" / "db-client";
    const auto files = collectFiles(source);
    ASSERT_EQ(files, collectFiles(destination));
    for (const auto& relative : files) {
        EXPECT_EQ(readBinaryFile(source / relative), readBinaryFile(destination / relative));
    }

    const auto bytes = reader.extractToMemory("shared-lib");
    EXPECT_EQ(bytes, blobkit::archive::packTree(temp.path() / "src" / "shared-lib"));

    EXPECT_THROW(reader.extract("nope", temp.path() / "out"), blobkit::NotFoundError);
}

TEST(ContainerRoundTripTest, EmptyContainerHasNoEntries)
{
    ScopedTempDir temp("empty_container");
    const auto blob = temp.path() / "empty.blob";
    blobkit::container::ContainerWriter writer(ContainerKind::UserData, blob);
    const auto summary = writer.build();

    EXPECT_EQ(summary.entryCount, 0U);
    EXPECT_EQ(summary.dataSize, 0U);
    EXPECT_EQ(summary.totalSize, std::filesystem::file_size(blob));

    blobkit::container::ContainerReader reader(blob);
    EXPECT_EQ(reader.kind(), ContainerKind::UserData);
    EXPECT_TRUE(reader.listKeys().empty());
    EXPECT_TRUE(reader.verifyAll().allValid());
}

TEST(ContainerReaderTest, OpenValidatesEagerly)
{
    ScopedTempDir temp("reader_open");
    const auto blob = buildCatalog(temp.path());

    EXPECT_THROW(blobkit::container::ContainerReader(blob, ContainerKind::Binary), blobkit::FormatError);
    EXPECT_THROW(blobkit::container::ContainerReader(temp.path() / "missing.blob", ContainerKind::Application),
                 std::filesystem::filesystem_error);

    const auto garbage = temp.path() / "garbage.blob";
    writeBinaryFile(garbage, "this is not a container at all");
    EXPECT_THROW(blobkit::container::ContainerReader(garbage, ContainerKind::Application), blobkit::FormatError);

    const auto truncated = temp.path() / "truncated.blob";
    writeBinaryFile(truncated, readBinaryFile(blob).substr(0, 40));
    EXPECT_THROW(blobkit::container::ContainerReader(truncated, ContainerKind::Application), blobkit::FormatError);
}

TEST(ContainerReaderTest, CorruptedPayloadFailsVerificationAndLeavesDestinationUntouched)
{
    ScopedTempDir temp("reader_corrupt");
    const auto blob = buildCatalog(temp.path());

    std::uint64_t position = 0;
    std::uint64_t compressedSize = 0;
    {
        blobkit::container::ContainerReader reader(blob, ContainerKind::Application);
        const auto& entry = blobkit::container::record(reader.getMetadata("db-client"));
        position = reader.payloadOffset() + entry.offset + entry.compressedSize / 2;
        compressedSize = entry.compressedSize;
    }
    ASSERT_GT(compressedSize, 0U);
    flipPayloadByte(blob, position);

    blobkit::container::ContainerReader reader(blob, ContainerKind::Application);
    const auto destination = temp.path() / "out";
    EXPECT_THROW(reader.extract("db-client", destination), blobkit::ContainerError);
    EXPECT_FALSE(std::filesystem::exists(destination / "db-client"));
    EXPECT_THROW(reader.extractToMemory("db-client"), blobkit::ContainerError);

    const auto verification = reader.verifyAll();
    EXPECT_FALSE(verification.allValid());
    ASSERT_EQ(verification.results.size(), 2U);
    EXPECT_TRUE(verification.results[0].valid);
    EXPECT_FALSE(verification.results[1].valid);

    EXPECT_NO_THROW(reader.verify("shared-lib"));
    EXPECT_NO_THROW(reader.extract("shared-lib", destination));
}

TEST(ContainerReaderTest, ChecksumMismatchIsIntegrityError)
{
    ScopedTempDir temp("reader_checksum");
    writeBinaryFile(temp.path() / "src" / "a.txt", "original content");
    const auto blob = temp.path() / "apps.blob";
    {
        blobkit::container::ContainerWriter writer(ContainerKind::Application, blob);
        writer.addEntry("app", temp.path() / "src", application());
        writer.build();
    }

    // Rewrite the stored checksum so decompression succeeds but verification fails.
    auto bytes = readBinaryFile(blob);
    blobkit::container::ContainerReader original(blob, ContainerKind::Application);
    const auto checksum = blobkit::container::record(original.getMetadata("app")).checksum;
    const auto at = bytes.find(checksum);
    ASSERT_NE(at, std::string::npos);
    bytes.replace(at, checksum.size(), std::string(64, '0'));
    writeBinaryFile(blob, bytes);

    blobkit::container::ContainerReader reader(blob, ContainerKind::Application);
    EXPECT_THROW(reader.extract("app", temp.path() / "out"), blobkit::IntegrityError);
    EXPECT_FALSE(std::filesystem::exists(temp.path() / "out" / "app"));
    EXPECT_NO_THROW(reader.extract("app", temp.path() / "unchecked", false));
    EXPECT_EQ(readBinaryFile(temp.path() / "unchecked" / "app" / "a.txt"), "original content");
}

TEST(ContainerReaderTest, SlicePastEndOfFileIsIntegrityError)
{
    ScopedTempDir temp("reader_short");
    const auto blob = buildCatalog(temp.path());
    const auto bytes = readBinaryFile(blob);
    writeBinaryFile(blob, bytes.substr(0, bytes.size() - 3));

    blobkit::container::ContainerReader reader(blob, ContainerKind::Application);
    EXPECT_THROW(reader.extract("db-client", temp.path() / "out"), blobkit::IntegrityError);
    EXPECT_FALSE(std::filesystem::exists(temp.path() / "out" / "db-client"));
}

TEST(ContainerReaderTest, ExtractManyResolvesDependencies)
{
    ScopedTempDir temp("extract_many");
    const auto blob = buildCatalog(temp.path());
    blobkit::container::ContainerReader reader(blob, ContainerKind::Application);

    const auto withDeps = temp.path() / "with";
    const auto resolved = reader.extractMany({"db-client"}, withDeps, true, true);
    EXPECT_TRUE(resolved.succeeded());
    EXPECT_EQ(resolved.results.size(), 2U);
    EXPECT_TRUE(std::filesystem::exists(withDeps / "db-client" / "bin" / "db"));
    EXPECT_TRUE(std::filesystem::exists(withDeps / "shared-lib" / "lib" / "libshared.so"));

    const auto withoutDeps = temp.path() / "without";
    const auto direct = reader.extractMany({"db-client"}, withoutDeps, false, true);
    EXPECT_TRUE(direct.succeeded());
    ASSERT_EQ(direct.results.size(), 1U);
    EXPECT_TRUE(std::filesystem::exists(withoutDeps / "db-client"));
    EXPECT_FALSE(std::filesystem::exists(withoutDeps / "shared-lib"));
}

TEST(ContainerReaderTest, ExtractManyIsolatesFailures)
{
    ScopedTempDir temp("extract_many_failures");
    const auto blob = buildCatalog(temp.path());
    blobkit::container::ContainerReader reader(blob, ContainerKind::Application);

    const auto report = reader.extractMany({"ghost", "shared-lib"}, temp.path() / "out", false, true);
    EXPECT_FALSE(report.succeeded());
    ASSERT_NE(report.find("ghost"), nullptr);
    EXPECT_FALSE(report.find("ghost")->success);
    EXPECT_FALSE(report.find("ghost")->message.empty());
    ASSERT_NE(report.find("shared-lib"), nullptr);
    EXPECT_TRUE(report.find("shared-lib")->success);
    EXPECT_TRUE(std::filesystem::exists(temp.path() / "out" / "shared-lib"));

    const auto resolved = reader.extractMany({"ghost"}, temp.path() / "resolved", true, true);
    EXPECT_FALSE(resolved.succeeded());
    EXPECT_EQ(resolved.resolution.missing, (std::vector<std::string>{"ghost"}));
}

TEST(ContainerReaderTest, DamagedSizeFieldDoesNotAbortTheBatch)
{
    ScopedTempDir temp("extract_many_damaged_size");
    const auto blob = buildCatalog(temp.path());
    rewriteIndex(blob, ContainerKind::Application, [](nlohmann::ordered_json& document) {
        document["apps"]["db-client"]["size"] = 0xFFFFFFFFFFFFFFF0ULL;
    });

    blobkit::container::ContainerReader reader(blob, ContainerKind::Application);
    const auto report = reader.extractMany({"db-client", "shared-lib"}, temp.path() / "out", false, true);
    ASSERT_EQ(report.results.size(), 2U);
    ASSERT_NE(report.find("shared-lib"), nullptr);
    EXPECT_TRUE(report.find("shared-lib")->success);
    EXPECT_TRUE(std::filesystem::exists(temp.path() / "out" / "shared-lib" / "lib" / "libshared.so"));
    ASSERT_NE(report.find("db-client"), nullptr);
}

TEST(ContainerReaderTest, KindIsSniffedWhenNotGiven)
{
    ScopedTempDir temp("reader_sniff");
    const auto blob = buildCatalog(temp.path());
    blobkit::container::ContainerReader reader(blob);
    EXPECT_EQ(reader.kind(), ContainerKind::Application);
    EXPECT_EQ(reader.listKeys().size(), 2U);
}

TEST(ContainerReaderTest, OpenReaderKeepsReadingTheFileItIndexed)
{
    ScopedTempDir temp("reader_inode");
    const auto blob = buildCatalog(temp.path());
    blobkit::container::ContainerReader reader(blob, ContainerKind::Application);

    writeBinaryFile(temp.path() / "src" / "other" / "x.txt", "replacement");
    blobkit::container::ContainerWriter replacement(ContainerKind::Application, blob);
    replacement.addEntry("other", temp.path() / "src" / "other", application());
    replacement.build();

    EXPECT_NO_THROW(reader.extract("db-client", temp.path() / "out"));
    EXPECT_TRUE(std::filesystem::exists(temp.path() / "out" / "db-client" / "etc" / "db.conf"));

    blobkit::container::ContainerReader fresh(blob, ContainerKind::Application);
    EXPECT_EQ(fresh.listKeys(), (std::vector<std::string>{"other"}));
}

TEST(ContainerWriterTest, LoadExistingAppendsAfterPreviousPayload)
{
    ScopedTempDir temp("writer_load");
    const auto blob = buildCatalog(temp.path());
    const auto sizeBefore = std::filesystem::file_size(blob);

    auto writer = blobkit::container::ContainerWriter::loadExisting(blob, ContainerKind::Application);
    EXPECT_EQ(writer.listKeys(), (std::vector<std::string>{"shared-lib", "db-client"}));
    const auto payloadBefore = writer.payloadSize();

    writeBinaryFile(temp.path() / "src" / "cli" / "cli.txt", "command line");
    const auto& added = blobkit::container::record(writer.addEntry("cli", temp.path() / "src" / "cli", application()));
    EXPECT_EQ(added.offset, payloadBefore);
    writer.build();
    EXPECT_GT(std::filesystem::file_size(blob), sizeBefore);

    blobkit::container::ContainerReader reader(blob, ContainerKind::Application);
    EXPECT_TRUE(reader.verifyAll().allValid());
    EXPECT_EQ(reader.listKeys().size(), 3U);

    EXPECT_THROW(blobkit::container::ContainerWriter::loadExisting(blob, ContainerKind::UserData), blobkit::FormatError);
}

TEST(ContainerWriterTest, CompactReclaimsOrphanedBytes)
{
    ScopedTempDir temp("writer_compact");
    const auto blob = buildCatalog(temp.path());

    auto writer = blobkit::container::ContainerWriter::loadExisting(blob, ContainerKind::Application);
    const auto removedSize = blobkit::container::record(writer.getMetadata("shared-lib")).compressedSize;
    const auto payloadBefore = writer.payloadSize();
    writer.removeEntry("shared-lib");
    EXPECT_EQ(writer.orphanedBytes(), removedSize);

    const auto sizeBefore = std::filesystem::file_size(blob);
    const auto summary = writer.build();
    EXPECT_EQ(summary.orphanedBytes, removedSize);
    EXPECT_EQ(summary.dataSize, payloadBefore);

    EXPECT_EQ(writer.compact(), removedSize);
    EXPECT_EQ(writer.orphanedBytes(), 0U);
    EXPECT_EQ(blobkit::container::record(writer.getMetadata("db-client")).offset, 0U);
    writer.build();

    blobkit::container::ContainerReader reader(blob, ContainerKind::Application);
    EXPECT_TRUE(reader.verifyAll().allValid());
    EXPECT_NO_THROW(reader.extract("db-client", temp.path() / "out"));
    EXPECT_LT(std::filesystem::file_size(blob), sizeBefore);
}
