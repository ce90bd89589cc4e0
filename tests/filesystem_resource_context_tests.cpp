#include "filesystem/resource_context.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

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

void writeFile(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

std::vector<std::string> toRelativeList(const std::vector<blobkit::filesystem::FileDescriptor>& entries)
{
    std::vector<std::string> names;
    for (const auto& entry : entries) {
        names.push_back(entry.relativePath.generic_string());
    }
    return names;
}

} // namespace

TEST(FileContextTest, ReadAndCopy)
{
    ScopedTempDir temp("file_context");
    const auto source = temp.path() / "original.bin";

    const std::string payload = "abcdefghijklmnopqrstuvwxyz";
    writeFile(source, payload);

    EXPECT_THROW(blobkit::filesystem::FileContext(temp.path()), std::invalid_argument);
    EXPECT_THROW(blobkit::filesystem::FileContext(temp.path() / "missing.bin"), std::filesystem::filesystem_error);

    blobkit::filesystem::FileContext file(source);
    EXPECT_EQ(file.descriptor().size, payload.size());

    const auto allData = file.readAll();
    ASSERT_EQ(allData.size(), payload.size());
    EXPECT_TRUE(std::equal(payload.begin(), payload.end(), allData.begin()));

    const auto copied = temp.path() / "nested" / "duplicated.bin";
    file.copyTo(copied);
    std::ifstream copiedStream(copied, std::ios::binary);
    std::string copiedContent((std::istreambuf_iterator<char>(copiedStream)), std::istreambuf_iterator<char>());
    EXPECT_EQ(copiedContent, payload);
}

TEST(FileContextTest, ReportsOwnerExecutableBit)
{
    ScopedTempDir temp("file_context_exec");
    const auto script = temp.path() / "run.sh";
    const auto data = temp.path() / "data.txt";
    writeFile(script, "#!/bin/sh\n");
    writeFile(data, "plain");

    std::filesystem::permissions(script, std::filesystem::perms::owner_exec, std::filesystem::perm_options::add);
    std::filesystem::permissions(data, std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec
                                           | std::filesystem::perms::others_exec,
                                 std::filesystem::perm_options::remove);

    EXPECT_TRUE(blobkit::filesystem::isOwnerExecutable(blobkit::filesystem::describePath(script)));
    EXPECT_FALSE(blobkit::filesystem::isOwnerExecutable(blobkit::filesystem::describePath(data)));
    EXPECT_FALSE(blobkit::filesystem::isOwnerExecutable(blobkit::filesystem::describePath(temp.path())));
}

TEST(DirectoryContextTest, ListsEntriesSorted)
{
    ScopedTempDir temp("dir_context");
    const auto root = temp.path();
    const auto subdir = root / "sub";
    std::filesystem::create_directories(subdir);

    writeFile(root / "z.txt", "zeta");
    writeFile(root / "a.txt", "alpha");
    writeFile(subdir / "c.txt", "gamma");
    writeFile(subdir / "b.txt", "beta");

    blobkit::filesystem::DirectoryContext directory(root);

    EXPECT_EQ(toRelativeList(directory.listEntries(false, true)), (std::vector<std::string>{"a.txt", "sub", "z.txt"}));
    EXPECT_EQ(toRelativeList(directory.listEntries(false, false)), (std::vector<std::string>{"a.txt", "z.txt"}));
    EXPECT_EQ(toRelativeList(directory.listEntries(true, false)),
              (std::vector<std::string>{"a.txt", "sub/b.txt", "sub/c.txt", "z.txt"}));
    EXPECT_EQ(toRelativeList(directory.listEntries(true, true)),
              (std::vector<std::string>{"a.txt", "sub", "sub/b.txt", "sub/c.txt", "z.txt"}));
}

TEST(DirectoryContextTest, ReportsSymlinksWithoutFollowingThem)
{
    ScopedTempDir temp("dir_context_links");
    const auto root = temp.path() / "root";
    const auto outside = temp.path() / "outside";
    std::filesystem::create_directories(root);
    std::filesystem::create_directories(outside);
    writeFile(outside / "secret.txt", "hidden");
    std::filesystem::create_directory_symlink(outside, root / "link");

    blobkit::filesystem::DirectoryContext directory(root);
    const auto entries = directory.listEntries(true, true);

    ASSERT_EQ(entries.size(), 1U);
    EXPECT_EQ(entries.front().relativePath.generic_string(), "link");
    EXPECT_TRUE(entries.front().isSymlink);
}
