#include "container/dependency_resolver.hpp"
#include "container/entry.hpp"
#include "container/entry_index.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace {

void addEntry(blobkit::container::EntryIndex& index, const std::string& key, const std::vector<std::string>& dependencies)
{
    blobkit::container::ApplicationEntry entry {};
    entry.record.key = key;
    entry.record.dependencies = dependencies;
    index.insert(entry);
}

blobkit::container::EntryIndex sampleIndex()
{
    blobkit::container::EntryIndex index;
    addEntry(index, "web", {"api", "shared-lib"});
    addEntry(index, "api", {"shared-lib", "db-client"});
    addEntry(index, "db-client", {"shared-lib"});
    addEntry(index, "shared-lib", {});
    addEntry(index, "tool", {"Z"});
    return index;
}

} // namespace

TEST(DependencyResolverTest, ClosureIsBreadthFirstAndDuplicateFree)
{
    const auto index = sampleIndex();
    const auto resolution = blobkit::container::resolveDependencies(index, {"web"});

    EXPECT_EQ(resolution.keys, (std::vector<std::string>{"web", "api", "shared-lib", "db-client"}));
    EXPECT_TRUE(resolution.missing.empty());
}

TEST(DependencyResolverTest, ResolutionIsIdempotent)
{
    const auto index = sampleIndex();
    const auto once = blobkit::container::resolveDependencies(index, {"api", "db-client"});
    const auto twice = blobkit::container::resolveDependencies(index, once.keys);

    auto first = once.keys;
    auto second = twice.keys;
    std::sort(first.begin(), first.end());
    std::sort(second.begin(), second.end());
    EXPECT_EQ(first, second);
}

TEST(DependencyResolverTest, MissingDependencyIsSkipped)
{
    const auto index = sampleIndex();
    const auto resolution = blobkit::container::resolveDependencies(index, {"tool"});

    EXPECT_EQ(resolution.keys, (std::vector<std::string>{"tool"}));
    EXPECT_EQ(resolution.missing, (std::vector<std::string>{"Z"}));
}

TEST(DependencyResolverTest, CyclesTerminate)
{
    blobkit::container::EntryIndex index;
    addEntry(index, "a", {"b"});
    addEntry(index, "b", {"c"});
    addEntry(index, "c", {"a"});

    const auto resolution = blobkit::container::resolveDependencies(index, {"b"});
    EXPECT_EQ(resolution.keys, (std::vector<std::string>{"b", "c", "a"}));

    const auto tree = blobkit::container::dependencyTree(index, "a");
    EXPECT_EQ(tree.key, "a");
    ASSERT_EQ(tree.children.size(), 1U);
    ASSERT_EQ(tree.children[0].children.size(), 1U);
    const auto& repeated = tree.children[0].children[0].children;
    ASSERT_EQ(repeated.size(), 1U);
    EXPECT_EQ(repeated[0].key, "a");
    EXPECT_TRUE(repeated[0].cycle);
    EXPECT_TRUE(repeated[0].children.empty());
}

TEST(DependencyResolverTest, TreeMarksMissingKeys)
{
    const auto index = sampleIndex();
    const auto tree = blobkit::container::dependencyTree(index, "tool");
    ASSERT_EQ(tree.children.size(), 1U);
    EXPECT_EQ(tree.children[0].key, "Z");
    EXPECT_TRUE(tree.children[0].missing);

    const auto shared = blobkit::container::dependencyTree(index, "web");
    EXPECT_EQ(shared.children.size(), 2U);
    EXPECT_FALSE(shared.children[1].cycle);
}
