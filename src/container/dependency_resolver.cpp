#include "container/dependency_resolver.hpp"

#include "utils/log.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>
#include <utility>

namespace blobkit::container {
namespace {

DependencyNode buildNode(const EntryIndex& index, const std::string& key, std::vector<std::string>& path)
{
    DependencyNode node {};
    node.key = key;

    if (std::find(path.begin(), path.end(), key) != path.end()) {
        node.cycle = true;
        return node;
    }

    const auto* entry = index.find(key);
    if (entry == nullptr) {
        node.missing = true;
        return node;
    }

    path.push_back(key);
    for (const auto& dependency : record(*entry).dependencies) {
        node.children.push_back(buildNode(index, dependency, path));
    }
    path.pop_back();
    return node;
}

} // namespace

Resolution resolveDependencies(const EntryIndex& index, const std::vector<std::string>& keys)
{
    Resolution resolution {};
    std::unordered_set<std::string> visited;
    std::deque<std::string> queue(keys.begin(), keys.end());

    while (!queue.empty()) {
        auto key = std::move(queue.front());
        queue.pop_front();
        if (!visited.insert(key).second) {
            continue;
        }

        const auto* entry = index.find(key);
        if (entry == nullptr) {
            utils::logWarning("Dependency '" + key + "' not found");
            resolution.missing.push_back(std::move(key));
            continue;
        }

        for (const auto& dependency : record(*entry).dependencies) {
            if (visited.count(dependency) == 0U) {
                queue.push_back(dependency);
            }
        }
        resolution.keys.push_back(std::move(key));
    }

    return resolution;
}

DependencyNode dependencyTree(const EntryIndex& index, const std::string& key)
{
    std::vector<std::string> path;
    return buildNode(index, key, path);
}

} // namespace blobkit::container
