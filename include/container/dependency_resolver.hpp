#pragma once

#include "container/entry_index.hpp"

#include <string>
#include <vector>

namespace blobkit::container {

struct Resolution {
    // Requested keys plus their transitive dependencies, each at most once,
    // in the order they were reached.
    std::vector<std::string> keys;
    // Keys named somewhere in the closure but absent from the index.
    std::vector<std::string> missing;
};

// Breadth-first over dependencies. Missing keys are logged as warnings and
// skipped. No install ordering is implied.
Resolution resolveDependencies(const EntryIndex& index, const std::vector<std::string>& keys);

struct DependencyNode {
    std::string key;
    bool missing {false};
    // Set when key already appears higher up the same branch.
    bool cycle {false};
    std::vector<DependencyNode> children;
};

DependencyNode dependencyTree(const EntryIndex& index, const std::string& key);

} // namespace blobkit::container
