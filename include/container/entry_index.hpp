#pragma once

#include "container/container_kind.hpp"
#include "container/entry.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace blobkit::container {

// Key -> Entry mapping with unique keys. Lookup is O(1); iteration follows
// insertion order, which is also the order entries are written to the index.
class EntryIndex {
public:
    using const_iterator = std::vector<Entry>::const_iterator;

    // References stay valid until the next insert or erase.
    const Entry& insert(Entry entry);
    // Overwrites the entry with the same key in place, keeping its position.
    const Entry& replace(Entry entry);
    void erase(const std::string& key);

    const Entry* find(const std::string& key) const noexcept;
    Entry* find(const std::string& key) noexcept;
    const Entry& at(const std::string& key) const;
    bool contains(const std::string& key) const noexcept;

    std::vector<std::string> keys() const;
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> positions_;
};

struct ParsedIndex {
    EntryIndex index;
    std::string createdAt;
};

std::string serializeIndex(const EntryIndex& index, ContainerKind kind, const std::string& createdAt);

// Throws IndexParseError; never returns a partially filled index.
ParsedIndex parseIndex(ContainerKind kind, const std::string& text);

} // namespace blobkit::container
