#pragma once

#include "container/container_kind.hpp"
#include "container/container_reader.hpp"
#include "container/container_writer.hpp"
#include "container/dependency_resolver.hpp"
#include "container/entry.hpp"
#include "container/entry_index.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace blobkit::report {

inline constexpr std::size_t kInfoFileLimit = 20;

// 1234567 -> "1,234,567"
std::string groupDigits(std::uint64_t value);

void printBuildSummary(std::ostream& out, container::ContainerKind kind, const std::filesystem::path& path,
                       const container::EntryIndex& index, const container::BuildSummary& summary);
void printEntryList(std::ostream& out, const container::EntryIndex& index, const std::filesystem::path& source);
void printEntryInfo(std::ostream& out, const container::Entry& entry);
void printExtractionReport(std::ostream& out, const container::ExtractionReport& report);
void printVerificationReport(std::ostream& out, const container::VerificationReport& report);
void printDependencyTree(std::ostream& out, const container::DependencyNode& root);

} // namespace blobkit::report
