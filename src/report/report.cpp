#include "report/report.hpp"

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <type_traits>
#include <variant>
#include <vector>

namespace blobkit::report {
namespace {

const std::string kRule(60, '=');

std::string joined(const std::vector<std::string>& values, const char* separator = ", ")
{
    std::string text;
    for (const auto& value : values) {
        if (!text.empty()) {
            text += separator;
        }
        text += value;
    }
    return text;
}

void printField(std::ostream& out, const std::string& label, const std::string& value)
{
    out << std::left << std::setw(21) << (label + ":") << value << "\n";
}

void printKindFields(std::ostream& out, const container::Entry& entry)
{
    std::visit([&out](const auto& alternative) {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, container::ApplicationEntry>) {
            printField(out, "Name", alternative.name);
            printField(out, "Version", alternative.version);
        } else if constexpr (std::is_same_v<T, container::BinaryEntry>) {
            printField(out, "Version", alternative.version);
            printField(out, "Architecture", alternative.architecture);
            printField(out, "OS", alternative.osType);
            printField(out, "Provides", alternative.provides.empty() ? "-" : joined(alternative.provides));
            printField(out, "Executables", std::to_string(alternative.executables.size()));
            printField(out, "Libraries", std::to_string(alternative.libraries.size()));
            if (!alternative.envVars.empty()) {
                out << "\nEnvironment:\n";
                for (const auto& [name, value] : alternative.envVars) {
                    out << "  " << name << "=" << value << "\n";
                }
                out << "\n";
            }
        } else {
            printField(out, "Version", "v" + std::to_string(alternative.revision));
            printField(out, "Quota", alternative.quotaMb ? std::to_string(*alternative.quotaMb) + " MB" : "Unlimited");
            printField(out, "File count", std::to_string(alternative.fileCount));
            printField(out, "Updated", alternative.updatedAt);
        }
    }, entry);
}

void printTreeNode(std::ostream& out, const container::DependencyNode& node, std::size_t depth)
{
    out << std::string(depth * 2, ' ') << (depth == 0 ? "" : "- ") << node.key;
    if (node.missing) {
        out << " (not found)";
    } else if (node.cycle) {
        out << " (cycle)";
    }
    out << "\n";
    for (const auto& child : node.children) {
        printTreeNode(out, child, depth + 1);
    }
}

} // namespace

std::string groupDigits(std::uint64_t value)
{
    auto digits = std::to_string(value);
    for (auto position = static_cast<std::ptrdiff_t>(digits.size()) - 3; position > 0; position -= 3) {
        digits.insert(static_cast<std::size_t>(position), 1, ',');
    }
    return digits;
}

void printBuildSummary(std::ostream& out, container::ContainerKind kind, const std::filesystem::path& path,
                       const container::EntryIndex& index, const container::BuildSummary& summary)
{
    out << "\n" << kRule << "\n"
        << "Built " << container::kindName(kind) << ": " << path.string() << "\n"
        << kRule << "\n"
        << "  Total size: " << groupDigits(summary.totalSize) << " bytes\n"
        << "  Index size: " << groupDigits(summary.indexSize) << " bytes\n"
        << "  Entries:    " << summary.entryCount << "\n"
        << "  Data size:  " << groupDigits(summary.dataSize) << " bytes\n";
    if (summary.orphanedBytes > 0U) {
        out << "  Orphaned:   " << groupDigits(summary.orphanedBytes) << " bytes (run compact to reclaim)\n";
    }

    if (index.empty()) {
        return;
    }
    out << "\n  Breakdown:\n";
    for (const auto& entry : index) {
        const auto& common = container::record(entry);
        out << "    " << common.key << " (" << container::displayVersion(entry) << "): " << groupDigits(common.compressedSize)
            << " bytes";
        if (!common.dependencies.empty()) {
            out << " -> " << joined(common.dependencies);
        }
        out << "\n";
    }
}

void printEntryList(std::ostream& out, const container::EntryIndex& index, const std::filesystem::path& source)
{
    out << "\nEntries in " << source.string() << ":\n\n";
    if (index.empty()) {
        out << "  (none)\n";
        return;
    }

    auto keys = index.keys();
    std::sort(keys.begin(), keys.end());
    for (const auto& key : keys) {
        const auto& entry = index.at(key);
        const auto& common = container::record(entry);
        out << "  " << key << "\n"
            << "    Version: " << container::displayVersion(entry) << "\n"
            << "    Files: " << common.files.size() << "\n"
            << "    Size: " << groupDigits(common.size) << " bytes (compressed: " << groupDigits(common.compressedSize)
            << ")\n";
        if (!common.description.empty()) {
            out << "    Description: " << common.description << "\n";
        }
        if (!common.dependencies.empty()) {
            out << "    Dependencies: " << joined(common.dependencies) << "\n";
        }
        out << "\n";
    }
}

void printEntryInfo(std::ostream& out, const container::Entry& entry)
{
    const auto& common = container::record(entry);

    out << "\nEntry: " << common.key << "\n" << kRule << "\n";
    printKindFields(out, entry);
    if (!common.description.empty()) {
        printField(out, "Description", common.description);
    }
    printField(out, "Size (original)", groupDigits(common.size) + " bytes");
    printField(out, "Size (compressed)", groupDigits(common.compressedSize) + " bytes");

    std::ostringstream ratio;
    ratio << std::fixed << std::setprecision(2) << container::compressionRatio(common) << "x";
    printField(out, "Compression ratio", ratio.str());
    printField(out, "Offset in payload", groupDigits(common.offset) + " bytes");
    printField(out, "Checksum (SHA256)", common.checksum);
    printField(out, "Created", common.createdAt);

    if (!common.dependencies.empty()) {
        out << "\nDependencies:\n";
        for (const auto& dependency : common.dependencies) {
            out << "  - " << dependency << "\n";
        }
    }

    out << "\nFiles (" << common.files.size() << "):\n";
    const auto shown = std::min(common.files.size(), kInfoFileLimit);
    for (std::size_t position = 0; position < shown; ++position) {
        const auto& file = common.files[position];
        out << "  - " << file.path << (file.executable ? " *" : "") << "\n";
    }
    if (common.files.size() > kInfoFileLimit) {
        out << "  ... and " << common.files.size() - kInfoFileLimit << " more\n";
    }
}

void printExtractionReport(std::ostream& out, const container::ExtractionReport& report)
{
    out << "\nRequested: " << joined(report.requested) << "\n";
    if (report.resolution.keys.size() != report.requested.size()) {
        out << "Resolved:  " << joined(report.resolution.keys) << "\n";
    }
    if (!report.resolution.missing.empty()) {
        out << "Missing:   " << joined(report.resolution.missing) << "\n";
    }
    out << "\n";

    std::size_t succeeded = 0;
    for (const auto& result : report.results) {
        if (result.success) {
            ++succeeded;
            out << "  [ok]     " << result.key << " -> " << result.destination.string() << "\n";
        } else {
            out << "  [failed] " << result.key << ": " << result.message << "\n";
        }
    }
    out << "\nExtracted " << succeeded << "/" << report.results.size() << " entries\n";
}

void printVerificationReport(std::ostream& out, const container::VerificationReport& report)
{
    std::size_t valid = 0;
    for (const auto& result : report.results) {
        if (result.valid) {
            ++valid;
            out << "  [ok]     " << result.key << "\n";
        } else {
            out << "  [failed] " << result.key << ": " << result.message << "\n";
        }
    }
    out << "\n" << valid << "/" << report.results.size() << " entries verified\n";
}

void printDependencyTree(std::ostream& out, const container::DependencyNode& root)
{
    printTreeNode(out, root, 0);
}

} // namespace blobkit::report
