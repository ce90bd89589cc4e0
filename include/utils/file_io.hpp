#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

namespace blobkit::utils {

void ensureParentDirectory(const std::filesystem::path& path);
void writeBufferToFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data);
std::vector<std::uint8_t> readFileBytes(const std::filesystem::path& path);

// Writes into a sibling temporary file and renames it over the destination on
// commit(). An uncommitted writer removes its temporary file on destruction.
class AtomicFileWriter {
public:
    explicit AtomicFileWriter(std::filesystem::path destination);
    ~AtomicFileWriter();

    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

    std::ostream& stream() noexcept;
    const std::filesystem::path& temporaryPath() const noexcept;

    void commit();

private:
    std::filesystem::path destination_;
    std::filesystem::path temporary_;
    std::ofstream output_;
    bool committed_ {false};
};

} // namespace blobkit::utils
