#include "utils/file_io.hpp"

#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace blobkit::utils {

void ensureParentDirectory(const std::filesystem::path& path)
{
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw std::filesystem::filesystem_error("create_directories", parent, ec);
    }
}

void writeBufferToFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data)
{
    ensureParentDirectory(path);

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }

    if (!data.empty()) {
        output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!output) {
            throw std::runtime_error("Failed to write file contents: " + path.string());
        }
    }
}

std::vector<std::uint8_t> readFileBytes(const std::filesystem::path& path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }

    input.seekg(0, std::ios::end);
    const auto endPosition = input.tellg();
    if (endPosition < 0) {
        throw std::runtime_error("Failed to determine file size: " + path.string());
    }
    input.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(endPosition));
    if (!data.empty()) {
        input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (input.gcount() != static_cast<std::streamsize>(data.size())) {
            throw std::runtime_error("Failed to read file contents: " + path.string());
        }
    }
    return data;
}

AtomicFileWriter::AtomicFileWriter(std::filesystem::path destination)
    : destination_(std::move(destination))
{
    ensureParentDirectory(destination_);

    temporary_ = destination_;
    temporary_ += ".tmp-" + std::to_string(::getpid());

    output_.open(temporary_, std::ios::binary | std::ios::trunc);
    if (!output_) {
        throw std::runtime_error("Failed to open temporary file for writing: " + temporary_.string());
    }
}

AtomicFileWriter::~AtomicFileWriter()
{
    if (committed_) {
        return;
    }
    if (output_.is_open()) {
        output_.close();
    }
    std::error_code ec;
    std::filesystem::remove(temporary_, ec);
}

std::ostream& AtomicFileWriter::stream() noexcept
{
    return output_;
}

const std::filesystem::path& AtomicFileWriter::temporaryPath() const noexcept
{
    return temporary_;
}

void AtomicFileWriter::commit()
{
    output_.flush();
    if (!output_) {
        throw std::runtime_error("Failed to write file contents: " + temporary_.string());
    }
    output_.close();
    if (output_.fail()) {
        throw std::runtime_error("Failed to close temporary file: " + temporary_.string());
    }

    std::error_code ec;
    std::filesystem::rename(temporary_, destination_, ec);
    if (ec) {
        throw std::filesystem::filesystem_error("rename", temporary_, destination_, ec);
    }
    committed_ = true;
}

} // namespace blobkit::utils
