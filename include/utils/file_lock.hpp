#pragma once

#include <filesystem>

namespace blobkit::utils {

enum class LockMode {
    Shared,
    Exclusive
};

// Advisory flock(2) on "<target>.lock". Blocks until the lock is granted and
// releases it on destruction. Cooperating blobkit processes only.
class FileLock {
public:
    FileLock(const std::filesystem::path& target, LockMode mode);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    LockMode mode() const noexcept { return mode_; }

    static std::filesystem::path lockPathFor(const std::filesystem::path& target);

private:
    void release() noexcept;

    int fd_ {-1};
    LockMode mode_ {LockMode::Shared};
};

} // namespace blobkit::utils
