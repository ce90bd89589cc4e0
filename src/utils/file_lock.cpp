#include "utils/file_lock.hpp"

#include "utils/file_io.hpp"

#include <cerrno>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace blobkit::utils {

FileLock::FileLock(const std::filesystem::path& target, LockMode mode)
    : mode_(mode)
{
    const auto lockPath = lockPathFor(target);
    ensureParentDirectory(lockPath);

    fd_ = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw std::filesystem::filesystem_error(
            "open lock file", lockPath, std::error_code(errno, std::generic_category()));
    }

    const int operation = mode == LockMode::Exclusive ? LOCK_EX : LOCK_SH;
    int result = 0;
    do {
        result = ::flock(fd_, operation);
    } while (result != 0 && errno == EINTR);

    if (result != 0) {
        const auto error = std::error_code(errno, std::generic_category());
        ::close(fd_);
        fd_ = -1;
        throw std::filesystem::filesystem_error("flock", lockPath, error);
    }
}

FileLock::~FileLock()
{
    release();
}

FileLock::FileLock(FileLock&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , mode_(other.mode_)
{
}

FileLock& FileLock::operator=(FileLock&& other) noexcept
{
    if (this != &other) {
        release();
        fd_ = std::exchange(other.fd_, -1);
        mode_ = other.mode_;
    }
    return *this;
}

std::filesystem::path FileLock::lockPathFor(const std::filesystem::path& target)
{
    auto lockPath = target;
    lockPath += ".lock";
    return lockPath;
}

void FileLock::release() noexcept
{
    if (fd_ < 0) {
        return;
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

} // namespace blobkit::utils
