#pragma once

#include <stdexcept>
#include <string>

namespace blobkit {

class ContainerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Wrong magic tag, or a file too short to hold a header.
class FormatError : public ContainerError {
public:
    using ContainerError::ContainerError;
};

class UnsupportedVersionError : public ContainerError {
public:
    using ContainerError::ContainerError;
};

class IndexParseError : public ContainerError {
public:
    using ContainerError::ContainerError;
};

class NotFoundError : public ContainerError {
public:
    using ContainerError::ContainerError;
};

class DuplicateKeyError : public ContainerError {
public:
    using ContainerError::ContainerError;
};

class CompressionError : public ContainerError {
public:
    using ContainerError::ContainerError;
};

// Checksum mismatch after decompression, or a payload slice outside the file.
class IntegrityError : public ContainerError {
public:
    using ContainerError::ContainerError;
};

class ArchiveError : public ContainerError {
public:
    using ContainerError::ContainerError;
};

class SourceNotFoundError : public ContainerError {
public:
    using ContainerError::ContainerError;
};

} // namespace blobkit
