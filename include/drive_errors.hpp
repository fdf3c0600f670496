#ifndef QRDRIVE_DRIVE_ERRORS_HPP
#define QRDRIVE_DRIVE_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// Base for every failure raised by the save/load pipelines
class DriveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Source file or expected frame image is absent
class InputNotFound : public DriveError {
public:
    explicit InputNotFound(const std::string& path)
        : DriveError("File \"" + path + "\" does not exist"), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class EncodingError : public DriveError {
public:
    using DriveError::DriveError;
};

// Declared index of a frame disagrees with its arrival position
class FrameIndexMismatch : public DriveError {
public:
    FrameIndexMismatch(std::size_t expected, std::uint32_t declared)
        : DriveError("Frame index " + std::to_string(declared) +
                     " does not match the current index " + std::to_string(expected)),
          expected_(expected), declared_(declared) {}

    std::size_t expected() const { return expected_; }
    std::uint32_t declared() const { return declared_; }

private:
    std::size_t expected_;
    std::uint32_t declared_;
};

// An image yielded zero or several payloads where exactly one was expected
class DecodeAmbiguous : public DriveError {
public:
    DecodeAmbiguous(const std::string& source, std::size_t found)
        : DriveError("Expected one QR code in " + source + ", found " + std::to_string(found)),
          found_(found) {}

    std::size_t found() const { return found_; }

private:
    std::size_t found_;
};

class ArchiveUnpackFailure : public DriveError {
public:
    using DriveError::DriveError;
};

class SessionCancelled : public DriveError {
public:
    using DriveError::DriveError;
};

#endif // QRDRIVE_DRIVE_ERRORS_HPP
