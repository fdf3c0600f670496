#ifndef QRDRIVE_ARCHIVER_HPP
#define QRDRIVE_ARCHIVER_HPP

#include <cstdint>
#include <string>
#include <vector>

// Single-file gzip container; the entry name travels in the gzip header
constexpr const char* ARCHIVE_EXTENSION = ".gz";

struct ArchiveEntry {
    std::string name;  // empty when the producer stored none
    std::vector<uint8_t> content;
};

std::vector<uint8_t> pack_archive(const std::vector<uint8_t>& content, const std::string& entry_name);

// Reads source_path (InputNotFound if absent) and packs it under its basename
std::vector<uint8_t> pack_archive_file(const std::string& source_path);

// Throws ArchiveUnpackFailure on a corrupt or truncated stream
ArchiveEntry unpack_archive(const std::vector<uint8_t>& archive);

// Expands archive_path next to itself (gunzip naming: ".gz" stripped),
// removes the archive and returns the extracted paths
std::vector<std::string> unpack_archive_file(const std::string& archive_path);

#endif // QRDRIVE_ARCHIVER_HPP
