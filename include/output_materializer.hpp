#pragma once
#include "frame_reassembler.hpp"
#include <cstdint>
#include <string>
#include <vector>

constexpr const char* DEFAULT_OUTPUT_NAME = "unknownfile.txt";

struct MaterializedFile {
    std::string path;                     // file written from the decoded stream
    std::vector<std::string> extracted;   // files unpacked from it (archived streams)
};

// Reverses the text-safe transform; the archive (if any) stays packed
std::vector<uint8_t> decode_payload(const ReassembledFile& file);

// Embedded/overridden name, default name when absent, archive extension when archived
std::string output_name(const ReassembledFile& file);

// Writes the decoded bytes into directory and expands archives in place.
// ArchiveUnpackFailure leaves the archive file on disk.
MaterializedFile materialize_output(const ReassembledFile& file, const std::string& directory);
