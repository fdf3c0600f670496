#pragma once
#include "frame_codec.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Header plus text-safe body, before slicing
struct EncodedStream {
    FrameHeader header;
    std::string body;
};

// True if any byte falls outside printable ASCII (tab/CR/LF/FF/VT count as text)
bool is_binary_content(const std::vector<uint8_t>& content);

// Archive-wrap (optional) -> base64 (if binary) -> header; name is reduced to its basename
EncodedStream prepare_stream(const std::vector<uint8_t>& content,
                             const std::string& name,
                             bool want_archive);

// Greedy slice; every frame is <= capacity and frame i starts with "::c<i>::"
std::vector<std::string> slice_stream(const EncodedStream& stream, std::size_t capacity);

std::vector<std::string> encode_frames(const std::vector<uint8_t>& content,
                                       const std::string& name,
                                       std::size_t capacity,
                                       bool want_archive);
