#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Thin wrappers over libavutil's base64 routines
std::string base64_encode(const std::vector<uint8_t>& data);

// Throws EncodingError on malformed input
std::vector<uint8_t> base64_decode(const std::string& text);
