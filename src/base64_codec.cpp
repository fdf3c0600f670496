#include "base64_codec.hpp"
#include "drive_errors.hpp"

extern "C" {
#include <libavutil/base64.h>
}

#include <climits>

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return std::string();
    if (data.size() > static_cast<size_t>(INT_MAX / 4 * 3 - 3))
        throw EncodingError("Input too large for base64 encoding");

    const int in_size = static_cast<int>(data.size());
    std::string out(AV_BASE64_SIZE(data.size()), '\0');
    if (!av_base64_encode(&out[0], static_cast<int>(out.size()), data.data(), in_size))
        throw EncodingError("base64 encoding failed");

    out.resize(out.size() - 1); // drop the terminating NUL
    return out;
}

std::vector<uint8_t> base64_decode(const std::string& text) {
    if (text.empty()) return {};
    if (text.size() > static_cast<size_t>(INT_MAX))
        throw EncodingError("Input too large for base64 decoding");

    std::vector<uint8_t> out(AV_BASE64_DECODE_SIZE(text.size()) + 3);
    int written = av_base64_decode(out.data(), text.c_str(), static_cast<int>(out.size()));
    if (written < 0)
        throw EncodingError("Invalid base64 payload");

    out.resize(static_cast<size_t>(written));
    return out;
}
