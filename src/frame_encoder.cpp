#include "frame_encoder.hpp"
#include "archiver.hpp"
#include "base64_codec.hpp"
#include "drive_errors.hpp"
#include "file_io.hpp"
#include <algorithm>
#include <iostream>

static bool is_text_byte(uint8_t b) {
    return (b >= 0x20 && b <= 0x7E) || b == '\t' || b == '\n' || b == '\r' || b == '\f' || b == '\v';
}

bool is_binary_content(const std::vector<uint8_t>& content) {
    return !std::all_of(content.begin(), content.end(), is_text_byte);
}

EncodedStream prepare_stream(const std::vector<uint8_t>& content,
                             const std::string& name,
                             bool want_archive) {
    EncodedStream stream;
    stream.header.file_name = path_basename(name);

    const std::string& base = stream.header.file_name;
    if (base.find(frame_grammar::NAME_OPEN) != std::string::npos ||
        base.find(frame_grammar::NAME_CLOSE) != std::string::npos)
        throw EncodingError("File name '" + base + "' contains a frame delimiter");

    const std::vector<uint8_t>* source = &content;
    std::vector<uint8_t> archived;
    if (want_archive) {
        archived = pack_archive(content, base);
        source = &archived;
        stream.header.is_archived = true;
        std::cout << "[ENCODER] Archived " << content.size() << " -> " << archived.size() << " bytes\n";
    }

    if (is_binary_content(*source)) {
        std::cout << "[ENCODER] Binary content, encoding as base64 text\n";
        stream.header.is_binary = true;
        stream.body = base64_encode(*source);
    } else {
        std::cout << "[ENCODER] Text content, encoding directly\n";
        stream.body.assign(source->begin(), source->end());
    }

    // Both branches must leave a pure text stream behind
    if (!std::all_of(stream.body.begin(), stream.body.end(),
                     [](char c) { return is_text_byte(static_cast<uint8_t>(c)); }))
        throw EncodingError("Content cannot be represented as frame text");

    return stream;
}

std::vector<std::string> slice_stream(const EncodedStream& stream, std::size_t capacity) {
    std::vector<std::string> frames;
    const std::string& body = stream.body;

    std::string frame = serialize_header(stream.header) + serialize_index_marker(0);
    if (frame.size() > capacity)
        throw EncodingError("Capacity " + std::to_string(capacity) +
                            " cannot hold the frame header (" + std::to_string(frame.size()) + " bytes)");

    frames.reserve(body.size() / capacity + 1);

    size_t offset = 0;
    size_t index = 0;
    while (true) {
        size_t take = std::min(capacity - frame.size(), body.size() - offset);
        frame.append(body, offset, take);
        offset += take;
        frames.push_back(std::move(frame));

        if (offset >= body.size()) break;

        frame = serialize_index_marker(++index);
        if (frame.size() >= capacity)
            throw EncodingError("Capacity " + std::to_string(capacity) +
                                " cannot hold index marker " + std::to_string(index));
    }

    return frames;
}

std::vector<std::string> encode_frames(const std::vector<uint8_t>& content,
                                       const std::string& name,
                                       std::size_t capacity,
                                       bool want_archive) {
    EncodedStream stream = prepare_stream(content, name, want_archive);
    auto frames = slice_stream(stream, capacity);
    std::cout << "[ENCODER] " << stream.body.size() << " bytes -> " << frames.size()
              << " frame(s) of at most " << capacity << " bytes\n";
    return frames;
}
