#include "frame_codec.hpp"
#include <cctype>
#include <limits>

using namespace frame_grammar;

bool FrameTokenizer::consume(std::string_view literal) {
    if (rest_.substr(0, literal.size()) != literal)
        return false;
    rest_.remove_prefix(literal.size());
    return true;
}

std::optional<std::string> FrameTokenizer::consume_file_name() {
    if (rest_.substr(0, NAME_OPEN.size()) != NAME_OPEN)
        return std::nullopt;

    std::string_view body = rest_.substr(NAME_OPEN.size());
    size_t close = body.find(NAME_CLOSE);
    if (close == std::string_view::npos)
        return std::nullopt;

    std::string name(body.substr(0, close));
    rest_ = body.substr(close + NAME_CLOSE.size());
    return name;
}

std::optional<std::uint32_t> FrameTokenizer::consume_index_marker() {
    if (rest_.substr(0, INDEX_OPEN.size()) != INDEX_OPEN)
        return std::nullopt;

    size_t pos = INDEX_OPEN.size();
    std::uint64_t value = 0;
    size_t digits = 0;
    while (pos < rest_.size() && std::isdigit(static_cast<unsigned char>(rest_[pos]))) {
        value = value * 10 + static_cast<std::uint64_t>(rest_[pos] - '0');
        if (value > std::numeric_limits<std::uint32_t>::max())
            return std::nullopt;
        ++pos;
        ++digits;
    }
    if (digits == 0 || rest_.substr(pos, INDEX_CLOSE.size()) != INDEX_CLOSE)
        return std::nullopt;

    rest_.remove_prefix(pos + INDEX_CLOSE.size());
    return static_cast<std::uint32_t>(value);
}

bool FrameTokenizer::at_header() const {
    return rest_.substr(0, BINARY_FLAG.size()) == BINARY_FLAG ||
           rest_.substr(0, ARCHIVE_FLAG.size()) == ARCHIVE_FLAG ||
           rest_.substr(0, NAME_OPEN.size()) == NAME_OPEN;
}

std::string serialize_header(const FrameHeader& header) {
    std::string out;
    if (header.is_binary) out += BINARY_FLAG;
    if (header.is_archived) out += ARCHIVE_FLAG;
    out += NAME_OPEN;
    out += header.file_name;
    out += NAME_CLOSE;
    return out;
}

std::string serialize_index_marker(std::size_t index) {
    std::string out(INDEX_OPEN);
    out += std::to_string(index);
    out += INDEX_CLOSE;
    return out;
}

ParsedFrame parse_frame(std::string_view text, bool first_frame) {
    ParsedFrame frame;
    FrameTokenizer tok(text);

    if (first_frame) {
        // Some producers tag frame 0 before its header as well as after it
        FrameTokenizer probe = tok;
        std::optional<std::uint32_t> leading = probe.consume_index_marker();
        if (leading && probe.at_header())
            tok = probe;
        else
            leading.reset();

        frame.is_binary = tok.consume(BINARY_FLAG);
        frame.is_archived = tok.consume(ARCHIVE_FLAG);
        frame.file_name = tok.consume_file_name();

        frame.declared_index = tok.consume_index_marker();
        if (!frame.declared_index)
            frame.declared_index = leading;
    } else {
        frame.declared_index = tok.consume_index_marker();
    }

    frame.payload = std::string(tok.rest());
    return frame;
}
