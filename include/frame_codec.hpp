#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Frame text grammar:
//   frame[0]   := ["b64:"] [":z:"] "::f::" <basename> "::/f::" "::c0::" <payload>
//   frame[i>0] := "::c" <i> "::" <payload>
namespace frame_grammar {
constexpr std::string_view BINARY_FLAG  = "b64:";
constexpr std::string_view ARCHIVE_FLAG = ":z:";
constexpr std::string_view NAME_OPEN    = "::f::";
constexpr std::string_view NAME_CLOSE   = "::/f::";
constexpr std::string_view INDEX_OPEN   = "::c";
constexpr std::string_view INDEX_CLOSE  = "::";
}

struct FrameHeader {
    bool is_binary = false;
    bool is_archived = false;
    std::string file_name;
};

struct ParsedFrame {
    bool is_binary = false;
    bool is_archived = false;
    std::optional<std::string> file_name;        // present only when the name block parsed
    std::optional<std::uint32_t> declared_index; // absent if the marker is missing or malformed
    std::string payload;
};

// Ordered optional-prefix matcher over one frame's text
class FrameTokenizer {
public:
    explicit FrameTokenizer(std::string_view text) : rest_(text) {}

    // Strips literal if the remaining text starts with it
    bool consume(std::string_view literal);

    // "::f::" <name> "::/f::"; leaves the text untouched when unterminated
    std::optional<std::string> consume_file_name();

    // "::c" <digits> "::"; leaves the text untouched when malformed
    std::optional<std::uint32_t> consume_index_marker();

    bool at_header() const;
    std::string_view rest() const { return rest_; }

private:
    std::string_view rest_;
};

// Header prefix of frame 0 (everything before "::c0::")
std::string serialize_header(const FrameHeader& header);

std::string serialize_index_marker(std::size_t index);

// Header fields are only looked for when first_frame is set
ParsedFrame parse_frame(std::string_view text, bool first_frame);
