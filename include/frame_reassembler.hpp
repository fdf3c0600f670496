#pragma once

#include "frame_codec.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

enum class ReassemblyState { Empty, Accumulating, AwaitingDecision, Complete };

// Live sources (camera) cannot guarantee order; enumerated ones (numbered files) can
enum class FrameSourceKind { Live, Enumerated };

enum class FrameDecision { Accept, Reject };

enum class OfferOutcome { Accepted, Retry };

// Why a frame needs a decision before it can be merged
struct FrameConflict {
    std::size_t position;
    std::optional<std::uint32_t> declared_index;
    bool index_missing;
    bool index_mismatch;
};

struct ReassembledFile {
    std::string payload;
    bool is_binary = false;
    bool is_archived = false;
    std::string file_name;
    std::size_t frame_count = 0;
};

class FrameReassembler {
public:
    using DecisionCallback = std::function<FrameDecision(const FrameConflict&)>;

    // name_override replaces the embedded base name; the embedded extension is kept
    FrameReassembler(FrameSourceKind kind, DecisionCallback decide, std::string name_override = "");

    // Validates raw against the next arrival position and merges it on acceptance.
    // Retry means the frame was rejected and the same position must be re-acquired.
    // Enumerated sources throw FrameIndexMismatch instead of asking.
    OfferOutcome offer(const std::string& raw);

    // Ends the session; no frame can be offered afterwards
    ReassembledFile finish();

    ReassemblyState state() const { return state_; }
    std::size_t next_position() const { return position_; }
    const std::string& payload() const { return out_.payload; }

private:
    void accept(ParsedFrame frame);

    FrameSourceKind kind_;
    DecisionCallback decide_;
    std::string name_override_;
    ReassemblyState state_ = ReassemblyState::Empty;
    std::size_t position_ = 0;
    ReassembledFile out_;
};
