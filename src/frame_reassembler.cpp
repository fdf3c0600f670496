#include "frame_reassembler.hpp"
#include "drive_errors.hpp"
#include "file_io.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

FrameReassembler::FrameReassembler(FrameSourceKind kind, DecisionCallback decide, std::string name_override)
    : kind_(kind), decide_(std::move(decide)), name_override_(std::move(name_override)) {
    if (kind_ == FrameSourceKind::Live && !decide_)
        throw std::invalid_argument("Live reassembly needs a decision callback");
    out_.file_name = name_override_;
}

OfferOutcome FrameReassembler::offer(const std::string& raw) {
    if (state_ == ReassemblyState::Complete)
        throw std::logic_error("Frame offered after the session completed");

    std::cout << "[REASSEMBLER] Decoding frame " << position_ << std::endl;
    ParsedFrame frame = parse_frame(raw, position_ == 0);

    const bool missing = !frame.declared_index.has_value();
    const bool mismatch = !missing && *frame.declared_index != position_;
    if (missing)
        std::cout << "[REASSEMBLER] No index found" << std::endl;
    else
        std::cout << "[REASSEMBLER] Found index " << *frame.declared_index << std::endl;

    if (!missing && !mismatch) {
        accept(std::move(frame));
        return OfferOutcome::Accepted;
    }

    if (kind_ == FrameSourceKind::Enumerated) {
        // Position already comes from the file name; a disagreeing index means a wrong file
        if (mismatch)
            throw FrameIndexMismatch(position_, *frame.declared_index);
        accept(std::move(frame));
        return OfferOutcome::Accepted;
    }

    FrameConflict conflict{position_, frame.declared_index, missing, mismatch};
    ReassemblyState previous = state_;
    state_ = ReassemblyState::AwaitingDecision;

    FrameDecision decision = FrameDecision::Reject;
    try {
        decision = decide_(conflict);
    } catch (...) {
        state_ = previous;
        throw;
    }
    state_ = previous;

    if (decision == FrameDecision::Reject) {
        std::cout << "[REASSEMBLER] Frame rejected, rescan frame " << position_ << std::endl;
        return OfferOutcome::Retry;
    }

    accept(std::move(frame));
    return OfferOutcome::Accepted;
}

void FrameReassembler::accept(ParsedFrame frame) {
    if (position_ == 0) {
        out_.is_binary = frame.is_binary;
        out_.is_archived = frame.is_archived;
        if (out_.is_binary)
            std::cout << "[REASSEMBLER] Outputting a binary file" << std::endl;

        if (frame.file_name) {
            if (name_override_.empty()) {
                out_.file_name = *frame.file_name;
                std::cout << "[REASSEMBLER] Using filename \"" << out_.file_name << "\"" << std::endl;
            } else {
                out_.file_name = name_override_ + path_extension(*frame.file_name);
            }
        }
    }

    out_.payload += frame.payload;
    ++out_.frame_count;
    ++position_;
    state_ = ReassemblyState::Accumulating;
}

ReassembledFile FrameReassembler::finish() {
    if (state_ == ReassemblyState::Complete)
        throw std::logic_error("Reassembly already finished");
    state_ = ReassemblyState::Complete;
    return std::move(out_);
}
