#pragma once
#include "frame_reassembler.hpp"
#include <string>

// Repeats the question until the answer is Y or N
bool ask_yes_no(const std::string& question);

// Explains the conflict and asks to (A)ccept the frame or (R)escan it
FrameDecision ask_frame_decision(const FrameConflict& conflict);
