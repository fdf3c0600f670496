#pragma once

#include "capacity_resolver.hpp"
#include "frame_reassembler.hpp"
#include "frame_source.hpp"
#include "output_materializer.hpp"
#include "session_config.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

// Human (or scripted) decisions the pipelines suspend on
struct DrivePrompts {
    std::function<bool(std::size_t frame_count)> confirm_save;
    FrameReassembler::DecisionCallback decide_frame;
    std::function<bool(std::size_t next_position)> scan_another;
};

// name_override + source extension, else the source basename
std::string frame_base_name(const std::string& source_path, const SessionConfig& config);

// Resolves capacity for the configured level and medium, logging clamps and downgrades
CapacityResolution resolve_session_capacity(const SessionConfig& config);

// Pulls frames from source until it is exhausted (or the caller stops a live scan)
ReassembledFile collect_frames(FrameSource& source,
                               FrameReassembler& reassembler,
                               const std::function<bool(std::size_t)>& scan_another = nullptr);

// Encodes source_path into "<dir>/<name>.<i>.png"; returns the written paths
std::vector<std::string> run_save(const std::string& source_path,
                                  const SessionConfig& config,
                                  const DrivePrompts& prompts);

// Reads "<base_path>.<i>.png" from index 0 until the first missing index
MaterializedFile run_load(const std::string& base_path, const SessionConfig& config);

MaterializedFile run_camera_load(const SessionConfig& config, const DrivePrompts& prompts);
