#include "drive_pipeline.hpp"
#include "drive_errors.hpp"
#include "file_io.hpp"
#include "frame_encoder.hpp"
#include "optical_codec.hpp"

#include <opencv2/imgcodecs.hpp>
#include <iostream>

std::string frame_base_name(const std::string& source_path, const SessionConfig& config) {
    if (config.name_override.empty())
        return path_basename(source_path);
    return config.name_override + path_extension(source_path);
}

CapacityResolution resolve_session_capacity(const SessionConfig& config) {
    CapacityResolution res = resolve_capacity(config.capacity, config.error_correction,
                                              medium_constraint(config.medium), config.force_capacity);

    if (res.clamped_to_ceiling) {
        std::cerr << "[CAPACITY] Setting bytesize to " << res.capacity
                  << " due to selecting error correction level "
                  << error_correction_name(config.error_correction) << std::endl;
    }
    if (res.downgraded) {
        std::cerr << "[CAPACITY] Reducing bytesize to " << res.capacity << " so version " << res.version
                  << " codes stay legible on " << print_medium_name(config.medium) << std::endl;
    }
    if (res.override_applied) {
        std::cerr << "[CAPACITY] Keeping bytesize " << res.capacity << ": version " << res.version
                  << " codes may not print legibly on " << print_medium_name(config.medium)
                  << " (legible up to version " << res.legible_version << ")" << std::endl;
    }
    return res;
}

ReassembledFile collect_frames(FrameSource& source,
                               FrameReassembler& reassembler,
                               const std::function<bool(std::size_t)>& scan_another) {
    while (true) {
        std::optional<std::string> raw = source.acquire(reassembler.next_position());
        if (!raw) break;

        if (reassembler.offer(*raw) == OfferOutcome::Retry)
            continue;

        if (source.kind() == FrameSourceKind::Live && scan_another &&
            !scan_another(reassembler.next_position()))
            break;
    }
    return reassembler.finish();
}

std::vector<std::string> run_save(const std::string& source_path,
                                  const SessionConfig& config,
                                  const DrivePrompts& prompts) {
    if (!file_exists(source_path))
        throw InputNotFound(source_path);

    const std::string name = frame_base_name(source_path, config);
    CapacityResolution res = resolve_session_capacity(config);

    std::vector<uint8_t> content = read_file(source_path);
    std::vector<std::string> frames = encode_frames(content, name, static_cast<std::size_t>(res.capacity),
                                                    config.archive);

    std::cout << "[SAVE] That file would save as " << frames.size() << " QR code(s)" << std::endl;
    if (!config.assume_yes && prompts.confirm_save && !prompts.confirm_save(frames.size()))
        throw SessionCancelled("Quitting...");

    ensure_dir(config.directory);
    QrFrameCodec codec(config.error_correction, config.pixel_density, config.fill_color, config.back_color);
    const std::string base = join_path(config.directory, name);

    std::vector<std::string> written;
    written.reserve(frames.size());
    for (std::size_t i = 0; i < frames.size(); ++i) {
        int version = select_tier(static_cast<int>(frames[i].size()), config.error_correction).version;
        cv::Mat image = codec.render(frames[i], version);

        std::string path = frame_image_path(base, i);
        if (!cv::imwrite(path, image))
            throw DriveError("Cannot write image: " + path);
        written.push_back(path);
    }

    std::cout << "[SAVE] Wrote " << written.size() << " image(s) to "
              << (config.directory.empty() ? "." : config.directory) << std::endl;
    return written;
}

MaterializedFile run_load(const std::string& base_path, const SessionConfig& config) {
    QrFrameCodec codec(config.error_correction, config.pixel_density, config.fill_color, config.back_color);
    ImageSequenceSource source(base_path, codec);
    FrameReassembler reassembler(FrameSourceKind::Enumerated, nullptr, config.name_override);

    ReassembledFile file = collect_frames(source, reassembler);
    std::cout << "[LOAD] Collected " << file.frame_count << " frame(s)" << std::endl;
    return materialize_output(file, config.directory);
}

MaterializedFile run_camera_load(const SessionConfig& config, const DrivePrompts& prompts) {
    QrFrameCodec codec(config.error_correction, config.pixel_density, config.fill_color, config.back_color);
    FrameReassembler reassembler(FrameSourceKind::Live, prompts.decide_frame, config.name_override);

    ReassembledFile file;
    {
        CameraSource camera(config.camera_id, config.settle_frames, codec);
        file = collect_frames(camera, reassembler, prompts.scan_another);
    }
    std::cout << "[LOAD] Collected " << file.frame_count << " frame(s)" << std::endl;
    return materialize_output(file, config.directory);
}
