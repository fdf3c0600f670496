#ifndef QRDRIVE_FRAME_SOURCE_HPP
#define QRDRIVE_FRAME_SOURCE_HPP

#include "frame_reassembler.hpp"
#include "optical_codec.hpp"
#include <opencv2/videoio.hpp>
#include <cstddef>
#include <optional>
#include <string>

// Supplies raw frame texts to a decode session
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual FrameSourceKind kind() const = 0;

    // Text of the frame for this arrival position; nullopt once exhausted
    virtual std::optional<std::string> acquire(std::size_t position) = 0;
};

// "<base>.<index>.png"
std::string frame_image_path(const std::string& base, std::size_t index);

// Numbered PNG files; stops at the first missing index
class ImageSequenceSource : public FrameSource {
public:
    ImageSequenceSource(std::string base_path, const QrFrameCodec& codec);

    FrameSourceKind kind() const override { return FrameSourceKind::Enumerated; }
    std::optional<std::string> acquire(std::size_t position) override;

private:
    std::string base_path_;
    const QrFrameCodec& codec_;
};

// Webcam with a preview window; Esc aborts the session
class CameraSource : public FrameSource {
public:
    CameraSource(int camera_id, int settle_frames, const QrFrameCodec& codec);
    ~CameraSource() override;

    FrameSourceKind kind() const override { return FrameSourceKind::Live; }
    std::optional<std::string> acquire(std::size_t position) override;

private:
    cv::VideoCapture cap_;
    int settle_frames_;
    const QrFrameCodec& codec_;
};

#endif // QRDRIVE_FRAME_SOURCE_HPP
