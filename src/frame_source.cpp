#include "frame_source.hpp"
#include "drive_errors.hpp"
#include "file_io.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <iostream>
#include <utility>

static const char* PREVIEW_WINDOW = "qrdrive - scanner";
constexpr int KEY_ESC = 27;

std::string frame_image_path(const std::string& base, std::size_t index) {
    return base + "." + std::to_string(index) + ".png";
}

ImageSequenceSource::ImageSequenceSource(std::string base_path, const QrFrameCodec& codec)
    : base_path_(std::move(base_path)), codec_(codec) {}

std::optional<std::string> ImageSequenceSource::acquire(std::size_t position) {
    const std::string path = frame_image_path(base_path_, position);
    if (!file_exists(path)) {
        if (position == 0) throw InputNotFound(path);
        return std::nullopt;
    }

    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty())
        throw DriveError("Cannot read image: " + path);

    auto found = codec_.decode(image);
    if (found.size() != 1)
        throw DecodeAmbiguous(path, found.size());
    return found.front();
}

CameraSource::CameraSource(int camera_id, int settle_frames, const QrFrameCodec& codec)
    : cap_(camera_id, cv::CAP_V4L2), settle_frames_(settle_frames), codec_(codec) {
    if (!cap_.isOpened())
        throw DriveError("Camera " + std::to_string(camera_id) + " could not be started");
    std::cout << "[CAMERA] Place the first QR code in front of the camera. "
                 "Keep any other QR codes out of view." << std::endl;
}

CameraSource::~CameraSource() {
    cap_.release();
    cv::destroyAllWindows();
}

std::optional<std::string> CameraSource::acquire(std::size_t position) {
    std::cout << "[CAMERA] Scanning for image " << position << std::endl;

    cv::Mat frame;
    int frames_seen = 0;
    bool crowded = false;
    while (true) {
        if (!cap_.read(frame) || frame.empty())
            throw DriveError("Camera frame could not be read");
        ++frames_seen;

        auto found = codec_.decode(frame);
        if (found.size() > 1 && !crowded) {
            std::cerr << "[CAMERA] " << found.size() << " codes in view, keep only one in frame" << std::endl;
            crowded = true;
        }
        if (found.size() == 1) {
            crowded = false;
            cv::putText(frame, found.front().substr(0, 40), cv::Point(50, 50),
                        cv::FONT_HERSHEY_PLAIN, 2, cv::Scalar(255, 0, 0), 3);
            // Give the user time to swap codes before taking the next one
            if (frames_seen > settle_frames_) {
                std::cout << "\a" << std::flush;
                cv::imshow(PREVIEW_WINDOW, frame);
                cv::waitKey(1);
                return found.front();
            }
        }

        cv::imshow(PREVIEW_WINDOW, frame);
        if (cv::waitKey(1) == KEY_ESC)
            throw SessionCancelled("Scan aborted");
    }
}
