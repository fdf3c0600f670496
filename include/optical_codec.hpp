#pragma once

#include "session_config.hpp"
#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>
#include <string>
#include <vector>

// "black", "red", ... or "#RRGGBB"; returns a BGR scalar
cv::Scalar parse_color(const std::string& text);

class QrFrameCodec {
public:
    QrFrameCodec(ErrorCorrection level, int pixel_density,
                 const std::string& fill_color, const std::string& back_color);

    // Byte-mode QR at the given version, pixel_density px per module, 4-module quiet zone
    cv::Mat render(const std::string& text, int version) const;

    // Every non-empty payload found; zero or several are possible
    std::vector<std::string> decode(const cv::Mat& image) const;

private:
    static constexpr int QUIET_ZONE_MODULES = 4;

    ErrorCorrection level_;
    int pixel_density_;
    cv::Scalar fill_;
    cv::Scalar back_;
    mutable cv::QRCodeDetector detector_;
};
