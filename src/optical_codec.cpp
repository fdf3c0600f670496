#include "optical_codec.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace {

struct NamedColor {
    const char* name;
    int r, g, b;
};

const NamedColor BASIC_COLORS[] = {
    {"black", 0, 0, 0},       {"white", 255, 255, 255}, {"red", 255, 0, 0},
    {"green", 0, 128, 0},     {"blue", 0, 0, 255},      {"yellow", 255, 255, 0},
    {"cyan", 0, 255, 255},    {"magenta", 255, 0, 255}, {"gray", 128, 128, 128},
    {"grey", 128, 128, 128},  {"orange", 255, 165, 0},  {"purple", 128, 0, 128},
    {"navy", 0, 0, 128},      {"brown", 165, 42, 42},
};

cv::QRCodeEncoder::CorrectionLevel to_cv_level(ErrorCorrection level) {
    switch (level) {
        case ErrorCorrection::Low: return cv::QRCodeEncoder::CORRECT_LEVEL_L;
        case ErrorCorrection::Medium: return cv::QRCodeEncoder::CORRECT_LEVEL_M;
        case ErrorCorrection::High: return cv::QRCodeEncoder::CORRECT_LEVEL_H;
    }
    return cv::QRCodeEncoder::CORRECT_LEVEL_L;
}

} // namespace

cv::Scalar parse_color(const std::string& text) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& c : BASIC_COLORS) {
        if (s == c.name) return cv::Scalar(c.b, c.g, c.r);
    }

    if (!s.empty() && s[0] == '#') s.erase(0, 1);
    if (s.size() == 6 && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c); })) {
        long rgb = std::strtol(s.c_str(), nullptr, 16);
        return cv::Scalar(rgb & 0xFF, (rgb >> 8) & 0xFF, (rgb >> 16) & 0xFF);
    }
    throw std::invalid_argument("Unknown color '" + text + "'");
}

QrFrameCodec::QrFrameCodec(ErrorCorrection level, int pixel_density,
                           const std::string& fill_color, const std::string& back_color)
    : level_(level), pixel_density_(pixel_density),
      fill_(parse_color(fill_color)), back_(parse_color(back_color)) {
    if (pixel_density_ < 1)
        throw std::invalid_argument("pixel density must be at least 1");
}

cv::Mat QrFrameCodec::render(const std::string& text, int version) const {
    cv::QRCodeEncoder::Params params;
    params.version = version;
    params.correction_level = to_cv_level(level_);
    params.mode = cv::QRCodeEncoder::MODE_BYTE;

    cv::Ptr<cv::QRCodeEncoder> encoder = cv::QRCodeEncoder::create(params);
    cv::Mat modules;
    encoder->encode(text, modules);
    if (modules.empty())
        throw std::runtime_error("QR encoding produced no image (version " + std::to_string(version) + ")");

    cv::Mat scaled, bordered;
    cv::resize(modules, scaled, cv::Size(), pixel_density_, pixel_density_, cv::INTER_NEAREST);
    const int border = QUIET_ZONE_MODULES * pixel_density_;
    cv::copyMakeBorder(scaled, bordered, border, border, border, border, cv::BORDER_CONSTANT, cv::Scalar(255));

    cv::Mat image(bordered.size(), CV_8UC3, back_);
    cv::Mat dark = bordered < 128;
    image.setTo(fill_, dark);
    return image;
}

std::vector<std::string> QrFrameCodec::decode(const cv::Mat& image) const {
    std::vector<std::string> found;
    if (image.empty()) return found;

    std::vector<std::string> decoded;
    std::vector<cv::Point> points;
    if (detector_.detectAndDecodeMulti(image, decoded, points)) {
        for (auto& text : decoded)
            if (!text.empty()) found.push_back(std::move(text));
    }

    if (found.empty()) {
        std::string single = detector_.detectAndDecode(image);
        if (!single.empty()) found.push_back(std::move(single));
    }
    return found;
}
