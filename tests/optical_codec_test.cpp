#include <gtest/gtest.h>
#include "optical_codec.hpp"
#include <opencv2/core.hpp>

#include <stdexcept>

namespace {

TEST(OpticalCodecTest, ParsesNamedAndHexColors) {
    EXPECT_EQ(parse_color("black"), cv::Scalar(0, 0, 0));
    EXPECT_EQ(parse_color("White"), cv::Scalar(255, 255, 255));
    // BGR order
    EXPECT_EQ(parse_color("red"), cv::Scalar(0, 0, 255));
    EXPECT_EQ(parse_color("#102030"), cv::Scalar(0x30, 0x20, 0x10));
    EXPECT_EQ(parse_color("A0B0C0"), cv::Scalar(0xC0, 0xB0, 0xA0));
}

TEST(OpticalCodecTest, RejectsUnknownColors) {
    EXPECT_THROW(parse_color("chartreuse-ish"), std::invalid_argument);
    EXPECT_THROW(parse_color("#12345"), std::invalid_argument);
    EXPECT_THROW(QrFrameCodec(ErrorCorrection::Low, 10, "black", "nope"), std::invalid_argument);
}

TEST(OpticalCodecTest, RejectsZeroPixelDensity) {
    EXPECT_THROW(QrFrameCodec(ErrorCorrection::Low, 0, "black", "white"), std::invalid_argument);
}

TEST(OpticalCodecTest, RenderedFrameDecodesBack) {
    QrFrameCodec codec(ErrorCorrection::Low, 8, "black", "white");
    const std::string text = "::f::a.txt::/f::::c0::hello";

    cv::Mat image = codec.render(text, 5);
    // version 5 is 37 modules, plus at least a 4-module quiet zone on each side
    EXPECT_GE(image.cols, (37 + 8) * 8);
    EXPECT_EQ(image.cols % 8, 0);
    EXPECT_EQ(image.rows, image.cols);
    EXPECT_EQ(image.type(), CV_8UC3);

    auto found = codec.decode(image);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0], text);
}

TEST(OpticalCodecTest, QuietZoneUsesBackgroundColor) {
    QrFrameCodec codec(ErrorCorrection::Medium, 4, "navy", "yellow");
    cv::Mat image = codec.render("::c3::payload", 5);
    cv::Vec3b corner = image.at<cv::Vec3b>(0, 0);
    EXPECT_EQ(corner, cv::Vec3b(0, 255, 255));

    cv::Mat dark;
    cv::inRange(image, cv::Scalar(128, 0, 0), cv::Scalar(128, 0, 0), dark);
    cv::Mat light;
    cv::inRange(image, cv::Scalar(0, 255, 255), cv::Scalar(0, 255, 255), light);
    EXPECT_GT(cv::countNonZero(dark), 0);
    EXPECT_EQ(cv::countNonZero(dark) + cv::countNonZero(light), image.rows * image.cols);
}

TEST(OpticalCodecTest, BlankImageYieldsNothing) {
    QrFrameCodec codec(ErrorCorrection::Low, 4, "black", "white");
    cv::Mat blank(200, 200, CV_8UC3, cv::Scalar(255, 255, 255));
    EXPECT_TRUE(codec.decode(blank).empty());
    EXPECT_TRUE(codec.decode(cv::Mat()).empty());
}

} // namespace
