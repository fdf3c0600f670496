#include <gtest/gtest.h>
#include "capacity_resolver.hpp"
#include "drive_errors.hpp"
#include "drive_pipeline.hpp"
#include "file_io.hpp"
#include "frame_encoder.hpp"
#include "frame_reassembler.hpp"
#include "frame_source.hpp"
#include "output_materializer.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::vector<uint8_t> sample_binary(size_t n) {
    std::vector<uint8_t> out(n);
    for (size_t i = 0; i < n; ++i) out[i] = static_cast<uint8_t>((i * 131 + 7) % 256);
    return out;
}

std::string sample_text(size_t n) {
    std::string out;
    while (out.size() < n) out += "The quick brown fox: jumps over ::the:: lazy dog.\n";
    out.resize(n);
    return out;
}

// Replays prepared frame texts, optionally slipping in one bogus frame first at a position
class ScriptedSource : public FrameSource {
public:
    ScriptedSource(FrameSourceKind kind, std::vector<std::string> frames)
        : kind_(kind), frames_(std::move(frames)) {}

    void inject_once(std::size_t position, std::string raw) {
        injected_position_ = position;
        injected_ = std::move(raw);
    }

    FrameSourceKind kind() const override { return kind_; }

    std::optional<std::string> acquire(std::size_t position) override {
        if (injected_ && position == injected_position_) {
            std::string raw = std::move(*injected_);
            injected_.reset();
            return raw;
        }
        if (position >= frames_.size()) return std::nullopt;
        return frames_[position];
    }

private:
    FrameSourceKind kind_;
    std::vector<std::string> frames_;
    std::size_t injected_position_ = 0;
    std::optional<std::string> injected_;
};

ReassembledFile reassemble(const std::vector<std::string>& frames, const std::string& name_override = "") {
    FrameReassembler r(FrameSourceKind::Enumerated, nullptr, name_override);
    for (const auto& f : frames) r.offer(f);
    return r.finish();
}

TEST(RoundTripTest, EveryLevelAndCapacityReproducesContent) {
    const std::vector<std::vector<uint8_t>> contents = {
        bytes_of(sample_text(4000)), sample_binary(3000), bytes_of("x"), {}};
    const ErrorCorrection levels[] = {ErrorCorrection::Low, ErrorCorrection::Medium, ErrorCorrection::High};

    for (auto level : levels) {
        for (int requested : {106, 271, 520, 858, 1273, 2331, 2900, 2953}) {
            CapacityResolution res = resolve_capacity(requested, level);
            for (const auto& content : contents) {
                auto frames = encode_frames(content, "dir/sample.dat", static_cast<size_t>(res.capacity), false);
                for (const auto& f : frames)
                    ASSERT_LE(f.size(), static_cast<size_t>(res.capacity));

                ReassembledFile file = reassemble(frames);
                EXPECT_EQ(file.file_name, "sample.dat");
                EXPECT_EQ(file.frame_count, frames.size());
                EXPECT_EQ(decode_payload(file), content)
                    << "level " << error_correction_name(level) << " capacity " << res.capacity;
            }
        }
    }
}

TEST(RoundTripTest, ArchivedContentComesBackUnpacked) {
    char tmpl[] = "/tmp/qrdrive_roundtrip_XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    const std::string dir = tmpl;

    const auto content = bytes_of(sample_text(6000));
    auto frames = encode_frames(content, "story.txt", 520, true);
    ReassembledFile file = reassemble(frames);
    EXPECT_TRUE(file.is_archived);

    MaterializedFile out = materialize_output(file, dir);
    ASSERT_EQ(out.extracted.size(), 1u);
    EXPECT_EQ(out.extracted[0], dir + "/story.txt");
    EXPECT_EQ(read_file(out.extracted[0]), content);

    std::filesystem::remove_all(dir);
}

TEST(RoundTripTest, NameOverrideAppliesOnLoad) {
    auto frames = encode_frames(bytes_of("1,2,3"), "numbers.csv", 200, false);
    EXPECT_EQ(reassemble(frames, "renamed").file_name, "renamed.csv");
}

TEST(RoundTripTest, CollectsEnumeratedSourceUntilExhausted) {
    const auto content = sample_binary(900);
    auto frames = encode_frames(content, "blob.bin", 106, false);
    ASSERT_GT(frames.size(), 5u);

    ScriptedSource source(FrameSourceKind::Enumerated, frames);
    FrameReassembler reassembler(FrameSourceKind::Enumerated, nullptr);
    ReassembledFile file = collect_frames(source, reassembler);
    EXPECT_EQ(file.frame_count, frames.size());
    EXPECT_EQ(decode_payload(file), content);
}

TEST(RoundTripTest, EnumeratedSourceStopsOnForeignFrame) {
    auto frames = encode_frames(bytes_of(sample_text(500)), "a.txt", 106, false);
    ScriptedSource source(FrameSourceKind::Enumerated, frames);
    source.inject_once(2, "::c7::stray");
    FrameReassembler reassembler(FrameSourceKind::Enumerated, nullptr);
    EXPECT_THROW(collect_frames(source, reassembler), FrameIndexMismatch);
}

TEST(RoundTripTest, LiveSourceRescansRejectedFrame) {
    const std::string text = sample_text(700);
    auto frames = encode_frames(bytes_of(text), "a.txt", 106, false);

    ScriptedSource source(FrameSourceKind::Live, frames);
    source.inject_once(3, "::c9::from another file");

    std::vector<FrameConflict> conflicts;
    FrameReassembler reassembler(FrameSourceKind::Live, [&](const FrameConflict& c) {
        conflicts.push_back(c);
        return FrameDecision::Reject;
    });

    std::size_t prompts = 0;
    ReassembledFile file = collect_frames(source, reassembler, [&](std::size_t) {
        ++prompts;
        return true;
    });

    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].position, 3u);
    EXPECT_EQ(*conflicts[0].declared_index, 9u);
    EXPECT_EQ(prompts, frames.size());
    EXPECT_EQ(decode_payload(file), bytes_of(text));
}

TEST(RoundTripTest, LiveScanEndsWhenUserStops) {
    auto frames = encode_frames(bytes_of(sample_text(700)), "a.txt", 106, false);
    ScriptedSource source(FrameSourceKind::Live, frames);
    FrameReassembler reassembler(FrameSourceKind::Live,
                                 [](const FrameConflict&) { return FrameDecision::Accept; });

    ReassembledFile file = collect_frames(source, reassembler, [](std::size_t next) { return next < 2; });
    EXPECT_EQ(file.frame_count, 2u);
}

TEST(RoundTripTest, SavedImagesLoadBack) {
    char tmpl[] = "/tmp/qrdrive_images_XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    const std::string dir = tmpl;

    const std::string source = dir + "/poem.txt";
    const std::string text = sample_text(300);
    write_file(source, bytes_of(text));

    SessionConfig config;
    config.capacity = 106;
    config.pixel_density = 6;
    config.directory = dir + "/codes";
    config.assume_yes = true;

    auto written = run_save(source, config, DrivePrompts{});
    ASSERT_GT(written.size(), 1u);
    EXPECT_EQ(written[0], dir + "/codes/poem.txt.0.png");

    SessionConfig load_config;
    load_config.directory = dir + "/restored";
    MaterializedFile out = run_load(dir + "/codes/poem.txt", load_config);
    EXPECT_EQ(out.path, dir + "/restored/poem.txt");
    EXPECT_EQ(read_file(out.path), bytes_of(text));

    std::filesystem::remove_all(dir);
}

TEST(RoundTripTest, SavingMissingFileFails) {
    SessionConfig config;
    config.assume_yes = true;
    EXPECT_THROW(run_save("/nonexistent/qrdrive/input.txt", config, DrivePrompts{}), InputNotFound);
}

TEST(RoundTripTest, LoadingWithoutFirstImageFails) {
    SessionConfig config;
    EXPECT_THROW(run_load("/nonexistent/qrdrive/input.txt", config), InputNotFound);
}

} // namespace
