#include <gtest/gtest.h>
#include "archiver.hpp"
#include "base64_codec.hpp"
#include "drive_errors.hpp"
#include "file_io.hpp"
#include "output_materializer.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

ReassembledFile make_file(std::string payload, std::string name, bool binary = false, bool archived = false) {
    ReassembledFile file;
    file.payload = std::move(payload);
    file.file_name = std::move(name);
    file.is_binary = binary;
    file.is_archived = archived;
    file.frame_count = 1;
    return file;
}

class OutputMaterializerTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/qrdrive_output_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        dir_ = tmpl;
    }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::string dir_;
};

TEST_F(OutputMaterializerTest, DecodesTextVerbatim) {
    EXPECT_EQ(decode_payload(make_file("hi there", "a.txt")), bytes_of("hi there"));
}

TEST_F(OutputMaterializerTest, DecodesBinaryFromBase64) {
    std::vector<uint8_t> expected = {0x00, 0xFF, 0x10};
    EXPECT_EQ(decode_payload(make_file("AP8Q", "x.bin", true)), expected);
}

TEST_F(OutputMaterializerTest, InvalidBase64IsAnEncodingError) {
    EXPECT_THROW(decode_payload(make_file("!!not base64!!", "x.bin", true)), EncodingError);
}

TEST_F(OutputMaterializerTest, NamesOutput) {
    EXPECT_EQ(output_name(make_file("", "a.txt")), "a.txt");
    EXPECT_EQ(output_name(make_file("", "")), DEFAULT_OUTPUT_NAME);
    EXPECT_EQ(output_name(make_file("", "../../etc/passwd")), "passwd");
    EXPECT_EQ(output_name(make_file("", "a.txt", true, true)), "a.txt.gz");
}

TEST_F(OutputMaterializerTest, WritesPlainFileIntoNewDirectory) {
    const std::string out_dir = dir_ + "/nested/out";
    MaterializedFile out = materialize_output(make_file("contents\n", "plain.txt"), out_dir);
    EXPECT_EQ(out.path, out_dir + "/plain.txt");
    EXPECT_TRUE(out.extracted.empty());
    EXPECT_EQ(read_file(out.path), bytes_of("contents\n"));
}

TEST_F(OutputMaterializerTest, ExpandsArchivedStream) {
    std::string text(1000, 'k');
    std::string payload = base64_encode(pack_archive(bytes_of(text), "big.txt"));

    MaterializedFile out = materialize_output(make_file(payload, "big.txt", true, true), dir_);
    EXPECT_EQ(out.path, dir_ + "/big.txt.gz");
    ASSERT_EQ(out.extracted.size(), 1u);
    EXPECT_EQ(out.extracted[0], dir_ + "/big.txt");
    EXPECT_EQ(read_file(out.extracted[0]), bytes_of(text));
    EXPECT_FALSE(file_exists(out.path));
}

TEST_F(OutputMaterializerTest, CorruptArchiveStaysOnDisk) {
    std::string payload = base64_encode(bytes_of("this is not an archive"));
    EXPECT_THROW(materialize_output(make_file(payload, "bad.txt", true, true), dir_), ArchiveUnpackFailure);
    EXPECT_TRUE(file_exists(dir_ + "/bad.txt.gz"));
}

} // namespace
