#include <layercast/core/file_io.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

using namespace layercast::core;

namespace {

std::string temp_path(const std::string& name) {
    return std::string(LAYERCAST_TEST_TMP_DIR) + "/file_io_test_" + name;
}

std::vector<std::uint8_t> read_raw(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(file)),
                                     std::istreambuf_iterator<char>());
}

}  // namespace

TEST(FileIoTest, GzipMagicDetection) {
    EXPECT_TRUE(is_gzip_data({0x1f, 0x8b, 0x08}));
    EXPECT_FALSE(is_gzip_data({'{', '}'}));
    EXPECT_FALSE(is_gzip_data({}));
}

TEST(FileIoTest, CompressThenDecompressRestoresText) {
    const std::string text = "{\"rootNode\": {\"type\": \"FRAME\", \"children\": []}}";
    std::vector<std::uint8_t> compressed;
    ASSERT_TRUE(gzip_compress(text, compressed));
    EXPECT_TRUE(is_gzip_data(compressed));

    std::string restored;
    ASSERT_TRUE(gzip_decompress(compressed, restored));
    EXPECT_EQ(restored, text);
}

TEST(FileIoTest, DecompressRejectsGarbage) {
    std::string out;
    EXPECT_FALSE(gzip_decompress({0x1f, 0x8b, 0x08, 0x00, 0x01, 0x02}, out));
}

TEST(FileIoTest, PlainFileRoundTrip) {
    const std::string path = temp_path("plain.json");
    std::string error;
    ASSERT_TRUE(write_document_file(path, "{\"a\": 1}", error)) << error;

    const FileReadResult read = read_document_file(path);
    ASSERT_TRUE(read.ok) << read.error;
    EXPECT_FALSE(read.was_compressed);
    EXPECT_EQ(read.contents, "{\"a\": 1}");
}

TEST(FileIoTest, GzSuffixWritesCompressedAndReadsTransparently) {
    const std::string path = temp_path("design.json.gz");
    std::string error;
    ASSERT_TRUE(write_document_file(path, "{\"pageTitle\": \"Home\"}", error)) << error;

    EXPECT_TRUE(is_gzip_data(read_raw(path)));

    const FileReadResult read = read_document_file(path);
    ASSERT_TRUE(read.ok) << read.error;
    EXPECT_TRUE(read.was_compressed);
    EXPECT_EQ(read.contents, "{\"pageTitle\": \"Home\"}");
}

TEST(FileIoTest, MissingFileReportsError) {
    const FileReadResult read = read_document_file(temp_path("does-not-exist.json"));
    EXPECT_FALSE(read.ok);
    EXPECT_NE(read.error.find("Cannot open file"), std::string::npos);
}

TEST(FileIoTest, UnwritablePathReportsError) {
    std::string error;
    EXPECT_FALSE(write_document_file(temp_path("no-such-dir/out.json"), "{}", error));
    EXPECT_FALSE(error.empty());
}
