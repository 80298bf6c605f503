#include <layercast/core/base64.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace layercast::core;

TEST(Base64Test, EncodesRfcVectors) {
    EXPECT_EQ(base64_encode(std::string("")), "");
    EXPECT_EQ(base64_encode(std::string("f")), "Zg==");
    EXPECT_EQ(base64_encode(std::string("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(std::string("foo")), "Zm9v");
    EXPECT_EQ(base64_encode(std::string("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, EncodesBinaryBytes) {
    const std::vector<std::uint8_t> bytes = {0x00, 0xFF, 0x10};
    EXPECT_EQ(base64_encode(bytes), "AP8Q");
}

TEST(Base64Test, DecodesPaddedInput) {
    std::vector<std::uint8_t> out;
    ASSERT_TRUE(base64_decode("Zm9vYg==", out));
    EXPECT_EQ(std::string(out.begin(), out.end()), "foob");
}

TEST(Base64Test, DecodeSkipsWhitespace) {
    std::vector<std::uint8_t> out;
    ASSERT_TRUE(base64_decode("Zm9v\nYmFy", out));
    EXPECT_EQ(std::string(out.begin(), out.end()), "foobar");
}

TEST(Base64Test, DecodeRejectsForeignCharacters) {
    std::vector<std::uint8_t> out;
    EXPECT_FALSE(base64_decode("Zm9v*mFy", out));
}

TEST(Base64Test, PngSignatureSurvivesDecode) {
    std::vector<std::uint8_t> out;
    ASSERT_TRUE(base64_decode("iVBORw0KGgo=", out));
    ASSERT_GE(out.size(), 4u);
    EXPECT_EQ(out[0], 0x89);
    EXPECT_EQ(out[1], 'P');
    EXPECT_EQ(out[2], 'N');
    EXPECT_EQ(out[3], 'G');
}
