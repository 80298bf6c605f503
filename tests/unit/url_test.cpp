#include <layercast/url/url.h>
#include <gtest/gtest.h>

#include <string>

using namespace layercast::url;

TEST(UrlTest, SchemeDetection) {
  EXPECT_TRUE(is_absolute_url("https://example.com/a.png"));
  EXPECT_FALSE(is_absolute_url("//cdn.example.com/a.png"));
  EXPECT_FALSE(is_absolute_url("C:/images/a.png"));
  EXPECT_FALSE(is_absolute_url("images/a.png"));
  EXPECT_EQ(scheme_of("HTTPS://example.com"), "https");
  EXPECT_TRUE(is_file_url("file:///tmp/a.png"));
  EXPECT_TRUE(is_data_url("data:image/png;base64,AAAA"));
}

TEST(UrlTest, ResolvesRelativeAgainstHttpBase) {
  std::string err;
  EXPECT_EQ(resolve_url("https://example.com/blog/post.html", "img/a.png", err),
            "https://example.com/blog/img/a.png");
  EXPECT_TRUE(err.empty());
  EXPECT_EQ(resolve_url("https://example.com/blog/post.html", "../a.png?v=2", err),
            "https://example.com/a.png?v=2");
  EXPECT_EQ(resolve_url("https://example.com/blog/", "/root.png", err),
            "https://example.com/root.png");
  EXPECT_EQ(resolve_url("https://example.com/blog/", "//cdn.example.com/x.png", err),
            "https://cdn.example.com/x.png");
}

TEST(UrlTest, AbsoluteReferenceIsUnchanged) {
  std::string err;
  EXPECT_EQ(resolve_url("https://example.com/", "data:image/png;base64,AAAA", err),
            "data:image/png;base64,AAAA");
}

TEST(UrlTest, ResolvesAgainstFileBase) {
  std::string err;
  EXPECT_EQ(resolve_url("file:///site/index.html", "assets/logo.svg", err),
            "file:///site/assets/logo.svg");
  EXPECT_TRUE(err.empty());
}

TEST(UrlTest, RejectsBaseWithoutScheme) {
  std::string err;
  EXPECT_EQ(resolve_url("/site/index.html", "a.png", err), "");
  EXPECT_FALSE(err.empty());
}

TEST(UrlTest, FileUrlToPathDecodesPercentEscapes) {
  std::string path;
  std::string err;
  ASSERT_TRUE(file_url_to_path("file:///tmp/my%20image.png", path, err)) << err;
  EXPECT_EQ(path, "/tmp/my image.png");

  ASSERT_TRUE(file_url_to_path("file://localhost/tmp/a.png", path, err));
  EXPECT_EQ(path, "/tmp/a.png");

  EXPECT_FALSE(file_url_to_path("file://server/share/a.png", path, err));
  EXPECT_FALSE(err.empty());
}

TEST(UrlTest, PathToFileUrlEncodesSpaces) {
  EXPECT_EQ(path_to_file_url("/tmp/my image.png"), "file:///tmp/my%20image.png");
}

TEST(UrlTest, PercentDecodeRejectsTruncatedEscape) {
  std::string out;
  std::string err;
  EXPECT_TRUE(percent_decode("%3Csvg%3E", out, err));
  EXPECT_EQ(out, "<svg>");
  EXPECT_FALSE(percent_decode("abc%4", out, err));
  EXPECT_FALSE(err.empty());
}

TEST(UrlTest, ParsesDataUrlMetadata) {
  DataUrl data;
  std::string err;
  ASSERT_TRUE(parse_data_url("data:image/PNG;base64,iVBORw0KGgo=", data, err)) << err;
  EXPECT_EQ(data.media_type, "image/png");
  EXPECT_TRUE(data.is_base64);
  EXPECT_EQ(data.payload, "iVBORw0KGgo=");

  ASSERT_TRUE(parse_data_url("data:,hello%20world", data, err));
  EXPECT_EQ(data.media_type, "text/plain");
  EXPECT_FALSE(data.is_base64);
  EXPECT_EQ(data.payload, "hello%20world");

  EXPECT_FALSE(parse_data_url("data:image/png;base64", data, err));
}
