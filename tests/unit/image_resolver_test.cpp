#include <layercast/core/base64.h>
#include <layercast/core/diagnostics.h>
#include <layercast/extract/image_resolver.h>
#include <layercast/ir/node.h>
#include <gtest/gtest.h>

#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <utility>

using namespace layercast;
using namespace layercast::extract;

namespace {

const std::string kTmpDir = LAYERCAST_TEST_TMP_DIR;

void write_file(const std::string& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << bytes;
}

// Answers from a fixed table.
class TableResolver : public ImageResolver {
public:
    explicit TableResolver(std::map<std::string, std::string> table) : table_(std::move(table)) {}

    std::optional<std::string> resolve(const std::string& image_url, std::string& error) override {
        auto it = table_.find(image_url);
        if (it == table_.end()) {
            error = "not found";
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::map<std::string, std::string> table_;
};

}  // namespace

TEST(LocalImageResolverTest, Base64DataUrlIsNormalized) {
    LocalImageResolver resolver;
    std::string error;
    auto encoded = resolver.resolve("data:image/png;base64,Zm9v\nYmFy", error);
    ASSERT_TRUE(encoded.has_value()) << error;
    EXPECT_EQ(*encoded, "Zm9vYmFy");
}

TEST(LocalImageResolverTest, PercentEncodedDataUrl) {
    LocalImageResolver resolver;
    std::string error;
    auto encoded = resolver.resolve("data:image/svg+xml,%3Csvg%3E", error);
    ASSERT_TRUE(encoded.has_value()) << error;
    EXPECT_EQ(*encoded, core::base64_encode(std::string("<svg>")));
}

TEST(LocalImageResolverTest, BrokenDataUrl) {
    LocalImageResolver resolver;
    std::string error;
    EXPECT_FALSE(resolver.resolve("data:image/png;base64,@@@", error).has_value());
    EXPECT_EQ(error, "invalid base64 payload in data URL");
}

TEST(LocalImageResolverTest, RelativePathAgainstBaseDirectory) {
    write_file(kTmpDir + "/resolver test.png", "PNGDATA");
    LocalImageResolver resolver(kTmpDir);

    std::string error;
    auto encoded = resolver.resolve("resolver%20test.png?v=3", error);
    ASSERT_TRUE(encoded.has_value()) << error;
    EXPECT_EQ(*encoded, core::base64_encode(std::string("PNGDATA")));
}

TEST(LocalImageResolverTest, FileUrl) {
    write_file(kTmpDir + "/resolver_file.bin", "abc");
    LocalImageResolver resolver;

    std::string error;
    auto encoded = resolver.resolve("file://" + kTmpDir + "/resolver_file.bin", error);
    ASSERT_TRUE(encoded.has_value()) << error;
    EXPECT_EQ(*encoded, "YWJj");
}

TEST(LocalImageResolverTest, FailureReasons) {
    write_file(kTmpDir + "/resolver_empty.png", "");
    LocalImageResolver resolver(kTmpDir);
    std::string error;

    EXPECT_FALSE(resolver.resolve("https://example.com/a.png", error).has_value());
    EXPECT_EQ(error, "unsupported scheme 'https' (no network access)");

    EXPECT_FALSE(resolver.resolve("missing.png", error).has_value());
    EXPECT_NE(error.find("cannot open"), std::string::npos);

    EXPECT_FALSE(resolver.resolve("resolver_empty.png", error).has_value());
    EXPECT_NE(error.find("is empty"), std::string::npos);

    EXPECT_FALSE(resolver.resolve("", error).has_value());
    EXPECT_FALSE(error.empty());
}

TEST(ResolveImagesTest, FillsImageAndBackgroundBytes) {
    ir::Node root = ir::Node::make(ir::NodeType::Frame);
    root.get_if<ir::FrameData>()->background_image_url = "bg.png";

    ir::Node logo = ir::Node::make(ir::NodeType::Image);
    logo.get_if<ir::ImageData>()->image_url = "logo.png";
    root.children.push_back(logo);

    ir::Node broken = ir::Node::make(ir::NodeType::Image);
    broken.get_if<ir::ImageData>()->image_url = "gone.png";
    root.children.push_back(broken);

    ir::Node inline_image = ir::Node::make(ir::NodeType::Image);
    inline_image.get_if<ir::ImageData>()->image_url = "logo.png";
    inline_image.get_if<ir::ImageData>()->image_base64 = "KEEP";
    root.children.push_back(inline_image);

    TableResolver resolver({{"bg.png", "Qkc="}, {"logo.png", "TE9HTw=="}});
    core::DiagnosticEmitter diagnostics;
    EXPECT_EQ(resolve_images(root, resolver, &diagnostics), 2u);

    EXPECT_EQ(root.get_if<ir::FrameData>()->background_image_base64, "Qkc=");
    EXPECT_EQ(root.children[0].get_if<ir::ImageData>()->image_base64, "TE9HTw==");
    EXPECT_TRUE(root.children[1].get_if<ir::ImageData>()->image_base64.empty());
    EXPECT_EQ(root.children[1].get_if<ir::ImageData>()->image_url, "gone.png");
    EXPECT_EQ(root.children[2].get_if<ir::ImageData>()->image_base64, "KEEP");

    const auto warnings = diagnostics.events_by_severity(core::Severity::Warning);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].stage, "images");
    EXPECT_NE(warnings[0].message.find("gone.png"), std::string::npos);

    const auto infos = diagnostics.events_by_severity(core::Severity::Info);
    ASSERT_EQ(infos.size(), 1u);
    EXPECT_EQ(infos[0].message, "fetched 2 images");
}

TEST(ResolveImagesTest, RecordsCountInExtractStats) {
    ExtractResult result;
    result.ok = true;
    ir::Node root = ir::Node::make(ir::NodeType::Frame);
    ir::Node hero = ir::Node::make(ir::NodeType::Image);
    hero.get_if<ir::ImageData>()->image_url = "hero.png";
    root.children.push_back(hero);
    result.document.root_node = root;
    result.stats.resolved_images = 7;

    TableResolver resolver(std::map<std::string, std::string>{{"hero.png", "SEVSTw=="}});
    EXPECT_EQ(resolve_images(result, resolver), 1u);
    EXPECT_EQ(result.stats.resolved_images, 1u);
    EXPECT_EQ(result.document.root_node->children[0].get_if<ir::ImageData>()->image_base64,
              "SEVSTw==");

    ExtractResult empty;
    EXPECT_EQ(resolve_images(empty, resolver), 0u);
    EXPECT_EQ(empty.stats.resolved_images, 0u);
}
