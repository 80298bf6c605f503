#include "layercast/extract/image_resolver.h"

#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

#include "layercast/core/base64.h"
#include "layercast/url/url.h"

namespace layercast::extract {

namespace {

bool read_binary_file(const std::string& path, std::string& bytes, std::string& error) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        error = "cannot open " + path;
        return false;
    }
    bytes.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    if (input.bad()) {
        error = "read failed for " + path;
        return false;
    }
    return true;
}

std::string join_path(const std::string& directory, const std::string& relative) {
    if (directory.empty() || relative.front() == '/') return relative;
    if (directory.back() == '/') return directory + relative;
    return directory + "/" + relative;
}

std::optional<std::string> resolve_data_url(const std::string& image_url, std::string& error) {
    url::DataUrl data;
    if (!url::parse_data_url(image_url, data, error)) return std::nullopt;

    if (data.is_base64) {
        std::vector<std::uint8_t> bytes;
        if (!core::base64_decode(data.payload, bytes)) {
            error = "invalid base64 payload in data URL";
            return std::nullopt;
        }
        return core::base64_encode(bytes);
    }

    std::string decoded;
    if (!url::percent_decode(data.payload, decoded, error)) return std::nullopt;
    return core::base64_encode(decoded);
}

class ImageWalker {
public:
    ImageWalker(ImageResolver& resolver, core::DiagnosticEmitter* diagnostics)
        : resolver_(resolver), diagnostics_(diagnostics) {}

    void visit(ir::Node& node) {
        if (auto* image = node.get_if<ir::ImageData>()) {
            if (image->image_base64.empty() && !image->image_url.empty()) {
                resolve_into(image->image_url, image->image_base64, "image");
            }
        } else if (auto* frame = node.get_if<ir::FrameData>()) {
            if (frame->background_image_base64.empty() && !frame->background_image_url.empty()) {
                resolve_into(frame->background_image_url, frame->background_image_base64,
                             "background image");
            }
        }
        for (auto& child : node.children) visit(child);
    }

    std::size_t resolved() const { return resolved_; }

private:
    void resolve_into(const std::string& image_url, std::string& target, const char* what) {
        std::string error;
        auto encoded = resolver_.resolve(image_url, error);
        if (!encoded) {
            if (diagnostics_ != nullptr) {
                diagnostics_->warning("extract", "images",
                                      std::string("could not fetch ") + what + " " +
                                          image_url + ": " + error);
            }
            return;
        }
        target = std::move(*encoded);
        resolved_++;
    }

    ImageResolver& resolver_;
    core::DiagnosticEmitter* diagnostics_;
    std::size_t resolved_ = 0;
};

}  // namespace

LocalImageResolver::LocalImageResolver(std::string base_directory)
    : base_directory_(std::move(base_directory)) {}

std::optional<std::string> LocalImageResolver::resolve(const std::string& image_url,
                                                       std::string& error) {
    error.clear();
    if (image_url.empty()) {
        error = "empty image URL";
        return std::nullopt;
    }

    const std::string scheme = url::scheme_of(image_url);
    if (scheme == "data") return resolve_data_url(image_url, error);

    std::string path;
    if (scheme == "file") {
        if (!url::file_url_to_path(image_url, path, error)) return std::nullopt;
    } else if (scheme.empty()) {
        std::string decoded;
        const std::string relative = image_url.substr(0, image_url.find_first_of("?#"));
        if (relative.empty() || !url::percent_decode(relative, decoded, error)) {
            if (error.empty()) error = "empty image path";
            return std::nullopt;
        }
        path = join_path(base_directory_, decoded);
    } else {
        error = "unsupported scheme '" + scheme + "' (no network access)";
        return std::nullopt;
    }

    std::string bytes;
    if (!read_binary_file(path, bytes, error)) return std::nullopt;
    if (bytes.empty()) {
        error = path + " is empty";
        return std::nullopt;
    }
    return core::base64_encode(bytes);
}

std::size_t resolve_images(ir::Node& root, ImageResolver& resolver,
                           core::DiagnosticEmitter* diagnostics) {
    ImageWalker walker(resolver, diagnostics);
    walker.visit(root);
    if (diagnostics != nullptr) {
        diagnostics->info("extract", "images",
                          "fetched " + std::to_string(walker.resolved()) + " images");
    }
    return walker.resolved();
}

std::size_t resolve_images(ExtractResult& result, ImageResolver& resolver,
                           core::DiagnosticEmitter* diagnostics) {
    result.stats.resolved_images = 0;
    if (result.document.root_node) {
        result.stats.resolved_images =
            resolve_images(*result.document.root_node, resolver, diagnostics);
    }
    return result.stats.resolved_images;
}

}  // namespace layercast::extract
