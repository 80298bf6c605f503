#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "layercast/core/diagnostics.h"
#include "layercast/extract/extractor.h"
#include "layercast/ir/node.h"

namespace layercast::extract {

// Turns an image reference into base64-encoded bytes.
class ImageResolver {
public:
    virtual ~ImageResolver() = default;

    // std::nullopt when the image cannot be resolved; `error` says why.
    virtual std::optional<std::string> resolve(const std::string& image_url, std::string& error) = 0;
};

// Resolves data: URIs, file: URLs and paths relative to a base directory.
// Remote schemes are reported as unsupported.
class LocalImageResolver : public ImageResolver {
public:
    explicit LocalImageResolver(std::string base_directory = ".");

    std::optional<std::string> resolve(const std::string& image_url, std::string& error) override;

    const std::string& base_directory() const { return base_directory_; }

private:
    std::string base_directory_;
};

// Offers every IMAGE imageUrl and FRAME backgroundImageUrl to `resolver` and
// stores the result in imageBase64 / backgroundImageBase64. Failures are
// warnings; the node keeps its URL. Returns the number of images resolved.
std::size_t resolve_images(ir::Node& root, ImageResolver& resolver,
                           core::DiagnosticEmitter* diagnostics = nullptr);

// Same pass over an extraction result; the count lands in
// stats.resolved_images.
std::size_t resolve_images(ExtractResult& result, ImageResolver& resolver,
                           core::DiagnosticEmitter* diagnostics = nullptr);

}  // namespace layercast::extract
