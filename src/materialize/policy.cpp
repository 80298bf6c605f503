#include "layercast/materialize/policy.h"

#include "layercast/core/config.h"

namespace layercast::materialize {

std::vector<scene::FontName> font_candidates(const std::string& family, const std::string& style,
                                             const std::string& fallback_family) {
    const std::string regular = core::config::kDefaultFontStyle;
    return {
        {family, style},
        {family, regular},
        {fallback_family, style},
        {fallback_family, regular},
    };
}

const char* image_source_name(ImageSource source) {
    switch (source) {
        case ImageSource::Base64: return "imageBase64";
        case ImageSource::Url: return "imageUrl";
    }
    return "imageBase64";
}

const std::vector<ImageSource>& image_source_policy() {
    static const std::vector<ImageSource> policy = {ImageSource::Base64, ImageSource::Url};
    return policy;
}

}  // namespace layercast::materialize
