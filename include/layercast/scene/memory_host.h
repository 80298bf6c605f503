#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "layercast/json/json.h"
#include "layercast/scene/host.h"

namespace layercast::scene {

// In-memory design host. Vector markup is parsed with nanosvg and raster
// bytes are decoded with stb_image; the resulting scene can be dumped as JSON.
class MemoryHost : public DesignHost {
public:
    struct ImageInfo {
        int width = 0;
        int height = 0;
        std::size_t byte_size = 0;
    };

    MemoryHost();
    explicit MemoryHost(std::vector<FontName> available_fonts);
    ~MemoryHost() override;

    MemoryHost(const MemoryHost&) = delete;
    MemoryHost& operator=(const MemoryHost&) = delete;

    // Inter in every weight and italic, plus the serif and monospace
    // families system fonts are mapped to.
    static std::vector<FontName> default_fonts();

    SceneNode* create_container() override;
    TextNode* create_text() override;
    SceneNode* create_vector_from_markup(const std::string& markup) override;
    SceneNode* create_rectangle() override;
    bool resolve_font(const FontName& font) override;
    std::optional<std::string> decode_image_bytes(const std::vector<std::uint8_t>& bytes) override;
    // Supports data: and file: URLs.
    std::optional<std::string> resolve_image_from_url(const std::string& url) override;
    bool attach_child(SceneNode& parent, SceneNode& child) override;

    void add_font(const FontName& font);
    bool is_font_available(const FontName& font) const;
    bool is_font_resolved(const FontName& font) const;
    const std::set<FontName>& resolved_fonts() const { return resolved_fonts_; }

    std::size_t node_count() const { return nodes_.size(); }
    // Nodes that were never attached to a parent, in creation order.
    std::vector<const SceneNode*> roots() const;
    const std::map<std::string, ImageInfo>& images() const { return images_; }
    // Number of shapes nanosvg produced for a vector node.
    std::size_t vector_shape_count(const SceneNode& node) const;

    json::Value to_json() const;
    std::string dump(int indent = 2) const;

private:
    struct NodeRecord;

    template <typename T>
    T* adopt(std::unique_ptr<T> node);

    json::Value node_to_json(const SceneNode& node) const;

    std::set<FontName> available_fonts_;
    std::set<FontName> resolved_fonts_;
    std::vector<std::unique_ptr<SceneNode>> nodes_;
    std::unordered_map<const SceneNode*, std::unique_ptr<NodeRecord>> records_;
    std::map<std::string, ImageInfo> images_;
};

}  // namespace layercast::scene
