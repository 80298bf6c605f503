#pragma once

#include <cstddef>
#include <string>

#include "layercast/core/config.h"
#include "layercast/core/diagnostics.h"
#include "layercast/ir/node.h"
#include "layercast/materialize/progress.h"
#include "layercast/scene/host.h"

namespace layercast::materialize {

struct MaterializeOptions {
    std::string fallback_font_family = core::config::kFallbackFontFamily;
    std::size_t progress_interval = core::config::kProgressReportInterval;
    // Root container name when the document has no page title.
    std::string default_root_name = core::config::kDefaultRootName;
    float default_width = static_cast<float>(core::config::kDefaultViewportWidth);
    float default_height = static_cast<float>(core::config::kDefaultViewportHeight);
};

struct MaterializeResult {
    bool ok = false;
    std::string message;
    scene::SceneNode* root = nullptr;  // owned by the host
    std::size_t layer_count = 0;       // IR nodes visited
    std::size_t placeholder_count = 0;
    // IR nodes the host could not create a layer for; each one is warned about.
    std::size_t skipped_count = 0;
};

// Rebuilds an IR document as a scene tree through a DesignHost. Every node is
// fully styled before it is attached to its parent and before its children
// are built. Per-node failures become placeholders; only a document without
// a root node, checked before the host is touched, fails the run.
class Materializer {
public:
    explicit Materializer(scene::DesignHost& host, MaterializeOptions options = {},
                          ProgressReporter* progress = nullptr,
                          core::DiagnosticEmitter* diagnostics = nullptr);

    MaterializeResult run(const ir::Document& document);

private:
    scene::DesignHost& host_;
    MaterializeOptions options_;
    ProgressReporter* progress_;
    core::DiagnosticEmitter* diagnostics_;
};

MaterializeResult materialize_document(const ir::Document& document, scene::DesignHost& host,
                                       const MaterializeOptions& options = {},
                                       ProgressReporter* progress = nullptr,
                                       core::DiagnosticEmitter* diagnostics = nullptr);

// Width or height as the host receives it: at least 1.
float clamp_dimension(float value);

}  // namespace layercast::materialize
