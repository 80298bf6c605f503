#ifndef LAYERCAST_CORE_CONFIG_H
#define LAYERCAST_CORE_CONFIG_H

#include <cstddef>
#include <cstdint>

namespace layercast::core::config {

inline constexpr std::uint32_t kDefaultViewportWidth = 1440;
inline constexpr std::uint32_t kDefaultViewportHeight = 900;

inline constexpr const char kFallbackFontFamily[] = "Inter";
inline constexpr const char kDefaultFontStyle[] = "Regular";
inline constexpr float kDefaultFontSize = 16.0f;

// Materializer reports progress every N processed nodes.
inline constexpr std::size_t kProgressReportInterval = 50;

inline constexpr const char kDefaultRootName[] = "Imported Web Page";
inline constexpr const char kDefaultDesignPath[] = "design.json";
inline constexpr const char kDefaultScenePath[] = "scene.json";

inline constexpr const char kVersionString[] = "layercast 0.1.0";

}  // namespace layercast::core::config

#endif  // LAYERCAST_CORE_CONFIG_H
