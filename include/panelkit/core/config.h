#ifndef PANELKIT_CORE_CONFIG_H
#define PANELKIT_CORE_CONFIG_H

#include <cstdint>

namespace panelkit::core::config {

inline constexpr std::uint32_t kDefaultDpi = 96;
inline constexpr float kDefaultViewportWidth = 1280.0f;
inline constexpr float kDefaultViewportHeight = 720.0f;
inline constexpr float kDefaultSpacing = 0.0f;
inline constexpr float kDefaultStarWeight = 1.0f;

// Module names used when emitting diagnostics.
inline constexpr const char kModuleLayout[] = "layout";
inline constexpr const char kModuleStack[] = "stack";
inline constexpr const char kModuleDock[] = "dock";
inline constexpr const char kModuleGrid[] = "grid";

}  // namespace panelkit::core::config

#endif  // PANELKIT_CORE_CONFIG_H
