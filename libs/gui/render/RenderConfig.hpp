#pragma once

// Feature flags for the shape primitives
#ifndef VANTAGE_CULL_OFFSCREEN_SHAPES
#define VANTAGE_CULL_OFFSCREEN_SHAPES 1  // Default ON - skip shapes outside the visible time range
#endif

#ifndef VANTAGE_TEXT_SHADOW
#define VANTAGE_TEXT_SHADOW 1            // Dark halo behind shape labels
#endif

namespace vantage::render {

constexpr bool kCullOffscreenShapes = VANTAGE_CULL_OFFSCREEN_SHAPES != 0;
constexpr bool kTextShadow = VANTAGE_TEXT_SHADOW != 0;

// Fallbacks when a descriptor leaves a style field empty
inline constexpr const char* kShapeColor = "#2196F3";
inline constexpr const char* kBoxBackground = "rgba(33, 150, 243, 0.1)";
inline constexpr const char* kLabelColor = "#ffffff";

// Label font sizes in media px
constexpr double kLineLabelPx = 10.0;
constexpr double kBoxLabelPx = 11.0;
constexpr double kArrowLabelPx = 10.0;
constexpr double kGlyphLabelPx = 9.0;

// Dash patterns in media px
constexpr double kDashLength = 5.0;
constexpr double kDotLength = 2.0;

} // namespace vantage::render
