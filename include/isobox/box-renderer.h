#pragma once

#include <isobox/canvas.h>
#include <isobox/color.h>
#include <isobox/geometry.h>
#include <isobox/result.hpp>
#include <array>
#include <cstdint>

namespace isobox {

//=============================================================================
// BoxSpec - everything needed to draw one rounded-top box
//
// Origin is the bottom-left-back corner. Scene units are mapped to pixels
// by scale after projection.
//=============================================================================
struct BoxSpec {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    float width = 3.0f;
    float depth = 3.0f;
    float height = 2.0f;

    float angleDegrees = 30.0f;
    float scale = 40.0f;

    float topCornerRadiusPx = 6.0f;

    uint32_t topColor = color::GRAY;
    uint32_t sideColor = color::BLACK;
    uint32_t outlineColor = color::BLACK;
    float outlineWidthPx = 0.0f;  // <= 0 disables the stroke

    bool hasOutline() const { return outlineWidthPx > 0.0f; }
    bool isDegenerate() const { return width == 0.0f || depth == 0.0f || height == 0.0f; }
};

enum class BoxCorner : uint8_t {
    BottomLeftBack,
    BottomRightBack,
    BottomLeftFront,
    BottomRightFront,
    TopLeftBack,
    TopRightBack,
    TopLeftFront,
    TopRightFront,
};
constexpr size_t BOX_CORNER_COUNT = 8;

// Draw order
enum class FaceId : uint8_t {
    Bottom,
    Left,
    Right,
    Front,
    Back,
    Top,
};
constexpr size_t BOX_FACE_COUNT = 6;

const char* faceName(FaceId id);

struct Face {
    FaceId id = FaceId::Bottom;
    Quad points;
};

using BoxCorners3D = std::array<Point3D, BOX_CORNER_COUNT>;
using BoxCorners2D = std::array<Point2D, BOX_CORNER_COUNT>;

// Indexed by BoxCorner
BoxCorners3D boxCorners(const BoxSpec& spec);

// center + project(corner) * scale, indexed by BoxCorner
BoxCorners2D projectCorners(const BoxSpec& spec, Point2D center);

// Six faces in draw order: bottom, left, right, front, back, top
std::array<Face, BOX_FACE_COUNT> composeFaces(const BoxSpec& spec,
                                              float surfaceWidth,
                                              float surfaceHeight);

// Checks finiteness, rejects negative extents and non-positive scale,
// clamps the corner radius into [0, maxCornerRadius(top face)].
Result<BoxSpec> validateBoxSpec(const BoxSpec& spec, float surfaceWidth,
                                float surfaceHeight);

// Draws the box as given. Never fails; unchecked input may draw crossed or
// overlapping geometry.
void composeBox(const BoxSpec& spec, Canvas& canvas);

// validateBoxSpec() followed by composeBox()
Result<void> renderBox(const BoxSpec& spec, Canvas& canvas);

} // namespace isobox
