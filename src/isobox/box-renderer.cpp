#include <isobox/box-renderer.h>
#include <isobox/projector.h>
#include <isobox/rounded-path.h>
#include <ytrace/ytrace.hpp>

#include <cmath>
#include <initializer_list>
#include <string>

namespace isobox {
namespace {

constexpr size_t idx(BoxCorner c) { return static_cast<size_t>(c); }

Quad quadOf(const BoxCorners2D& c, BoxCorner a, BoxCorner b, BoxCorner d, BoxCorner e) {
    return {c[idx(a)], c[idx(b)], c[idx(d)], c[idx(e)]};
}

Quad topQuad(const BoxCorners2D& c) {
    return quadOf(c, BoxCorner::TopLeftBack, BoxCorner::TopRightBack,
                  BoxCorner::TopRightFront, BoxCorner::TopLeftFront);
}

void drawFace(Canvas& canvas, const Path& path, uint32_t fill,
              const BoxSpec& spec) {
    canvas.fillPath(path, fill);
    if (spec.hasOutline()) {
        canvas.strokePath(path, spec.outlineColor, spec.outlineWidthPx);
    }
}

bool allFinite(std::initializer_list<float> values) {
    for (float v : values) {
        if (!std::isfinite(v)) return false;
    }
    return true;
}

} // namespace

const char* faceName(FaceId id) {
    switch (id) {
        case FaceId::Bottom: return "bottom";
        case FaceId::Left:   return "left";
        case FaceId::Right:  return "right";
        case FaceId::Front:  return "front";
        case FaceId::Back:   return "back";
        case FaceId::Top:    return "top";
    }
    return "unknown";
}

BoxCorners3D boxCorners(const BoxSpec& s) {
    const float x0 = s.x, x1 = s.x + s.width;
    const float y0 = s.y, y1 = s.y + s.depth;
    const float z0 = s.z, z1 = s.z + s.height;

    BoxCorners3D c;
    c[idx(BoxCorner::BottomLeftBack)]   = {x0, y0, z0};
    c[idx(BoxCorner::BottomRightBack)]  = {x1, y0, z0};
    c[idx(BoxCorner::BottomLeftFront)]  = {x0, y1, z0};
    c[idx(BoxCorner::BottomRightFront)] = {x1, y1, z0};
    c[idx(BoxCorner::TopLeftBack)]      = {x0, y0, z1};
    c[idx(BoxCorner::TopRightBack)]     = {x1, y0, z1};
    c[idx(BoxCorner::TopLeftFront)]     = {x0, y1, z1};
    c[idx(BoxCorner::TopRightFront)]    = {x1, y1, z1};
    return c;
}

BoxCorners2D projectCorners(const BoxSpec& spec, Point2D center) {
    BoxCorners3D corners = boxCorners(spec);
    BoxCorners2D out;
    for (size_t i = 0; i < BOX_CORNER_COUNT; ++i) {
        out[i] = center + project(corners[i], spec.angleDegrees) * spec.scale;
    }
    return out;
}

std::array<Face, BOX_FACE_COUNT> composeFaces(const BoxSpec& spec,
                                              float surfaceWidth,
                                              float surfaceHeight) {
    Point2D center{surfaceWidth / 2.0f, surfaceHeight / 2.0f};
    BoxCorners2D c = projectCorners(spec, center);

    using C = BoxCorner;
    return {{
        {FaceId::Bottom, quadOf(c, C::BottomLeftBack, C::BottomRightBack,
                                C::BottomRightFront, C::BottomLeftFront)},
        {FaceId::Left,   quadOf(c, C::BottomLeftBack, C::TopLeftBack,
                                C::TopLeftFront, C::BottomLeftFront)},
        {FaceId::Right,  quadOf(c, C::BottomRightBack, C::TopRightBack,
                                C::TopRightFront, C::BottomRightFront)},
        {FaceId::Front,  quadOf(c, C::BottomLeftFront, C::TopLeftFront,
                                C::TopRightFront, C::BottomRightFront)},
        {FaceId::Back,   quadOf(c, C::BottomLeftBack, C::TopLeftBack,
                                C::TopRightBack, C::BottomRightBack)},
        {FaceId::Top,    topQuad(c)},
    }};
}

Result<BoxSpec> validateBoxSpec(const BoxSpec& spec, float surfaceWidth,
                                float surfaceHeight) {
    if (!allFinite({spec.x, spec.y, spec.z, spec.width, spec.depth, spec.height,
                    spec.angleDegrees, spec.scale, spec.topCornerRadiusPx,
                    spec.outlineWidthPx, surfaceWidth, surfaceHeight})) {
        return Err<BoxSpec>("BoxSpec: non-finite value");
    }
    if (spec.width < 0.0f || spec.depth < 0.0f || spec.height < 0.0f) {
        return Err<BoxSpec>("BoxSpec: negative extent " + std::to_string(spec.width) +
                            "x" + std::to_string(spec.depth) + "x" +
                            std::to_string(spec.height));
    }
    if (spec.scale <= 0.0f) {
        return Err<BoxSpec>("BoxSpec: scale must be positive, got " +
                            std::to_string(spec.scale));
    }

    Point2D center{surfaceWidth / 2.0f, surfaceHeight / 2.0f};
    for (const Point2D& p : projectCorners(spec, center)) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
            return Err<BoxSpec>("BoxSpec: projected geometry is not finite");
        }
    }

    BoxSpec out = spec;
    if (out.isDegenerate()) {
        ydebug("BoxSpec: zero-extent box {}x{}x{}", out.width, out.depth, out.height);
    }

    if (out.topCornerRadiusPx < 0.0f) {
        ywarn("BoxSpec: negative corner radius {} clamped to 0", out.topCornerRadiusPx);
        out.topCornerRadiusPx = 0.0f;
    }

    float maxRadius = maxCornerRadius(topQuad(projectCorners(out, center)));
    if (out.topCornerRadiusPx > maxRadius) {
        ywarn("BoxSpec: corner radius {} clamped to {}", out.topCornerRadiusPx, maxRadius);
        out.topCornerRadiusPx = maxRadius;
    }
    return Ok(out);
}

void composeBox(const BoxSpec& spec, Canvas& canvas) {
    auto faces = composeFaces(spec, canvas.width(), canvas.height());

    // Flat faces back to front; the top face must be drawn last so it wins
    // the shared edges with the side faces.
    for (const auto& face : faces) {
        if (face.id == FaceId::Top) continue;
        drawFace(canvas, buildQuadPath(face.points), spec.sideColor, spec);
    }

    const Face& top = faces[static_cast<size_t>(FaceId::Top)];
    drawFace(canvas, buildRoundedPath(top.points, spec.topCornerRadiusPx),
             spec.topColor, spec);
}

Result<void> renderBox(const BoxSpec& spec, Canvas& canvas) {
    auto validated = validateBoxSpec(spec, canvas.width(), canvas.height());
    if (!validated) {
        return Err("renderBox: invalid box", validated);
    }
    composeBox(*validated, canvas);
    ydebug("renderBox: {} on {} {}x{}", validated->hasOutline() ? "outlined" : "filled",
           canvas.typeName(), canvas.width(), canvas.height());
    return Ok();
}

} // namespace isobox
