#pragma once

#include <isobox/base/object.h>
#include <isobox/base/factory.h>
#include <isobox/path.h>
#include <isobox/result.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace isobox {

//=============================================================================
// Canvas - abstract drawing surface
//
// Renderers only fill and stroke paths; the surface size gives them the
// viewport center. Implementations:
//   - RecordingCanvas: keeps every call in order (tests, --dump)
//   - SvgCanvas: serializes calls into an SVG document
//=============================================================================
class Canvas : public base::Object {
public:
    using Ptr = std::shared_ptr<Canvas>;

    const char* typeName() const override { return "Canvas"; }

    virtual float width() const = 0;
    virtual float height() const = 0;

    virtual void fillPath(const Path& path, uint32_t color) = 0;
    virtual void strokePath(const Path& path, uint32_t color, float strokeWidth) = 0;

protected:
    Canvas() = default;
};

//=============================================================================
// DrawCall - one recorded fill or stroke
//=============================================================================
struct DrawCall {
    enum class Kind : uint8_t { Fill, Stroke };

    Kind kind = Kind::Fill;
    Path path;
    uint32_t color = 0;
    float strokeWidth = 0.0f;  // 0 for fills
};

//=============================================================================
// RecordingCanvas
//=============================================================================
class RecordingCanvas : public Canvas,
                        public base::ObjectFactory<RecordingCanvas> {
public:
    using Ptr = std::shared_ptr<RecordingCanvas>;

    static Result<Ptr> createImpl(float width, float height);

    const char* typeName() const override { return "RecordingCanvas"; }

    virtual const std::vector<DrawCall>& calls() const = 0;
    virtual size_t fillCount() const = 0;
    virtual size_t strokeCount() const = 0;
    virtual void clear() = 0;

protected:
    RecordingCanvas() = default;
};

//=============================================================================
// SvgCanvas
//=============================================================================
class SvgCanvas : public Canvas,
                  public base::ObjectFactory<SvgCanvas> {
public:
    using Ptr = std::shared_ptr<SvgCanvas>;

    static Result<Ptr> createImpl(float width, float height);

    const char* typeName() const override { return "SvgCanvas"; }

    // Transparent (the default) emits no background rect
    virtual void setBgColor(uint32_t color) = 0;
    virtual uint32_t bgColor() const = 0;

    virtual std::string buildSvg() const = 0;
    virtual Result<void> writeFile(const std::string& path) const = 0;

protected:
    SvgCanvas() = default;
};

// SVG path data ("M .. L .. A .. Z") for a path
std::string toSvgPathData(const Path& path);

} // namespace isobox
