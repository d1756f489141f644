#include <isobox/canvas.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cmath>

namespace isobox {
namespace {

class RecordingCanvasImpl : public RecordingCanvas {
public:
    RecordingCanvasImpl(float width, float height)
        : _width(width), _height(height) {}

    Result<void> init() {
        if (!std::isfinite(_width) || !std::isfinite(_height) ||
            _width <= 0.0f || _height <= 0.0f) {
            return Err("RecordingCanvas: invalid surface size " +
                       std::to_string(_width) + "x" + std::to_string(_height));
        }
        return Ok();
    }

    float width() const override { return _width; }
    float height() const override { return _height; }

    void fillPath(const Path& path, uint32_t color) override {
        _calls.push_back({DrawCall::Kind::Fill, path, color, 0.0f});
    }

    void strokePath(const Path& path, uint32_t color, float strokeWidth) override {
        _calls.push_back({DrawCall::Kind::Stroke, path, color, strokeWidth});
    }

    const std::vector<DrawCall>& calls() const override { return _calls; }

    size_t fillCount() const override { return countKind(DrawCall::Kind::Fill); }
    size_t strokeCount() const override { return countKind(DrawCall::Kind::Stroke); }

    void clear() override { _calls.clear(); }

private:
    size_t countKind(DrawCall::Kind kind) const {
        return static_cast<size_t>(std::count_if(
            _calls.begin(), _calls.end(),
            [kind](const DrawCall& c) { return c.kind == kind; }));
    }

    float _width;
    float _height;
    std::vector<DrawCall> _calls;
};

} // namespace

Result<RecordingCanvas::Ptr> RecordingCanvas::createImpl(float width, float height) {
    auto impl = std::make_shared<RecordingCanvasImpl>(width, height);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to create RecordingCanvas", res);
    }
    ydebug("RecordingCanvas created: {}x{}", width, height);
    return Ok<Ptr>(std::move(impl));
}

} // namespace isobox
