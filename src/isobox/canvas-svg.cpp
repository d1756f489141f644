#include <isobox/canvas.h>
#include <isobox/color.h>
#include <ytrace/ytrace.hpp>

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace isobox {
namespace {

constexpr float TWO_PI = 2.0f * PI;

// Compact decimal: at most 3 fraction digits, trailing zeros dropped
std::string num(float v) {
    if (std::abs(v) < 0.0005f) v = 0.0f;
    int n = std::snprintf(nullptr, 0, "%.3f", static_cast<double>(v));
    if (n <= 0) return "0";
    std::string s(static_cast<size_t>(n) + 1, '\0');
    std::snprintf(s.data(), s.size(), "%.3f", static_cast<double>(v));
    s.resize(static_cast<size_t>(n));
    auto dot = s.find('.');
    if (dot != std::string::npos) {
        while (s.back() == '0') s.pop_back();
        if (s.back() == '.') s.pop_back();
    }
    return s;
}

std::string pointStr(Point2D p) {
    return num(p.x) + " " + num(p.y);
}

// One SVG elliptical-arc command; the arc must span less than a full turn
void appendArc(std::ostringstream& d, float radius, float sweep, Point2D end) {
    int largeArc = std::abs(sweep) > PI ? 1 : 0;
    int sweepFlag = sweep > 0.0f ? 1 : 0;  // y-down: positive angles run clockwise
    d << " A " << num(radius) << " " << num(radius) << " 0 "
      << largeArc << " " << sweepFlag << " " << pointStr(end);
}

struct SvgElement {
    std::string pathData;
    uint32_t color;
    float strokeWidth;  // 0 = fill
};

} // namespace

std::string toSvgPathData(const Path& path) {
    std::ostringstream d;
    bool first = true;

    for (const auto& cmd : path.commands()) {
        if (!first) d << " ";
        first = false;

        switch (cmd.verb) {
            case PathVerb::MoveTo:
                d << "M " << pointStr(cmd.point);
                break;
            case PathVerb::LineTo:
                d << "L " << pointStr(cmd.point);
                break;
            case PathVerb::ArcTo: {
                Point2D start = cmd.arcStart();
                if (&cmd == &path.commands().front()) {
                    d << "M " << pointStr(start);
                } else {
                    d << "L " << pointStr(start);
                }
                if (cmd.radius > 0.0f && cmd.sweepAngle != 0.0f) {
                    if (std::abs(cmd.sweepAngle) >= TWO_PI) {
                        // Full circle: two half turns
                        float half = cmd.sweepAngle > 0.0f ? PI : -PI;
                        Point2D mid = {cmd.center.x + cmd.radius * std::cos(cmd.startAngle + half),
                                       cmd.center.y + cmd.radius * std::sin(cmd.startAngle + half)};
                        appendArc(d, cmd.radius, half, mid);
                        appendArc(d, cmd.radius, half, start);
                    } else {
                        appendArc(d, cmd.radius, cmd.sweepAngle, cmd.point);
                    }
                }
                break;
            }
            case PathVerb::Close:
                d << "Z";
                break;
        }
    }
    return d.str();
}

namespace {

class SvgCanvasImpl : public SvgCanvas {
public:
    SvgCanvasImpl(float width, float height)
        : _width(width), _height(height) {}

    Result<void> init() {
        if (!std::isfinite(_width) || !std::isfinite(_height) ||
            _width <= 0.0f || _height <= 0.0f) {
            return Err("SvgCanvas: invalid surface size " +
                       num(_width) + "x" + num(_height));
        }
        return Ok();
    }

    float width() const override { return _width; }
    float height() const override { return _height; }

    void fillPath(const Path& path, uint32_t color) override {
        if (path.empty()) return;
        _elements.push_back({toSvgPathData(path), color, 0.0f});
    }

    void strokePath(const Path& path, uint32_t color, float strokeWidth) override {
        if (path.empty() || strokeWidth <= 0.0f) return;
        _elements.push_back({toSvgPathData(path), color, strokeWidth});
    }

    void setBgColor(uint32_t c) override { _bgColor = c; }
    uint32_t bgColor() const override { return _bgColor; }

    std::string buildSvg() const override {
        std::ostringstream out;
        out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        out << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << num(_width)
            << "\" height=\"" << num(_height) << "\" viewBox=\"0 0 " << num(_width)
            << " " << num(_height) << "\">\n";

        if (color::alpha(_bgColor) != 0) {
            out << "  <rect width=\"100%\" height=\"100%\" fill=\""
                << color::toHex(_bgColor) << "\"" << opacityAttr("fill-opacity", _bgColor)
                << "/>\n";
        }

        for (const auto& e : _elements) {
            out << "  <path d=\"" << e.pathData << "\"";
            if (e.strokeWidth > 0.0f) {
                out << " fill=\"none\" stroke=\"" << color::toHex(e.color) << "\""
                    << opacityAttr("stroke-opacity", e.color)
                    << " stroke-width=\"" << num(e.strokeWidth) << "\""
                    << " stroke-linejoin=\"round\"";
            } else {
                out << " fill=\"" << color::toHex(e.color) << "\""
                    << opacityAttr("fill-opacity", e.color);
            }
            out << "/>\n";
        }
        out << "</svg>\n";
        return out.str();
    }

    Result<void> writeFile(const std::string& path) const override {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return Err("SvgCanvas: cannot open for writing: " + path);
        }
        std::string svg = buildSvg();
        file.write(svg.data(), static_cast<std::streamsize>(svg.size()));
        if (!file) {
            return Err("SvgCanvas: write failed: " + path);
        }
        yinfo("SvgCanvas: wrote {} elements ({} bytes) to {}",
              _elements.size(), svg.size(), path);
        return Ok();
    }

private:
    static std::string opacityAttr(const char* name, uint32_t c) {
        uint8_t a = color::alpha(c);
        if (a == 0xFF) return {};
        return std::string(" ") + name + "=\"" + num(a / 255.0f) + "\"";
    }

    float _width;
    float _height;
    uint32_t _bgColor = color::TRANSPARENT;
    std::vector<SvgElement> _elements;
};

} // namespace

Result<SvgCanvas::Ptr> SvgCanvas::createImpl(float width, float height) {
    auto impl = std::make_shared<SvgCanvasImpl>(width, height);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to create SvgCanvas", res);
    }
    return Ok<Ptr>(std::move(impl));
}

} // namespace isobox
