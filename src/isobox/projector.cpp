#include <isobox/projector.h>

#include <cmath>

namespace isobox {

Point2D project(float x, float y, float z, float angleDegrees) {
    float rad = degToRad(angleDegrees);
    float isoX = (x - y) * std::cos(rad);
    float isoY = (x + y) * std::sin(rad) - z;
    return {isoX, isoY};
}

} // namespace isobox
