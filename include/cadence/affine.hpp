#pragma once

#include <cmath>
#include <optional>
#include <variant>
#include <vector>

namespace cadence
{

struct Point
{
    double x = 0.0;
    double y = 0.0;
};

// ─── Affine2D ────────────────────────────────────────────────────────────────
// Row-vector convention (CoreGraphics): [x' y' 1] = [x y 1] * | a  b  0 |
//                                                             | c  d  0 |
//                                                             | tx ty 1 |
struct Affine2D
{
    double a = 1.0, b = 0.0;
    double c = 0.0, d = 1.0;
    double tx = 0.0, ty = 0.0;

    static constexpr Affine2D identity() { return {}; }
    static Affine2D           rotation(double radians);
    static constexpr Affine2D scaling(double sx, double sy) { return {sx, 0.0, 0.0, sy, 0.0, 0.0}; }
    static constexpr Affine2D translation(double x, double y) { return {1.0, 0.0, 0.0, 1.0, x, y}; }

    // `this` followed by `next`: points go through `this` first.
    Affine2D concatenated(const Affine2D& next) const;

    // The new operation is applied before the existing transform,
    // matching CGAffineTransformRotate / Scale / Translate.
    Affine2D rotated(double radians) const { return rotation(radians).concatenated(*this); }
    Affine2D scaled(double sx, double sy) const { return scaling(sx, sy).concatenated(*this); }
    Affine2D translated(double x, double y) const { return translation(x, y).concatenated(*this); }

    Point apply(Point p) const { return {a * p.x + c * p.y + tx, b * p.x + d * p.y + ty}; }

    bool is_identity() const { return *this == identity(); }

    bool operator==(const Affine2D& o) const
    {
        return a == o.a && b == o.b && c == o.c && d == o.d && tx == o.tx && ty == o.ty;
    }
    bool operator!=(const Affine2D& o) const { return !(*this == o); }
};

bool approx_equal(const Affine2D& lhs, const Affine2D& rhs, double eps = 1e-9);

// ─── Transform ───────────────────────────────────────────────────────────────

namespace transform
{
struct Rotate
{
    double degrees = 0.0;
};
struct Scale
{
    double x = 1.0;
    double y = 1.0;
};
struct Move
{
    double x = 0.0;
    double y = 0.0;
};
}   // namespace transform

using Transform = std::variant<transform::Rotate, transform::Scale, transform::Move>;

// Fold a transform list into one matrix. The first entry seeds the matrix and
// each later one is applied on top of it. Empty list → std::nullopt (leave the
// target's transform alone).
std::optional<Affine2D> compose(const std::vector<Transform>& transforms);

inline constexpr double degrees_to_radians(double degrees)
{
    return degrees * (3.14159265358979323846 / 180.0);
}

}   // namespace cadence
