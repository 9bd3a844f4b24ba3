#include <cadence/affine.hpp>
#include <cmath>
#include <type_traits>

namespace cadence
{

Affine2D Affine2D::rotation(double radians)
{
    double s = std::sin(radians);
    double k = std::cos(radians);
    return {k, s, -s, k, 0.0, 0.0};
}

Affine2D Affine2D::concatenated(const Affine2D& n) const
{
    Affine2D r;
    r.a  = a * n.a + b * n.c;
    r.b  = a * n.b + b * n.d;
    r.c  = c * n.a + d * n.c;
    r.d  = c * n.b + d * n.d;
    r.tx = tx * n.a + ty * n.c + n.tx;
    r.ty = tx * n.b + ty * n.d + n.ty;
    return r;
}

bool approx_equal(const Affine2D& lhs, const Affine2D& rhs, double eps)
{
    return std::abs(lhs.a - rhs.a) <= eps && std::abs(lhs.b - rhs.b) <= eps
           && std::abs(lhs.c - rhs.c) <= eps && std::abs(lhs.d - rhs.d) <= eps
           && std::abs(lhs.tx - rhs.tx) <= eps && std::abs(lhs.ty - rhs.ty) <= eps;
}

std::optional<Affine2D> compose(const std::vector<Transform>& transforms)
{
    std::optional<Affine2D> result;
    for (const auto& t : transforms)
    {
        std::visit(
            [&](const auto& op)
            {
                using T = std::decay_t<decltype(op)>;
                if constexpr (std::is_same_v<T, transform::Rotate>)
                {
                    double rad = degrees_to_radians(op.degrees);
                    result     = result ? result->rotated(rad) : Affine2D::rotation(rad);
                }
                else if constexpr (std::is_same_v<T, transform::Scale>)
                {
                    result = result ? result->scaled(op.x, op.y) : Affine2D::scaling(op.x, op.y);
                }
                else if constexpr (std::is_same_v<T, transform::Move>)
                {
                    result = result ? result->translated(op.x, op.y)
                                    : Affine2D::translation(op.x, op.y);
                }
            },
            t);
    }
    return result;
}

}   // namespace cadence
