#include "chrome/Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace fk::chrome
{

bool RectInt::contains(PointInt point) const noexcept
{
    return point.x >= x && point.x < right() && point.y >= y &&
           point.y < bottom();
}

bool RectInt::intersects(RectInt const &other) const noexcept
{
    if (is_empty() || other.is_empty())
    {
        return false;
    }
    return x < other.right() && other.x < right() && y < other.bottom() &&
           other.y < bottom();
}

double scale_factor_from_dpi(unsigned dpi) noexcept
{
    return dpi == 0 ? 1.0 : static_cast<double>(dpi) / kDefaultDpi;
}

int to_device_size(double value, double scale_factor) noexcept
{
    constexpr double kMax = std::numeric_limits<short>::max();
    return static_cast<int>(
        std::lround(std::clamp(value * scale_factor, 0.0, kMax)));
}

RectInt scaled_rect(PointF location, SizeF size, double scale_factor) noexcept
{
    return RectInt{static_cast<int>(std::lround(location.x * scale_factor)),
                   static_cast<int>(std::lround(location.y * scale_factor)),
                   static_cast<int>(std::lround(size.width * scale_factor)),
                   static_cast<int>(std::lround(size.height * scale_factor))};
}

std::vector<RectInt> subtract(RectInt const &a, RectInt const &b)
{
    if (a.is_empty())
    {
        return {};
    }
    if (!a.intersects(b))
    {
        return {a};
    }

    std::vector<RectInt> pieces;
    pieces.reserve(4);

    int const top = std::max(a.y, b.y);
    int const bottom = std::min(a.bottom(), b.bottom());

    // full width bands above and below, then the left and right remainders
    if (b.y > a.y)
    {
        pieces.push_back({a.x, a.y, a.width, b.y - a.y});
    }
    if (b.bottom() < a.bottom())
    {
        pieces.push_back({a.x, b.bottom(), a.width, a.bottom() - b.bottom()});
    }
    if (b.x > a.x)
    {
        pieces.push_back({a.x, top, b.x - a.x, bottom - top});
    }
    if (b.right() < a.right())
    {
        pieces.push_back({b.right(), top, a.right() - b.right(), bottom - top});
    }
    return pieces;
}

} // namespace fk::chrome
