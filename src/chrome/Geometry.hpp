#pragma once

#include <vector>

namespace fk::chrome
{

// Device pixel geometry.
struct PointInt
{
    int x = 0;
    int y = 0;

    bool operator==(PointInt const &) const = default;
};

struct SizeInt
{
    int width = 0;
    int height = 0;

    bool operator==(SizeInt const &) const = default;
};

struct RectInt
{
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    int right() const noexcept
    {
        return x + width;
    }
    int bottom() const noexcept
    {
        return y + height;
    }
    PointInt top_left() const noexcept
    {
        return {x, y};
    }
    SizeInt size() const noexcept
    {
        return {width, height};
    }
    bool is_empty() const noexcept
    {
        return width <= 0 || height <= 0;
    }

    bool contains(PointInt point) const noexcept;
    // True when both rectangles are non-empty and share interior area.
    bool intersects(RectInt const &other) const noexcept;

    bool operator==(RectInt const &) const = default;
};

// Logical (scale independent) geometry as reported by the UI tree.
struct PointF
{
    double x = 0.0;
    double y = 0.0;

    bool operator==(PointF const &) const = default;
};

struct SizeF
{
    double width = 0.0;
    double height = 0.0;
};

struct Thickness
{
    double left = 0.0;
    double top = 0.0;
    double right = 0.0;
    double bottom = 0.0;
};

inline constexpr double kDefaultDpi = 96.0;

double scale_factor_from_dpi(unsigned dpi) noexcept;

// Logical length to device pixels, clamped to the range a native window
// coordinate can hold.
int to_device_size(double value, double scale_factor) noexcept;

RectInt scaled_rect(PointF location, SizeF size, double scale_factor) noexcept;

// The parts of `a` not covered by `b`, as at most four rectangles.
std::vector<RectInt> subtract(RectInt const &a, RectInt const &b);

} // namespace fk::chrome
