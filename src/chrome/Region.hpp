#pragma once

#include "chrome/Geometry.hpp"

#include <vector>

namespace fk::chrome
{

enum class RegionKind
{
    Caption,
    Passthrough,
};

// Tagged rectangles in client device pixels. Rectangles of one tag never
// overlap each other and Caption never intersects Passthrough.
class Region
{
  public:
    Region() = default;

    static Region whole_caption(SizeInt client_size);
    static Region all_passthrough(SizeInt client_size);

    // Claims `rect` for ordinary input, carving it out of the Caption area.
    void add_passthrough(RectInt const &rect);

    std::vector<RectInt> const &rects(RegionKind kind) const noexcept
    {
        return kind == RegionKind::Caption ? caption_ : passthrough_;
    }
    bool empty(RegionKind kind) const noexcept
    {
        return rects(kind).empty();
    }

    bool operator==(Region const &) const = default;

  private:
    std::vector<RectInt> caption_;
    std::vector<RectInt> passthrough_;
};

} // namespace fk::chrome
