#include "chrome/PlacementNegotiator.hpp"

#include "utils/Log.hpp"

#include <algorithm>

namespace fk::chrome
{

namespace
{
void clamp_axis(int &origin, int &length, int work_origin,
                int work_length) noexcept
{
    length = std::min(length, work_length);
    if (origin + length > work_origin + work_length)
    {
        origin = work_origin + work_length - length;
    }
    if (origin < work_origin)
    {
        origin = work_origin;
    }
}
} // namespace

RectInt clamp_to_work_area(RectInt rect, RectInt const &work_area) noexcept
{
    clamp_axis(rect.x, rect.width, work_area.x, work_area.width);
    clamp_axis(rect.y, rect.height, work_area.y, work_area.height);
    return rect;
}

PlacementNegotiator::PlacementNegotiator(DisplayProvider const &displays,
                                         double footprint_logical_height)
  : displays_(displays),
    footprint_logical_height_(footprint_logical_height)
{
}

int PlacementNegotiator::footprint_side(double scale_factor) const noexcept
{
    return to_device_size(footprint_logical_height_, scale_factor);
}

RectInt PlacementNegotiator::clamp_to_display(RectInt const &rect) const
{
    return clamp_to_work_area(rect, displays_.nearest_work_area(rect));
}

RectInt PlacementNegotiator::place(
    RectInt const &candidate, std::vector<PlacedWindow> const &existing) const
{
    RectInt rect = clamp_to_display(candidate);
    size_t restarts = 0;

    for (size_t index = 0; index < existing.size();)
    {
        auto const &other = existing[index];
        int const side = footprint_side(other.scale_factor);
        RectInt const footprint{rect.x, rect.y, side, side};
        RectInt const other_footprint{other.restore_bounds.x,
                                      other.restore_bounds.y, side, side};

        if (!footprint.intersects(other_footprint))
        {
            ++index;
            continue;
        }
        if (restarts >= existing.size())
        {
            FK_LOG_DEBUG("placement gave up after {} restarts at ({}, {})",
                         restarts, rect.x, rect.y);
            break;
        }

        rect.x = other.restore_bounds.x;
        rect.y = other.restore_bounds.y + side + 1;
        rect = clamp_to_display(rect);
        ++restarts;
        index = 0;
    }

    return clamp_to_display(rect);
}

} // namespace fk::chrome
