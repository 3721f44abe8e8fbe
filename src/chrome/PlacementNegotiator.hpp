#pragma once

#include "chrome/Geometry.hpp"
#include "chrome/NativeWindow.hpp"

#include <vector>

namespace fk::chrome
{

struct PlacedWindow
{
    RectInt restore_bounds;
    double scale_factor = 1.0;
};

// Shrink to fit, then translate so neither edge leaves the work area. Each
// axis is handled on its own; applying it twice changes nothing.
RectInt clamp_to_work_area(RectInt rect, RectInt const &work_area) noexcept;

// Spawn placement for a new window. First fit with restart: each overlap
// moves the candidate just below the window it hit and the scan starts
// over, at most once per existing window. The result is always on a display
// even when no free slot was found.
class PlacementNegotiator
{
  public:
    explicit PlacementNegotiator(DisplayProvider const &displays,
                                 double footprint_logical_height = 32.0);

    RectInt place(RectInt const &candidate,
                  std::vector<PlacedWindow> const &existing) const;

    RectInt clamp_to_display(RectInt const &rect) const;

    // Side of the overlap footprint for a window at `scale_factor`.
    int footprint_side(double scale_factor) const noexcept;

  private:
    DisplayProvider const &displays_;
    double footprint_logical_height_;
};

} // namespace fk::chrome
