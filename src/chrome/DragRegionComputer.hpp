#pragma once

#include "chrome/Geometry.hpp"
#include "chrome/Region.hpp"
#include "chrome/UiElement.hpp"

namespace fk::chrome
{

enum class RegionRole
{
    // Layout only: look at the children.
    TransparentContainer,
    // Leaves the area under it draggable; nothing below needs a look.
    CaptionClaim,
    // Interactive: its bounds take ordinary input.
    PassthroughClaim,
    // Tab view: the strip between header and footer plus the active tab.
    TabStrip,
};

RegionRole classify(UiElement const &element);

// Walks a UI tree and tags the client area. The whole client area starts as
// Caption; there is no separate title bar.
class DragRegionComputer
{
  public:
    // May throw TreeClosedError when the tree is mid teardown.
    Region recompute(UiElement const &root, SizeInt client_size,
                     double scale_factor) const;

  private:
    void locate_passthrough(Region &region, UiElement const &item,
                            double scale_factor) const;
    void add_tab_strip(Region &region, UiElement const &tab_view,
                       double scale_factor) const;
};

} // namespace fk::chrome
