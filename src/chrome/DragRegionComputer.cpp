#include "chrome/DragRegionComputer.hpp"

namespace fk::chrome
{

RegionRole classify(UiElement const &element)
{
    switch (element.category())
    {
    case ElementCategory::Panel:
        return RegionRole::TransparentContainer;
    case ElementCategory::SelectableGrid:
    case ElementCategory::MenuBar:
    case ElementCategory::Expander:
    case ElementCategory::CommandBar:
    case ElementCategory::ScrollBar:
        return RegionRole::PassthroughClaim;
    case ElementCategory::TextBlock:
        return element.has_hyperlink() ? RegionRole::PassthroughClaim
                                       : RegionRole::CaptionClaim;
    case ElementCategory::ScrollViewer:
        return element.vertical_scroll_bar_visible()
                   ? RegionRole::PassthroughClaim
                   : RegionRole::TransparentContainer;
    case ElementCategory::TabView:
        return RegionRole::TabStrip;
    case ElementCategory::MenuBarItem:
    case ElementCategory::TabViewItem:
    case ElementCategory::OverlayOwner:
    case ElementCategory::Other:
        break;
    }
    return RegionRole::TransparentContainer;
}

Region DragRegionComputer::recompute(UiElement const &root,
                                     SizeInt client_size,
                                     double scale_factor) const
{
    Region region = Region::whole_caption(client_size);
    locate_passthrough(region, root, scale_factor);
    return region;
}

void DragRegionComputer::locate_passthrough(Region &region,
                                            UiElement const &item,
                                            double scale_factor) const
{
    for (UiElement const *child : item.children())
    {
        if (child == nullptr)
        {
            continue;
        }
        // the rest of this level is being unloaded too
        if (!child->is_attached())
        {
            return;
        }

        switch (classify(*child))
        {
        case RegionRole::TransparentContainer:
            locate_passthrough(region, *child, scale_factor);
            break;
        case RegionRole::CaptionClaim:
            break;
        case RegionRole::PassthroughClaim:
            region.add_passthrough(scaled_rect(child->offset_from_root(),
                                               child->actual_size(),
                                               scale_factor));
            break;
        case RegionRole::TabStrip:
            add_tab_strip(region, *child, scale_factor);
            if (UiElement const *tab = child->selected_tab())
            {
                locate_passthrough(region, *tab, scale_factor);
            }
            break;
        }
    }
}

void DragRegionComputer::add_tab_strip(Region &region,
                                       UiElement const &tab_view,
                                       double scale_factor) const
{
    auto parts = tab_view.tab_strip();
    if (!parts || parts->header == nullptr || parts->footer == nullptr)
    {
        return;
    }

    PointF const header_offset = parts->header->offset_from_root();
    PointF const footer_offset = parts->footer->offset_from_root();
    SizeF const header_size = parts->header->actual_size();
    SizeF const footer_size = parts->footer->actual_size();

    // the tabs live between the trailing edge of the header and the footer
    PointF const top_left{header_offset.x + parts->header_margin.left +
                              header_size.width + parts->header_margin.right,
                          footer_offset.y + parts->padding_top};
    SizeF const size{footer_offset.x - top_left.x, footer_size.height};

    region.add_passthrough(scaled_rect(top_left, size, scale_factor));
}

} // namespace fk::chrome
