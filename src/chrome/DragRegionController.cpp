#include "chrome/DragRegionController.hpp"

#include "utils/Log.hpp"

#include <exception>
#include <utility>

namespace fk::chrome
{

DragRegionController::DragRegionController(
    NativeWindow &window, WindowMetrics const &metrics, Scheduler &scheduler,
    std::chrono::milliseconds debounce_interval)
  : window_(window),
    metrics_(metrics),
    debounce_(scheduler, debounce_interval, [this] { apply_now(); })
{
}

void DragRegionController::set_window_drag_regions()
{
    // defer while the window is still being resized or its content scrolled;
    // an explicit request ends a clear unless an overlay is still open
    if (!overlay_open())
    {
        debounce_.resume();
    }
    debounce_.request();
}

void DragRegionController::clear_window_drag_regions()
{
    // A right click that selects a tab raises a size change and queues a
    // recompute, then opens the context menu. That queued recompute must not
    // reinstate the caption under the open menu.
    debounce_.suppress();

    if (window_.supports_region_customization())
    {
        window_.clear_region_rects(RegionKind::Caption);
    }
    current_ = Region::all_passthrough(window_.client_size());
}

void DragRegionController::apply_now()
{
    debounce_.resume();

    try
    {
        if (content_ == nullptr || !content_->is_loaded() ||
            !window_.supports_region_customization())
        {
            return;
        }
        install(compute());
    }
    catch (std::exception const &ex)
    {
        FK_LOG_WARN("drag regions not updated, content unavailable: {}",
                    ex.what());
    }
}

Region DragRegionController::compute() const
{
    SizeInt const client = window_.client_size();
    if (overlay_open())
    {
        return Region::all_passthrough(client);
    }
    if (content_ == nullptr)
    {
        return Region::whole_caption(client);
    }
    return computer_.recompute(*content_, client, metrics_.scale_factor);
}

void DragRegionController::install(Region region)
{
    if (region.empty(RegionKind::Caption))
    {
        window_.clear_region_rects(RegionKind::Caption);
    }
    else
    {
        window_.set_region_rects(RegionKind::Caption,
                                 region.rects(RegionKind::Caption));
    }
    window_.set_region_rects(RegionKind::Passthrough,
                             region.rects(RegionKind::Passthrough));
    current_ = std::move(region);
}

void DragRegionController::overlay_opened()
{
    ++open_overlays_;
    clear_window_drag_regions();
}

void DragRegionController::overlay_closed()
{
    if (open_overlays_ > 0)
    {
        --open_overlays_;
    }
    if (open_overlays_ == 0)
    {
        debounce_.resume();
        debounce_.request();
    }
}

void DragRegionController::add_drag_region_event_handlers(UiElement &root)
{
    if (content_ == nullptr)
    {
        content_ = &root;
    }
    // the last size event carries the final layout
    root.subscribe(UiEvent::SizeChanged, [this] { set_window_drag_regions(); });
    root.subscribe(UiEvent::Loaded, [this] { set_window_drag_regions(); });
    subscribe_subtree(root);
}

void DragRegionController::subscribe_subtree(UiElement &item)
{
    auto const request = [this] { set_window_drag_regions(); };
    auto const opened = [this] { overlay_opened(); };
    auto const closed = [this] { overlay_closed(); };

    if (item.has_context_overlay())
    {
        item.subscribe(UiEvent::OverlayOpened, opened);
        item.subscribe(UiEvent::OverlayClosed, closed);
    }

    for (UiElement *child : item.children())
    {
        if (child == nullptr)
        {
            continue;
        }

        switch (child->category())
        {
        case ElementCategory::MenuBar:
            child->subscribe(UiEvent::SizeChanged, request);
            child->subscribe(UiEvent::Loaded, request);
            break;

        case ElementCategory::MenuBarItem:
            if (UiElement *first = child->first_menu_item())
            {
                first->subscribe(UiEvent::Loaded, opened);
                first->subscribe(UiEvent::Unloaded, closed);
                continue;
            }
            break;

        case ElementCategory::Expander:
            child->subscribe(UiEvent::SizeChanged, request);
            break;

        case ElementCategory::OverlayOwner:
            child->subscribe(UiEvent::OverlayOpened, opened);
            child->subscribe(UiEvent::OverlayClosed, closed);
            continue;

        case ElementCategory::SelectableGrid:
            child->subscribe(UiEvent::SizeChanged, request);
            continue;

        default:
            break;
        }

        subscribe_subtree(*child);
    }
}

} // namespace fk::chrome
