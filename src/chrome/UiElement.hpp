#pragma once

#include "chrome/Geometry.hpp"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fk::chrome
{

enum class ElementCategory
{
    Panel,
    SelectableGrid,
    MenuBar,
    MenuBarItem,
    Expander,
    CommandBar,
    ScrollBar,
    TextBlock,
    ScrollViewer,
    TabView,
    TabViewItem,
    // A control that owns a transient overlay of its own (color picker,
    // drop down).
    OverlayOwner,
    Other,
};

enum class UiEvent
{
    SizeChanged,
    Loaded,
    Unloaded,
    OverlayOpened,
    OverlayClosed,
};

class UiElement;

struct TabStripParts
{
    UiElement const *header = nullptr;
    Thickness header_margin;
    UiElement const *footer = nullptr;
    // Top padding of the owning tab view.
    double padding_top = 0.0;
};

// Thrown by tree accessors once the tree is being torn down (window closing
// while a menu unload notification is still in flight).
class TreeClosedError : public std::runtime_error
{
  public:
    explicit TreeClosedError(std::string const &what)
      : std::runtime_error(what)
    {
    }
};

// A node of the host UI tree as seen by the drag region logic. Positions are
// logical units relative to the root of the window content.
class UiElement
{
  public:
    virtual ~UiElement() = default;

    virtual ElementCategory category() const = 0;
    virtual std::vector<UiElement *> children() const = 0;

    // False once the element has left the live tree.
    virtual bool is_attached() const = 0;
    virtual bool is_loaded() const = 0;

    virtual PointF offset_from_root() const = 0;
    virtual SizeF actual_size() const = 0;

    virtual bool has_hyperlink() const
    {
        return false;
    }
    virtual bool vertical_scroll_bar_visible() const
    {
        return false;
    }
    virtual std::optional<TabStripParts> tab_strip() const
    {
        return std::nullopt;
    }
    virtual UiElement *selected_tab() const
    {
        return nullptr;
    }
    // First item of a menu bar item's drop down; its loaded and unloaded
    // events bracket the drop down being open.
    virtual UiElement *first_menu_item() const
    {
        return nullptr;
    }
    virtual bool has_context_overlay() const
    {
        return false;
    }

    // Returns false when the element never raises `event`.
    virtual bool subscribe(UiEvent event, std::function<void()> handler) = 0;
};

} // namespace fk::chrome
