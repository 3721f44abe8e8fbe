#include "chrome/WindowChrome.hpp"

#include <utility>

namespace fk::chrome
{

WindowChrome::WindowChrome(std::unique_ptr<NativeWindow> window,
                           Scheduler &scheduler,
                           std::unique_ptr<MenuSurface> menu,
                           ChromeSettings const &settings)
  : window_(std::move(window)),
    tracker_(*window_,
             {[this] { drag_regions_.set_window_drag_regions(); },
              [this] { menu_.update_enabled_state(); }}),
    menu_(*window_, tracker_, metrics_, std::move(menu),
          settings.keyboard_menu_offset_x),
    drag_regions_(*window_, metrics_, scheduler,
                  settings.drag_region_debounce),
    interceptor_(*window_, metrics_, settings.min_logical_size,
                 {[this](bool via_keyboard) { menu_.show(via_keyboard); },
                  [this] { menu_.hide(); },
                  [this](bool position_changed, bool size_changed) {
                      tracker_.on_bounds_changed(position_changed,
                                                 size_changed);
                  },
                  [this] { tracker_.on_presenter_changed(); }})
{
}

} // namespace fk::chrome
