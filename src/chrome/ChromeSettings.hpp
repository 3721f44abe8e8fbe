#pragma once

#include "chrome/Geometry.hpp"

#include <chrono>

namespace fk::chrome
{

struct ChromeSettings
{
    SizeF min_logical_size{410.0, 480.0};
    SizeF initial_logical_size{563.0, 614.0};
    // Side of the square used to detect overlapping spawn positions; the
    // height of the custom title bar.
    double footprint_logical_height = 32.0;
    std::chrono::milliseconds drag_region_debounce{125};
    // Device pixel x offset of a keyboard opened system menu.
    int keyboard_menu_offset_x = 3;
};

} // namespace fk::chrome
