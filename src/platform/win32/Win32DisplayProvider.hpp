#pragma once

#include "chrome/NativeWindow.hpp"

namespace fk::win32
{

class Win32DisplayProvider : public chrome::DisplayProvider
{
  public:
    chrome::RectInt nearest_work_area(chrome::RectInt const &bounds) const override;
    chrome::RectInt primary_work_area() const override;
};

} // namespace fk::win32
