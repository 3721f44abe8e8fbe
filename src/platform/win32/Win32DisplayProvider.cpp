#include "platform/win32/Win32DisplayProvider.hpp"

#include "utils/Log.hpp"

#include <windows.h>

namespace fk::win32
{

namespace
{
chrome::RectInt work_area_of(HMONITOR monitor)
{
    MONITORINFO mi{};
    mi.cbSize = sizeof(mi);
    if (!monitor || !GetMonitorInfoW(monitor, &mi))
    {
        FK_LOG_WARN("GetMonitorInfoW failed, using the system work area");
        RECT work{};
        SystemParametersInfoW(SPI_GETWORKAREA, 0, &work, 0);
        return {work.left, work.top, work.right - work.left,
                work.bottom - work.top};
    }
    RECT const &work = mi.rcWork;
    return {work.left, work.top, work.right - work.left,
            work.bottom - work.top};
}
} // namespace

chrome::RectInt
Win32DisplayProvider::nearest_work_area(chrome::RectInt const &bounds) const
{
    RECT rect{bounds.x, bounds.y, bounds.right(), bounds.bottom()};
    return work_area_of(MonitorFromRect(&rect, MONITOR_DEFAULTTONEAREST));
}

chrome::RectInt Win32DisplayProvider::primary_work_area() const
{
    return work_area_of(MonitorFromPoint(POINT{0, 0}, MONITOR_DEFAULTTOPRIMARY));
}

} // namespace fk::win32
