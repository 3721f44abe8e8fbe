#pragma once

#include <string>

#include <windows.h>

namespace fk::win32
{

inline std::wstring widen(std::string const &value)
{
    if (value.empty())
    {
        return {};
    }
    int len = MultiByteToWideChar(CP_UTF8, 0, value.data(),
                                  static_cast<int>(value.size()), nullptr, 0);
    if (len <= 0)
    {
        return {};
    }
    std::wstring out(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, value.data(),
                        static_cast<int>(value.size()), out.data(), len);
    return out;
}

inline std::string narrow(std::wstring const &value)
{
    if (value.empty())
    {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, value.data(),
                                  static_cast<int>(value.size()), nullptr, 0,
                                  nullptr, nullptr);
    if (len <= 0)
    {
        return {};
    }
    std::string out(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, value.data(),
                        static_cast<int>(value.size()), out.data(), len,
                        nullptr, nullptr);
    return out;
}

} // namespace fk::win32
