#pragma once

namespace fk::version
{

// Derived from FK_BUILD_VERSION so the log banner and window titles agree.
inline constexpr char const kDisplayVersion[] = "FrameKit " FK_BUILD_VERSION;

} // namespace fk::version
