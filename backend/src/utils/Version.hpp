#pragma once

namespace tl::version
{

// Compile-time helpers derived from TL_BUILD_VERSION that keep user-facing
// strings consistent.
inline constexpr char const kSemanticVersion[] = TL_BUILD_VERSION;
inline constexpr char const kDisplayVersion[] = "Torrential " TL_BUILD_VERSION;
inline constexpr char const kUserAgentVersion[] =
    "Torrential/" TL_BUILD_VERSION;

} // namespace tl::version
