#pragma once

namespace pngstash {

// Semantic versioning for the library and the command-line tool
inline constexpr int version_major = 1;
inline constexpr int version_minor = 0;
inline constexpr int version_patch = 0;

inline constexpr const char* version_string = "1.0.0";

} // namespace pngstash
