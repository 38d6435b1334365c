#pragma once

namespace supercast {

inline constexpr const char* kVersion = "0.4.0";

} // namespace supercast
