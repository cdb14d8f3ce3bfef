// === Version Metadata ========================================================
//
// Exposes the library's semantic version string used in logs and result records.

#pragma once

#include <string_view>

namespace sensor_placement {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace sensor_placement
