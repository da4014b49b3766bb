// === Version Metadata ========================================================
//
// Exposes the store locator's semantic version string used in logs, the
// default HTTP user agent and the usage banner.

#pragma once

#include <string_view>

namespace store_locator {

inline constexpr std::string_view k_version{"1.0.0"};

}  // namespace store_locator
