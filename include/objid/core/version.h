#pragma once

namespace objid::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "0.1";

}  // namespace objid::core
