#pragma once

#define RIPPLE_VERSION_MAJOR 0
#define RIPPLE_VERSION_MINOR 1
#define RIPPLE_VERSION_PATCH 0

#define RIPPLE_VERSION_CODE \
  ((RIPPLE_VERSION_MAJOR << 16) | (RIPPLE_VERSION_MINOR << 8) | (RIPPLE_VERSION_PATCH))

#define RIPPLE_VERSION_STRING "0.1.0"

namespace ripple {
struct version {
  static constexpr int major = RIPPLE_VERSION_MAJOR;
  static constexpr int minor = RIPPLE_VERSION_MINOR;
  static constexpr int patch = RIPPLE_VERSION_PATCH;
  static constexpr const char* string = RIPPLE_VERSION_STRING;
};
}
