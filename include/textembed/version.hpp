#pragma once

#define TEXTEMBED_VERSION_MAJOR 0
#define TEXTEMBED_VERSION_MINOR 1
#define TEXTEMBED_VERSION_PATCH 0

#define TEXTEMBED_VERSION_STRING "0.1.0"

// For compile-time version checks
#define TEXTEMBED_VERSION \
  (TEXTEMBED_VERSION_MAJOR * 10000 + TEXTEMBED_VERSION_MINOR * 100 + TEXTEMBED_VERSION_PATCH)

namespace textembed {

inline const char* Version() { return TEXTEMBED_VERSION_STRING; }

}  // namespace textembed
