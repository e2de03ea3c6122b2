#pragma once

#define RAGRANK_VERSION_MAJOR 0
#define RAGRANK_VERSION_MINOR 3
#define RAGRANK_VERSION_PATCH 0

#define RAGRANK_VERSION_STRING "0.3.0"

// For compile-time version checks
#define RAGRANK_VERSION \
  (RAGRANK_VERSION_MAJOR * 10000 + RAGRANK_VERSION_MINOR * 100 + RAGRANK_VERSION_PATCH)

namespace ragrank {

inline const char* Version() { return RAGRANK_VERSION_STRING; }

}  // namespace ragrank
