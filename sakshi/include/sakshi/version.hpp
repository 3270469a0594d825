#pragma once

#define SAKSHI_VERSION "1.4.0"
#define SAKSHI_SERVICE_NAME "sakshi"

namespace sakshi {
namespace version {

inline const char* software() { return SAKSHI_VERSION; }

} // namespace version
} // namespace sakshi
