#include "ballot/log_severity.hpp"

#include <iostream>

namespace ballot {

std::ostream& operator<<(std::ostream& os, severity x) {
  static char const* const names[] = {
      "trace", "debug", "info", "notice", "warning", "error", "critical", "alert", "fatal",
  };
  return os << names[int(x)];
}

} // namespace ballot
