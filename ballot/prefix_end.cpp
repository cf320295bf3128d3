#include "ballot/prefix_end.hpp"

#include <cstdint>

namespace ballot {

std::string prefix_end(std::string const& prefix) {
  // ... find the last byte that is not 0xFF, increment it, and drop everything after it ...
  std::string range_end = prefix;
  while (not range_end.empty()) {
    auto last = static_cast<std::uint8_t>(range_end.back());
    if (last != 0xFF) {
      range_end.back() = static_cast<char>(last + 1);
      return range_end;
    }
    range_end.pop_back();
  }
  // ... all the bytes were 0xFF (or the prefix was empty), etcd uses "\0" to mean "all keys >= key" ...
  return std::string(1, '\0');
}

} // namespace ballot
