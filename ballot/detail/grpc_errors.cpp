#include "ballot/detail/grpc_errors.hpp"

#include <google/protobuf/text_format.h>

#include <string>

namespace ballot {
namespace detail {

std::ostream& operator<<(std::ostream& os, print_to_stream const& x) {
  // ... on failure we just print an empty string ...
  std::string formatted;
  (void)google::protobuf::TextFormat::PrintToString(x.msg, &formatted);
  return os << formatted;
}

} // namespace detail
} // namespace ballot
