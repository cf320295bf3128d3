/**
 * @file
 *
 * Helper functions to handle errors reported by gRPC++
 */
#ifndef ballot_detail_grpc_errors_hpp
#define ballot_detail_grpc_errors_hpp

#include <ballot/detail/append_annotations.hpp>
#include <ballot/errors.hpp>

#include <google/protobuf/message.h>
#include <grpc++/grpc++.h>

#include <sstream>

namespace ballot {
namespace detail {

/**
 * Raise a ballot::store_error if @a status is not OK.
 *
 * @param status the status returned by the gRPC operation.
 * @param where a string to let the user know where the error took place.
 * @param a a list of annotations appended (using operator<<) to the exception message.
 * @throws ballot::store_error if @a status.ok() is false.
 */
template <typename Location, typename... Annotations>
void check_grpc_status(grpc::Status const& status, Location const& where, Annotations&&... a) {
  if (status.ok()) {
    return;
  }
  std::ostringstream os;
  os << where << " grpc error: " << status.error_message() << " [" << status.error_code() << "]";
  detail::append_annotations(os, std::forward<Annotations>(a)...);
  throw store_error(os.str(), status.error_code());
}

/**
 * Print a protobuf on a std::ostream.
 *
 * Uses google::protobuf::TextFormat::PrintToString to print a protobuf:
 *
 * @code
 * etcdserverpb::TxnRequest const& req = ...;
 * BALLOT_LOG(trace) << "commit " << print_to_stream(req);
 * @endcode
 */
struct print_to_stream {
  explicit print_to_stream(google::protobuf::Message const& m)
      : msg(m) {
  }

  google::protobuf::Message const& msg;
};

/// Streaming operator
std::ostream& operator<<(std::ostream& os, print_to_stream const& x);

} // namespace detail
} // namespace ballot

#endif // ballot_detail_grpc_errors_hpp
