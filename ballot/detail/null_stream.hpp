#ifndef ballot_detail_null_stream_hpp
#define ballot_detail_null_stream_hpp

namespace ballot {
namespace detail {
/**
 * A stream that discards anything inserted into it.
 *
 * BALLOT_LOG() expands to an insertion into this stream when the severity is disabled at compile-time, the optimizer
 * removes the whole expression.
 */
struct null_stream {
  template <typename T>
  null_stream& operator<<(T const&) {
    return *this;
  }

  null_stream& operator<<(char const*) {
    return *this;
  }
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_null_stream_hpp
