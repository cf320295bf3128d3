#ifndef ballot_detail_append_annotations_hpp
#define ballot_detail_append_annotations_hpp

#include <utility>

namespace ballot {
namespace detail {

/// Append an empty list of annotations to a stream.
template <typename Stream>
inline void append_annotations(Stream&) {
}

/**
 * Append a list of annotations to a stream.
 *
 * Error messages and trace lines are built from a variable number of values, e.g. an operation name, a key, and a
 * revision.  This function inserts all of them, in order, using operator<<.
 *
 * @tparam Stream the type of the stream, typically std::ostream.
 * @tparam H the type of the first annotation in the list.
 * @tparam Tail the type of the remaining annotations in the list.
 */
template <typename Stream, typename H, typename... Tail>
inline void append_annotations(Stream& os, H&& h, Tail&&... t) {
  os << std::forward<H>(h);
  append_annotations(os, std::forward<Tail>(t)...);
}

} // namespace detail
} // namespace ballot

#endif // ballot_detail_append_annotations_hpp
