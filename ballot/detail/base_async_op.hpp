#ifndef ballot_detail_base_async_op_hpp
#define ballot_detail_base_async_op_hpp

#include <functional>
#include <memory>
#include <string>

namespace ballot {
namespace detail {

/**
 * Base class for all asynchronous operation containers.
 *
 * The application requests an asynchronous operation from a @c ballot::completion_queue, and provides a functor to
 * call when the operation completes (or is cancelled).  The completion queue creates an object derived from this
 * class to hold the functor and any buffers the operation needs, registers it, and uses its address as the gRPC tag.
 * When the operation completes the queue calls the functor with the object, then releases it.  The functor must copy
 * anything it needs to keep.
 */
struct base_async_op {
  base_async_op() {
  }

  virtual ~base_async_op() {
  }

  /**
   * Callback for the completion queue.
   *
   * The derived classes wrap the user-supplied functor in this std::function<>, that is less code than a virtual
   * function in each derived class.
   */
  std::function<void(base_async_op&, bool)> callback;

  /// The name of the operation, used in logging and to script mocks in the tests.
  std::string name;
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_base_async_op_hpp
