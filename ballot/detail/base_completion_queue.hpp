#ifndef ballot_detail_base_completion_queue_hpp
#define ballot_detail_base_completion_queue_hpp

#include <ballot/detail/base_async_op.hpp>

#include <grpc++/grpc++.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace ballot {
namespace detail {
/// A helper class for testing.
struct base_completion_queue_test_only;

/**
 * The base class for the grpc::CompletionQueue wrappers.
 *
 * Refactor the code common to all ballot::completion_queue<> template instantiations: the event loop and the table
 * of pending operations.
 */
class base_completion_queue {
public:
  /// Wake up the loop periodically to check if it should shutdown.
  static std::chrono::milliseconds constexpr loop_timeout{50};

  base_completion_queue();
  virtual ~base_completion_queue();

  /// Run the completion queue loop, returns after shutdown().
  void run();

  /// Shutdown the completion queue loop.
  void shutdown();

  /// The number of operations posted and not yet completed.
  std::size_t pending_count() const;

protected:
  friend struct ::ballot::detail::base_completion_queue_test_only;
  /// The underlying completion queue pointer for the gRPC APIs.
  grpc::CompletionQueue* cq() {
    return &queue_;
  }

  /// Save a newly created operation and return its gRPC tag.
  void* register_op(char const* where, std::shared_ptr<base_async_op> op);

  /// Get an operation given its gRPC tag, removing it from the table.
  std::shared_ptr<base_async_op> unregister_op(void* tag);

private:
  mutable std::mutex mu_;
  using pending_ops_type = std::unordered_map<std::intptr_t, std::shared_ptr<base_async_op>>;
  pending_ops_type pending_ops_;

  grpc::CompletionQueue queue_;
  std::atomic<bool> shutdown_;
};
} // namespace detail
} // namespace ballot

#endif // ballot_detail_base_completion_queue_hpp
