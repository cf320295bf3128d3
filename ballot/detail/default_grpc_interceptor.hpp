#ifndef ballot_detail_default_grpc_interceptor_hpp
#define ballot_detail_default_grpc_interceptor_hpp

#include <ballot/detail/deadline_timer.hpp>
#include <ballot/detail/stream_async_ops.hpp>

#include <grpc++/grpc++.h>

#include <memory>

namespace ballot {
namespace detail {

/**
 * Provides a dependency injection point to mock the gRPC++ library.
 *
 * The unit tests simulate the behavior of the gRPC++ library and the etcd server.  This class defines the narrow
 * interface through which ballot makes all its gRPC++ calls, the default version simply forwards them.  Please see
 * ballot::detail::mocked_grpc_interceptor for the mocked version.
 */
struct default_grpc_interceptor {
  /// Post a timer to the completion queue.
  template <typename op_type>
  void make_deadline_timer(std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    op->alarm_.reset(new grpc::Alarm(cq, op->deadline, tag));
  }

  /// Post an asynchronous unary RPC via the completion queue.
  template <typename C, typename M, typename op_type>
  void async_rpc(C* async_client, M C::*call, std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    op->rpc = (async_client->*call)(&op->context, op->request, cq);
    op->rpc->Finish(&op->response, &op->status, tag);
  }

  /// Post an asynchronous operation to create a rdwr RPC stream.
  template <typename C, typename M, typename op_type>
  void async_create_rdwr_stream(
      C* async_client, M C::*call, std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    op->stream->client = (async_client->*call)(&op->stream->context, cq, tag);
  }

  /// Post an asynchronous Write() operation over a rdwr RPC stream.
  template <typename W, typename R, typename op_type>
  void async_write(async_rdwr_stream<W, R> const& stream, std::shared_ptr<op_type> op, void* tag) {
    stream.client->Write(op->request, tag);
  }

  /// Post an asynchronous Read() operation over a rdwr RPC stream.
  template <typename W, typename R, typename op_type>
  void async_read(async_rdwr_stream<W, R> const& stream, std::shared_ptr<op_type> op, void* tag) {
    stream.client->Read(&op->response, tag);
  }

  /// Post an asynchronous WritesDone() operation over a rdwr RPC stream.
  template <typename W, typename R, typename op_type>
  void async_writes_done(async_rdwr_stream<W, R> const& stream, std::shared_ptr<op_type> op, void* tag) {
    stream.client->WritesDone(tag);
  }

  /// Post an asynchronous Finish() operation over a rdwr RPC stream.
  template <typename W, typename R, typename op_type>
  void async_finish(async_rdwr_stream<W, R> const& stream, std::shared_ptr<op_type> op, void* tag) {
    stream.client->Finish(&op->status, tag);
  }

  /// Cancel all pending operations on a rdwr RPC stream, they complete with ok == false.
  template <typename W, typename R>
  void try_cancel(async_rdwr_stream<W, R>& stream) {
    stream.context.TryCancel();
  }
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_default_grpc_interceptor_hpp
