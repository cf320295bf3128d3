#ifndef ballot_detail_scoped_watcher_hpp
#define ballot_detail_scoped_watcher_hpp

#include <ballot/watcher.hpp>

#include <memory>

namespace ballot {
namespace detail {

/**
 * Cancel a ballot::watcher when the scope exits.
 *
 * Watches hold resources in the server, the election code must release them on every exit path, including when an
 * exception is propagating.
 */
class scoped_watcher {
public:
  explicit scoped_watcher(std::unique_ptr<watcher> w)
      : watcher_(std::move(w)) {
  }

  scoped_watcher(scoped_watcher const&) = delete;
  scoped_watcher& operator=(scoped_watcher const&) = delete;

  ~scoped_watcher() noexcept(false) {
    release();
  }

  /// Cancel the watch now, it is safe to call this more than once.
  void release() {
    if (not watcher_) {
      return;
    }
    auto w = std::move(watcher_);
    w->cancel();
  }

  explicit operator bool() const {
    return (bool)watcher_;
  }

private:
  std::unique_ptr<watcher> watcher_;
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_scoped_watcher_hpp
