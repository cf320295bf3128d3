#include "ballot/log.hpp"

#include <algorithm>

namespace {
std::once_flag log_initialized;
} // anonymous namespace

namespace ballot {

std::unique_ptr<log> log::singleton_;

log& log::instance() {
  std::call_once(log_initialized, []() { singleton_.reset(new log); });
  return *singleton_;
}

void log::add_sink(std::shared_ptr<log_sink> sink) {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.push_back(std::move(sink));
}

void log::remove_sink(std::shared_ptr<log_sink> const& sink) {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void log::clear_sinks() {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.clear();
}

void log::write(severity sev, std::string&& msg) {
  std::vector<std::shared_ptr<log_sink>> sinks;
  {
    std::lock_guard<std::mutex> guard(mu_);
    if (sinks_.empty() or sev < min_severity_) {
      return;
    }
    sinks = sinks_;
  }
  // ... the sinks are called without holding the lock, a sink may log too ...
  if (sinks.size() == 1) {
    sinks[0]->log(sev, std::move(msg));
    return;
  }
  for (auto const& s : sinks) {
    std::string copy(msg);
    s->log(sev, std::move(copy));
  }
}

logger<false>::logger(severity s, char const* func, char const* file, int lineno, log& sink)
    : os_()
    , sev_(s)
    , function_(func)
    , filename_(file)
    , lineno_(lineno)
    , closed_(sev_ < sink.min_severity()) {
  if (closed_) {
    return;
  }
  os_ << "[" << sev_ << "] ";
}

void logger<false>::write_to(log& sink) {
  closed_ = true;
  os_ << " in " << function_ << "(" << filename_ << ":" << lineno_ << ")";
  sink.write(sev_, os_.str());
}

} // namespace ballot
