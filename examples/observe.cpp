#include <ballot/election.hpp>
#include <ballot/etcd_store.hpp>
#include <ballot/errors.hpp>
#include <ballot/log.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

namespace {
std::atomic<bool> interrupt(false);
extern "C" void signal_handler(int) {
  interrupt = true;
}
} // anonymous namespace

int main(int argc, char* argv[]) try {
  if (argc != 2 and argc != 3) {
    std::cerr << "Usage: " << argv[0] << " <election> [etcd-address]" << std::endl;
    return 1;
  }
  std::string election_name = argv[1];
  char const* etcd_address = argc == 2 ? "localhost:2379" : argv[2];

  ballot::log::instance().add_sink(
      ballot::make_log_sink([](ballot::severity, std::string&& x) { std::cerr << x << std::endl; }));

  auto store = std::make_shared<ballot::etcd_store>(etcd_address);
  ballot::election observer(store, election_name);
  try {
    std::cout << "current leader is " << observer.get_leader() << std::endl;
  } catch (ballot::no_leader_error const&) {
    std::cout << "no current leader" << std::endl;
  }

  auto token = observer.subscribe(
      [](std::string const& key) { std::cout << "new leader is " << key << std::endl; },
      [](std::exception_ptr ex) {
        try {
          std::rethrow_exception(ex);
        } catch (std::exception const& e) {
          std::cout << "error observing the election: " << e.what() << std::endl;
        }
      });

  // ... block here until a signal is received ...
  std::signal(SIGINT, &signal_handler);
  std::signal(SIGTERM, &signal_handler);
  using namespace std::chrono_literals;
  while (not interrupt) {
    std::this_thread::sleep_for(20ms);
  }

  observer.unsubscribe(token);
  return 0;
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
