#include <ballot/election.hpp>
#include <ballot/etcd_store.hpp>
#include <ballot/log.hpp>

#include <atomic>
#include <csignal>
#include <future>
#include <iostream>
#include <thread>

namespace {
std::atomic<bool> interrupt(false);
extern "C" void signal_handler(int) {
  interrupt = true;
}
} // anonymous namespace

int main(int argc, char* argv[]) try {
  using namespace std::chrono_literals;

  if (argc != 3 and argc != 4) {
    std::cerr << "Usage: " << argv[0] << " <election> <value> [etcd-address]" << std::endl;
    return 1;
  }
  std::string election_name = argv[1];
  std::string value = argv[2];
  char const* etcd_address = argc == 3 ? "localhost:2379" : argv[3];

  ballot::log::instance().add_sink(
      ballot::make_log_sink([](ballot::severity, std::string&& x) { std::cerr << x << std::endl; }));

  auto store = std::make_shared<ballot::etcd_store>(etcd_address);
  ballot::election election(store, election_name, 5s);
  auto token = election.subscribe(
      [](std::string const& key) { std::cout << "current leader is " << key << std::endl; },
      [](std::exception_ptr ex) {
        try {
          std::rethrow_exception(ex);
        } catch (std::exception const& e) {
          std::cout << "error observing the election: " << e.what() << std::endl;
        }
      });

  std::signal(SIGINT, &signal_handler);
  std::signal(SIGTERM, &signal_handler);

  // ... the campaign blocks, run it in the background so the user can interrupt it ...
  auto elected = std::async(std::launch::async, [&election, &value]() { election.campaign(value); });
  auto r = elected.wait_for(20ms);
  while (not interrupt and r != std::future_status::ready) {
    r = elected.wait_for(20ms);
  }
  if (r != std::future_status::ready) {
    // ... there is no way to abandon a campaign, wait until it completes ...
    std::cout << "interrupted, waiting for the campaign to complete" << std::endl;
  }
  elected.get();
  std::cout << "elected as " << election.leader_key() << "... wait for interrupt" << std::endl;

  // ... wait until the user interrupts the program, good for a demo, but this is not what most programs would do ...
  while (not interrupt) {
    std::this_thread::sleep_for(20ms);
  }

  election.unsubscribe(token);
  election.resign();
  return 0;
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
