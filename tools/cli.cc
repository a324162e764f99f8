#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "rmdup/cli_args.hh"
#include "rmdup/dedupe.hh"
#include "rmdup/format_size.hh"
#include "rmdup/resolve.hh"

namespace {

constexpr int exit_usage = 1;
constexpr int exit_error = 1;
// 128 + SIGINT
constexpr int exit_cancelled = 130;

// poll interval while waiting for an answer
constexpr int prompt_poll_ms = 100;

// SIGINT/SIGTERM sets the flag, checked between files
class interrupt_guard_t {
  std::atomic<bool> _stop{false};
  boost::asio::io_context _ioc;
  boost::asio::signal_set _signals;
  std::thread _thread;

 public:
  interrupt_guard_t() : _signals(_ioc, SIGINT, SIGTERM) {
    _signals.async_wait([this](const boost::system::error_code &ec, int) {
      if (!ec) {
        _stop = true;
      }
    });
    _thread = std::thread([this] { _ioc.run(); });
  }
  ~interrupt_guard_t() {
    _ioc.stop();
    _thread.join();
  }

  interrupt_guard_t(const interrupt_guard_t &) = delete;
  interrupt_guard_t &operator=(const interrupt_guard_t &) = delete;

  const std::atomic<bool> *stop() const noexcept { return &_stop; }
  bool stopped() const noexcept { return _stop.load(); }
};

// waits for one line on stdin, gives up as soon as stop is set
bool prompt(const std::string &msg, const std::atomic<bool> *stop) {
  std::cout << '\n' << msg << " (y/n): " << std::flush;
  pollfd pfd{STDIN_FILENO, POLLIN, 0};
  while (!rmdup::stop_requested(stop)) {
    const int ready = ::poll(&pfd, 1, prompt_poll_ms);
    if (ready < 0 && errno != EINTR) {
      return false;
    }
    if (ready > 0) {
      std::string answer;
      if (!std::getline(std::cin, answer)) {
        // end of input
        return false;
      }
      return rmdup::is_yes(answer);
    }
  }
  return false;
}

void cancelled_notice() {
  std::cerr << "\n[log] interrupted by user" << std::endl;
}

}  // namespace

int main(int argc, char *argv[]) {
  rmdup::cli_args_t cli;
  try {
    cli = rmdup::parse_args(std::vector<std::string_view>(argv + 1, argv + argc));
  } catch (const rmdup::usage_error &e) {
    std::cerr << e.what() << '\n' << rmdup::usage;
    return exit_usage;
  }
  if (cli.help) {
    std::cerr << rmdup::usage;
    return 0;
  }
  if (cli.no_confirm && !cli.delete_mode) {
    std::cerr << "[warn] --yes has no effect without --delete" << std::endl;
  }

  try {
    interrupt_guard_t guard;
    auto dupe_list = rmdup::dedupe(cli.opt, guard.stop());
    rmdup::report(std::cout, dupe_list);

    if (!cli.deletes() || dupe_list.empty()) {
      return 0;
    }
    rmdup::confirm_fn confirm;
    if (!cli.no_confirm) {
      confirm = [&guard](const std::string &msg) {
        return prompt(msg, guard.stop());
      };
    }
    auto stat = rmdup::remove_dupes(dupe_list, rmdup::rm_t::remove, std::cout,
                                    confirm, guard.stop());
    if (guard.stopped() && stat.declined) {
      // interrupted at the prompt, nothing was removed
      cancelled_notice();
      return exit_cancelled;
    }
    if (stat.declined) {
      std::cout << "deletion cancelled" << std::endl;
      return 0;
    }
    std::cout << "\nsummary:\n"
              << "  files deleted: " << stat.removed << '\n'
              << "  failed: " << stat.failed << '\n'
              << "  space reclaimed: "
              << rmdup::utils::format_size(stat.reclaimed) << std::endl;
    if (stat.cancelled || guard.stopped()) {
      cancelled_notice();
      return exit_cancelled;
    }
  } catch (const rmdup::cancelled_error &) {
    cancelled_notice();
    return exit_cancelled;
  } catch (const std::exception &e) {
    std::cerr << "[err] " << e.what() << std::endl;
    return exit_error;
  }
  return 0;
}
