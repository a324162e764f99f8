#include "rmdup/dedupe.hh"

#include <openssl/evp.h>

#include <chrono>
#include <exception>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

#include "rmdup/dedupe_same_sz.hh"
#include "rmdup/oss.hh"
#include "rmdup/size_index.hh"

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace rmdup {

inline namespace detail_v1 {

namespace {

// announces a stage and reports its duration when the scope ends normally
class stage_timer_t {
  const char *_stage;
  std::chrono::steady_clock::time_point _start;
  int _uncaught;

 public:
  explicit stage_timer_t(const char *stage)
      : _stage(stage),
        _start(std::chrono::steady_clock::now()),
        _uncaught(std::uncaught_exceptions()) {
    oss(std::cerr) << "[log] " << _stage << "...\n";
  }
  ~stage_timer_t() {
    if (std::uncaught_exceptions() > _uncaught) {
      return;
    }
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - _start);
    oss(std::cerr) << "[log] " << _stage << " done in " << ms.count()
                   << "ms\n";
  }

  stage_timer_t(const stage_timer_t &) = delete;
  stage_timer_t &operator=(const stage_timer_t &) = delete;
};

std::size_t file_count(const size_index_t &index) noexcept {
  std::size_t cnt = 0;
  for (const auto &[size, group] : index) {
    cnt += group.size();
  }
  return cnt;
}

}  // namespace

std::vector<dupe_set_t> dedupe(const options_t &opt,
                               const std::atomic<bool> *stop) {
  const EVP_MD *md = EVP_get_digestbyname(opt.hash_algo.c_str());
  if (md == nullptr) {
    throw std::invalid_argument("invalid hash algorithm: " + opt.hash_algo);
  }
  if (opt.prefix_len == 0 || opt.prefix_len > max_prefix_len) {
    throw std::invalid_argument("prefix length must be in 1.." +
                                std::to_string(max_prefix_len));
  }
  if (opt.max_thread == 0) {
    throw std::invalid_argument("max_thread must be > 0");
  }

  size_index_t index;
  {
    stage_timer_t stage("list files");
    index = index_by_size(opt.search_dir, opt.recursive, stop);
  }
  std::cerr << "[log] file count: " << file_count(index) << std::endl;

  const auto unique_cnt = prune_unique_sizes(index);
  std::cerr << "[log] unique size: " << unique_cnt
            << ", candidates: " << file_count(index) << std::endl;

  // one job per size, one result slot per job
  stage_timer_t stage("detect duplicates");
  std::vector<const file_group_t *> jobs;
  jobs.reserve(index.size());
  for (const auto &[size, group] : index) {
    jobs.push_back(&group);
  }
  std::vector<std::vector<dupe_set_t>> results(jobs.size());
  std::vector<std::exception_ptr> errors(jobs.size());

  auto run_job = [&](const std::size_t slot) {
    try {
      throw_if_stopped(stop);
      results[slot] =
          dedupe_same_sz(*jobs[slot], opt.prefix_len, md, stop);
    } catch (...) {
      errors[slot] = std::current_exception();
    }
  };

  if (opt.max_thread == 1 || jobs.size() < 2) {
    for (std::size_t slot = 0; slot < jobs.size(); ++slot) {
      run_job(slot);
      if (errors[slot]) {
        break;
      }
    }
  } else {
    boost::asio::thread_pool pool(opt.max_thread);
    for (std::size_t slot = 0; slot < jobs.size(); ++slot) {
      boost::asio::post(pool, [&run_job, slot] { run_job(slot); });
    }
    oss(std::cerr) << "[log] job count: " << jobs.size() << '\n';
    pool.join();
  }

  for (const auto &err : errors) {
    if (err) {
      std::rethrow_exception(err);
    }
  }
  throw_if_stopped(stop);

  std::vector<dupe_set_t> dupe_list;
  for (auto &result : results) {
    dupe_list.insert(dupe_list.end(), std::make_move_iterator(result.begin()),
                     std::make_move_iterator(result.end()));
  }
  std::cerr << "[log] duplicate group count: " << dupe_list.size() << std::endl;

  return dupe_list;
}

}  // namespace detail_v1

}  // namespace rmdup
