#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "cancel.hh"
#include "config.hh"
#include "file_entry.hh"

namespace rmdup {

inline namespace detail_v1 {

struct options_t {
  // directories to search, order decides which copy is kept
  std::vector<std::filesystem::path> search_dir;
  bool recursive = true;
  std::size_t prefix_len = default_prefix_len;
  // any name EVP_get_digestbyname accepts
  std::string hash_algo = default_hash_algo;
  // worker threads for same size groups
  uint32_t max_thread = 1;
};

/**
 * @brief detects duplicate files using file size, prefix and digest,
 * collisions are possible, and hard links are included.
 * the result does not depend on max_thread.
 *
 * @param opt search options
 * @param stop set from another thread to abort, may be null
 * @return vector[dupe_set_t] list of duplicates, ascending by file size
 * @throws std::invalid_argument on unknown hash_algo, prefix_len outside
 * 1..max_prefix_len or zero max_thread
 * @throws cancelled_error if stop is set before the run completes
 */
std::vector<dupe_set_t> dedupe(const options_t &opt,
                               const std::atomic<bool> *stop = nullptr);

}  // namespace detail_v1

}  // namespace rmdup
