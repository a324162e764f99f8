#pragma once

#include <openssl/evp.h>

#include <atomic>
#include <cstddef>
#include <span>
#include <vector>

#include "file_entry.hh"

namespace rmdup {

inline namespace detail_v1 {

/**
 * @brief detects duplicate files of the same size,
 * prefix comparison first, then full content digest.
 * collisions are possible, and hard links are included.
 *
 * @param file_list files of the same size, in traversal order
 * @param prefix_len prefix length in bytes
 * @param md digest algorithm
 * @param stop polled between files, may be null
 * @return vector[dupe_set_t] list of duplicates
 */
std::vector<dupe_set_t> dedupe_same_sz(std::span<const file_entry_t> file_list,
                                       const std::size_t prefix_len,
                                       const EVP_MD *md,
                                       const std::atomic<bool> *stop = nullptr);

}  // namespace detail_v1

}  // namespace rmdup
