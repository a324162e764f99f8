#pragma once

#include <cstddef>

namespace rmdup {

// bytes compared before hashing
constexpr std::size_t default_prefix_len = 8UL;
// 8KiB
constexpr std::size_t chunk_sz = 8UL * 1024UL;
// a prefix longer than one chunk costs as much as hashing it
constexpr std::size_t max_prefix_len = chunk_sz;

constexpr auto default_hash_algo = "md5";

// upper bound for -j
constexpr unsigned max_jobs = 256U;

}  // namespace rmdup
