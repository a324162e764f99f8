#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <vector>

#include "file_entry.hh"

namespace rmdup {

inline namespace detail_v1 {

// byte size -> files of that size, ascending by size
using size_index_t = std::map<uint64_t, file_group_t>;

/**
 * @brief list regular files under each root and group them by size.
 * roots are walked in the given order, depth first, directory entries
 * sorted by name. symlinks to files are indexed, symlinks to directories
 * are not followed. missing roots and unreadable entries are skipped.
 *
 * @param search_dir directories to search
 * @param recursive descend into subdirectories
 * @param stop polled between entries, may be null
 * @return size_index_t every regular file found, keyed by size
 * @throws cancelled_error if stop is set during the walk
 */
size_index_t index_by_size(const std::vector<std::filesystem::path> &search_dir,
                           const bool recursive = true,
                           const std::atomic<bool> *stop = nullptr);

/**
 * @brief drop sizes held by a single file, they cannot have duplicates
 *
 * @return number of files dropped
 */
std::size_t prune_unique_sizes(size_index_t &index) noexcept;

}  // namespace detail_v1

}  // namespace rmdup
