#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "config.hh"
#include "file_entry.hh"

namespace rmdup {

inline namespace detail_v1 {

/**
 * @brief read the first bytes of a file, a short file yields all of it
 *
 * @param path file to read
 * @param len maximum number of bytes
 * @return std::optional<std::string> prefix bytes, nullopt on read error
 */
std::optional<std::string> read_prefix(const std::filesystem::path &path,
                                       const std::size_t len);

/**
 * @brief split files of one size by their first bytes.
 * unreadable files are excluded, groups of one file are dropped.
 * each group keeps the input order.
 *
 * @param file_list files of the same size
 * @param len prefix length in bytes
 * @param stop polled between files, may be null
 * @return vector[group] groups of at least two files, ordered by prefix
 * @throws cancelled_error if stop is set
 */
std::vector<file_group_t> filter_by_prefix(
    std::span<const file_entry_t> file_list,
    const std::size_t len = default_prefix_len,
    const std::atomic<bool> *stop = nullptr);

}  // namespace detail_v1

}  // namespace rmdup
