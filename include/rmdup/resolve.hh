#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "file_entry.hh"
#include "rm_t.hh"

namespace rmdup {

inline namespace detail_v1 {

// asked once before anything is removed, true means go ahead
using confirm_fn = std::function<bool(const std::string &)>;

/**
 * @brief accepted answers to a confirmation: y, yes, o, oui.
 * case and surrounding blanks are ignored, anything else is a no.
 */
bool is_yes(std::string_view answer);

struct remove_stat_t {
  std::size_t removed = 0;
  std::size_t failed = 0;
  uint64_t reclaimed = 0;
  bool declined = false;
  bool cancelled = false;
};

/**
 * @brief bytes freed by removing every copy but the first
 */
uint64_t recoverable_space(const dupe_set_t &dupe_set) noexcept;
uint64_t recoverable_space(const std::vector<dupe_set_t> &dupe_list) noexcept;

// number of files a remove would delete
std::size_t delete_count(const std::vector<dupe_set_t> &dupe_list) noexcept;

/**
 * @brief print every group with the kept and removable files,
 * followed by the total recoverable space
 */
void report(std::ostream &os, const std::vector<dupe_set_t> &dupe_list);

/**
 * @brief remove all but the first file of each set, best effort.
 * a failed remove is logged and counted, the rest still proceed.
 *
 * @param dupe_list confirmed duplicate sets
 * @param rm_meth rm_t::log only logs, rm_t::remove deletes
 * @param log_stream receives one line per handled file
 * @param confirm asked once before deleting, null means pre-authorized
 * @param stop checked before each file, may be null
 * @return remove_stat_t what was done, partial if cancelled
 */
remove_stat_t remove_dupes(const std::vector<dupe_set_t> &dupe_list,
                           const rm_t rm_meth, std::ostream &log_stream,
                           const confirm_fn &confirm = nullptr,
                           const std::atomic<bool> *stop = nullptr);

}  // namespace detail_v1

}  // namespace rmdup
