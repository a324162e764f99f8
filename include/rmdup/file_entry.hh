#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace rmdup {

inline namespace detail_v1 {

class file_entry_t {
  std::filesystem::path _path;
  uint64_t _size = 0;

 public:
  template <typename Tp>
  inline file_entry_t(Tp &&path, const uint64_t size) noexcept(
      noexcept(std::filesystem::path(std::forward<Tp>(path))))
      : _path(std::forward<Tp>(path)), _size(size) {}

  inline file_entry_t(const file_entry_t &rhs) = default;
  inline file_entry_t(file_entry_t &&rhs) = default;
  inline file_entry_t &operator=(const file_entry_t &rhs) = default;
  inline file_entry_t &operator=(file_entry_t &&rhs) = default;

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }

  inline bool operator==(const file_entry_t &rhs) const = default;
};

// files in traversal order
using file_group_t = std::vector<file_entry_t>;

/**
 * @brief files with identical content, in traversal order.
 * the first one is kept, the rest are removal candidates.
 */
class dupe_set_t {
  file_group_t _files;

 public:
  /**
   * @throws std::invalid_argument if fewer than two files are given
   */
  inline explicit dupe_set_t(file_group_t files) : _files(std::move(files)) {
    if (_files.size() < 2) {
      throw std::invalid_argument("dupe_set_t: need at least two files");
    }
  }

  inline const file_entry_t &keep() const noexcept { return _files.front(); }
  inline std::span<const file_entry_t> dupes() const noexcept {
    return std::span<const file_entry_t>(_files).subspan(1);
  }
  inline const file_group_t &files() const noexcept { return _files; }
  inline std::size_t count() const noexcept { return _files.size(); }
  inline uint64_t file_size() const noexcept { return _files.front().size(); }
};

}  // namespace detail_v1

}  // namespace rmdup
