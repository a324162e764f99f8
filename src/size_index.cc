#include "rmdup/size_index.hh"

#include <algorithm>
#include <iostream>
#include <string>
#include <system_error>
#include <unordered_set>

#include "rmdup/cancel.hh"
#include "rmdup/oss.hh"

namespace rmdup {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

class walker_t {
  size_index_t &_index;
  std::unordered_set<std::string> _seen;
  const bool _recursive;
  const std::atomic<bool> *_stop;

  // symlinks resolved, so a link and its target share one key
  static std::string identity(const fs::path &path) {
    std::error_code ec;
    auto real = fs::canonical(path, ec);
    if (!ec) {
      return real.native();
    }
    auto abs = fs::absolute(path, ec);
    if (ec) {
      return path.lexically_normal().native();
    }
    return abs.lexically_normal().native();
  }

  void add_file(const fs::directory_entry &dir_entry) {
    std::error_code ec;
    auto file_size = dir_entry.file_size(ec);
    if (ec) {
      // error read file size, skip
      oss(std::cerr) << "[warn] skip file: " << dir_entry.path() << " - "
                     << ec.message() << '\n';
      return;
    }
    if (!_seen.insert(identity(dir_entry.path())).second) {
      return;
    }
    _index[file_size].emplace_back(dir_entry.path(), file_size);
  }

 public:
  walker_t(size_index_t &index, const bool recursive,
           const std::atomic<bool> *stop)
      : _index(index), _recursive(recursive), _stop(stop) {}

  void ls_dir_rec(const fs::path &dir) {
    std::vector<fs::directory_entry> entries;
    try {
      for (const auto &dir_entry : fs::directory_iterator(dir)) {
        entries.push_back(dir_entry);
      }
    } catch (fs::filesystem_error &e) {
      // error iterate directory, skip
      oss(std::cerr) << "[warn] skip directory: " << dir << " - "
                     << e.code().message() << '\n';
      return;
    }
    // traversal order decides which copy is kept
    std::sort(entries.begin(), entries.end(),
              [](const auto &lhs, const auto &rhs) {
                return lhs.path().filename().native() <
                       rhs.path().filename().native();
              });

    for (const auto &dir_entry : entries) {
      throw_if_stopped(_stop);
      std::error_code ec;
      const bool is_link = dir_entry.is_symlink(ec);
      // both follow symlinks
      const bool is_dir = dir_entry.is_directory(ec);
      const bool is_reg = !is_dir && dir_entry.is_regular_file(ec);

      if (is_dir) {
        if (is_link) {
          oss(std::cerr) << "[warn] skip directory symlink: " << dir_entry.path()
                         << '\n';
        } else if (_recursive) {
          ls_dir_rec(dir_entry.path());
        }
      } else if (is_reg) {
        add_file(dir_entry);
      } else {
        // broken symlink, fifo, socket, device...
        oss(std::cerr) << "[warn] skip unsupport file: " << dir_entry.path()
                       << '\n';
      }
    }
  }
};

}  // namespace

size_index_t index_by_size(const std::vector<fs::path> &search_dir,
                           const bool recursive,
                           const std::atomic<bool> *stop) {
  size_index_t index;
  walker_t walker(index, recursive, stop);
  for (const auto &dir : search_dir) {
    throw_if_stopped(stop);
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
      oss(std::cerr) << "[warn] skip root: " << dir << " - "
                     << (ec ? ec.message() : "doesn't exist") << '\n';
      continue;
    }
    if (!fs::is_directory(dir, ec)) {
      oss(std::cerr) << "[warn] skip root: " << dir << " - "
                     << (ec ? ec.message() : "not a directory") << '\n';
      continue;
    }
    oss(std::cerr) << "[log] scan: " << dir << '\n';
    walker.ls_dir_rec(dir);
  }
  return index;
}

std::size_t prune_unique_sizes(size_index_t &index) noexcept {
  return std::erase_if(index,
                       [](const auto &item) { return item.second.size() < 2; });
}

}  // namespace detail_v1

}  // namespace rmdup
