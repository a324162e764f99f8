#include "rmdup/prefix_filter.hh"

#include <fstream>
#include <iostream>
#include <map>

#include "rmdup/cancel.hh"
#include "rmdup/oss.hh"

namespace rmdup {

inline namespace detail_v1 {

std::optional<std::string> read_prefix(const std::filesystem::path &path,
                                       const std::size_t len) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    oss(std::cerr) << "[warn] skip file: " << path << " - open failed\n";
    return std::nullopt;
  }
  std::string prefix(len, '\0');
  ifs.read(prefix.data(), (std::streamsize)len);
  if (ifs.bad()) {
    oss(std::cerr) << "[warn] skip file: " << path << " - read failed\n";
    return std::nullopt;
  }
  // short read is fine, eof before len
  prefix.resize((std::size_t)ifs.gcount());
  return prefix;
}

std::vector<file_group_t> filter_by_prefix(
    std::span<const file_entry_t> file_list, const std::size_t len,
    const std::atomic<bool> *stop) {
  std::map<std::string, file_group_t> prefix_map;
  for (const auto &file : file_list) {
    throw_if_stopped(stop);
    auto prefix = read_prefix(file.path(), len);
    if (!prefix) {
      continue;
    }
    prefix_map[std::move(*prefix)].push_back(file);
  }

  std::vector<file_group_t> groups;
  for (auto &[prefix, group] : prefix_map) {
    if (group.size() > 1) {
      groups.emplace_back(std::move(group));
    }
  }
  return groups;
}

}  // namespace detail_v1

}  // namespace rmdup
