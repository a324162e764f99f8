#include "rmdup/resolve.hh"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <system_error>

#include "rmdup/cancel.hh"
#include "rmdup/format_size.hh"
#include "rmdup/oss.hh"

namespace rmdup {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

bool rm_file(const file_entry_t &dup, const file_entry_t &ori,
             const rm_t rm_meth, std::ostream &log_stream) noexcept {
  if (rm_meth == rm_t::log) {
    oss(log_stream) << "<- " << dup.path() << "\n-> " << ori.path() << '\n';
    return false;
  }
  std::error_code ec;
  if (!fs::remove(dup.path(), ec) || ec) {
    std::string msg = ec ? ec.message() : "doesn't exist";
    oss(std::cerr) << "[err] failed to remove: " << dup.path() << " - " << msg
                   << '\n';
    return false;
  }
  oss(log_stream) << "removed: " << dup.path() << '\n';
  return true;
}

}  // namespace

bool is_yes(std::string_view answer) {
  const auto first = answer.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return false;
  }
  const auto last = answer.find_last_not_of(" \t\r\n");
  answer = answer.substr(first, last - first + 1);
  std::string lower(answer);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return lower == "y" || lower == "yes" || lower == "o" || lower == "oui";
}

uint64_t recoverable_space(const dupe_set_t &dupe_set) noexcept {
  return dupe_set.file_size() * (dupe_set.count() - 1);
}

uint64_t recoverable_space(const std::vector<dupe_set_t> &dupe_list) noexcept {
  uint64_t total = 0;
  for (const auto &dupe_set : dupe_list) {
    total += recoverable_space(dupe_set);
  }
  return total;
}

std::size_t delete_count(const std::vector<dupe_set_t> &dupe_list) noexcept {
  std::size_t cnt = 0;
  for (const auto &dupe_set : dupe_list) {
    cnt += dupe_set.count() - 1;
  }
  return cnt;
}

void report(std::ostream &os, const std::vector<dupe_set_t> &dupe_list) {
  if (dupe_list.empty()) {
    os << "no duplicates found\n";
    return;
  }
  os << dupe_list.size() << " duplicate group(s) found\n\n";
  std::size_t idx = 0;
  for (const auto &dupe_set : dupe_list) {
    os << "group " << ++idx << " (" << utils::format_size(dupe_set.file_size())
       << " per file):\n";
    os << "  keep:   " << dupe_set.keep().path() << '\n';
    for (const auto &dup : dupe_set.dupes()) {
      os << "  delete: " << dup.path() << '\n';
    }
    os << '\n';
  }
  os << "recoverable space: " << utils::format_size(recoverable_space(dupe_list))
     << '\n';
}

remove_stat_t remove_dupes(const std::vector<dupe_set_t> &dupe_list,
                           const rm_t rm_meth, std::ostream &log_stream,
                           const confirm_fn &confirm,
                           const std::atomic<bool> *stop) {
  remove_stat_t stat;
  if (dupe_list.empty()) {
    return stat;
  }
  if (rm_meth == rm_t::remove && confirm &&
      !confirm("delete " + std::to_string(delete_count(dupe_list)) +
               " duplicate file(s)?")) {
    stat.declined = true;
    return stat;
  }

  for (const auto &dupe_set : dupe_list) {
    for (const auto &dup : dupe_set.dupes()) {
      if (stop_requested(stop)) {
        stat.cancelled = true;
        return stat;
      }
      if (rm_file(dup, dupe_set.keep(), rm_meth, log_stream)) {
        ++stat.removed;
        stat.reclaimed += dup.size();
      } else if (rm_meth == rm_t::remove) {
        ++stat.failed;
      }
    }
  }
  return stat;
}

}  // namespace detail_v1

}  // namespace rmdup
