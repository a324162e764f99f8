#include "rmdup/dedupe_same_sz.hh"

#include <iterator>

#include "rmdup/content_verifier.hh"
#include "rmdup/prefix_filter.hh"

namespace rmdup {

inline namespace detail_v1 {

std::vector<dupe_set_t> dedupe_same_sz(std::span<const file_entry_t> file_list,
                                       const std::size_t prefix_len,
                                       const EVP_MD *md,
                                       const std::atomic<bool> *stop) {
  std::vector<dupe_set_t> dupe_list;
  if (file_list.size() < 2) {
    return dupe_list;
  }
  for (const auto &group : filter_by_prefix(file_list, prefix_len, stop)) {
    auto dupe_list_tmp = verify_content(group, md, stop);
    dupe_list.insert(dupe_list.end(),
                     std::make_move_iterator(dupe_list_tmp.begin()),
                     std::make_move_iterator(dupe_list_tmp.end()));
  }
  return dupe_list;
}

}  // namespace detail_v1

}  // namespace rmdup
