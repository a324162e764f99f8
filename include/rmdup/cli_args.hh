#pragma once

#include <stdexcept>
#include <string_view>
#include <vector>

#include "dedupe.hh"

namespace rmdup {

inline namespace detail_v1 {

constexpr auto usage =
    "usage: rmdup [options] <dir>...\n"
    "  -n, --no-recursive      only scan direct children of each dir\n"
    "  -d, --delete            delete duplicates, keep the first copy\n"
    "  -y, --yes, --no-confirm do not ask before deleting\n"
    "      --dry-run           never delete, even with --delete\n"
    "  -p, --prefix <n>        prefix bytes compared before hashing\n"
    "  -a, --algo <name>       digest algorithm (default md5)\n"
    "  -j, --jobs <n>          worker threads for hashing\n"
    "  -h, --help              print this help\n";

class usage_error : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

struct cli_args_t {
  options_t opt;
  bool delete_mode = false;
  bool no_confirm = false;
  bool dry_run = false;
  bool help = false;

  // --dry-run wins over --delete
  bool deletes() const noexcept { return delete_mode && !dry_run; }
};

/**
 * @brief parse command line arguments, program name excluded
 *
 * @param args arguments in order
 * @return cli_args_t parsed flags, help set means nothing else was checked
 * @throws usage_error on unknown option, missing or malformed value,
 * out of range number, or no directory given
 */
cli_args_t parse_args(const std::vector<std::string_view> &args);

}  // namespace detail_v1

}  // namespace rmdup
