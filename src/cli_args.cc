#include "rmdup/cli_args.hh"

#include <charconv>
#include <cstdint>
#include <string>

using namespace std::literals;

namespace rmdup {

inline namespace detail_v1 {

namespace {

// whole string must be a decimal number within [min, max]
uint64_t parse_num(std::string_view what, std::string_view value,
                   const uint64_t min, const uint64_t max) {
  uint64_t num = 0;
  const auto *first = value.data();
  const auto *last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(first, last, num);
  if (value.empty() || ec != std::errc() || ptr != last) {
    throw usage_error("invalid " + std::string(what) + ": " +
                      std::string(value));
  }
  if (num < min || num > max) {
    throw usage_error(std::string(what) + " must be >= " +
                      std::to_string(min) + " and <= " + std::to_string(max));
  }
  return num;
}

}  // namespace

cli_args_t parse_args(const std::vector<std::string_view> &args) {
  cli_args_t cli;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto arg = args[i];
    auto value = [&](std::string_view what) {
      ++i;
      if (i >= args.size()) {
        throw usage_error("missing " + std::string(what));
      }
      return args[i];
    };

    if (arg == "-n"sv || arg == "--no-recursive"sv) {
      cli.opt.recursive = false;
    } else if (arg == "-d"sv || arg == "--delete"sv) {
      cli.delete_mode = true;
    } else if (arg == "-y"sv || arg == "--yes"sv || arg == "--no-confirm"sv) {
      cli.no_confirm = true;
    } else if (arg == "--dry-run"sv) {
      cli.dry_run = true;
    } else if (arg == "-p"sv || arg == "--prefix"sv) {
      cli.opt.prefix_len = (std::size_t)parse_num(
          "prefix length", value("prefix length"), 1, max_prefix_len);
    } else if (arg == "-a"sv || arg == "--algo"sv) {
      cli.opt.hash_algo = std::string(value("hash algorithm"));
    } else if (arg == "-j"sv || arg == "--jobs"sv) {
      cli.opt.max_thread =
          (uint32_t)parse_num("jobs", value("jobs"), 1, max_jobs);
    } else if (arg == "-h"sv || arg == "--help"sv) {
      cli.help = true;
      return cli;
    } else if (arg.starts_with("-"sv) && arg.size() > 1) {
      throw usage_error("unknown option: " + std::string(arg));
    } else {
      cli.opt.search_dir.emplace_back(arg);
    }
  }
  if (cli.opt.search_dir.empty()) {
    throw usage_error("missing search_dir");
  }
  return cli;
}

}  // namespace detail_v1

}  // namespace rmdup
