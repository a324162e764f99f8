#include "rmdup/format_size.hh"

#include <array>
#include <iomanip>
#include <sstream>

namespace rmdup::utils {

std::string format_size(const uint64_t size) {
  const std::array<const char *, 6> unit_dict(
      {"B", "KB", "MB", "GB", "TB", "PB"});
  double scaled = (double)size;
  std::size_t unit = 0;
  while (scaled >= 1024.0 && unit + 1 < unit_dict.size()) {
    scaled /= 1024.0;
    ++unit;
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << scaled << ' ' << unit_dict[unit];
  return out.str();
}

}  // namespace rmdup::utils
