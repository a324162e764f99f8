#pragma once

#include <cstdint>
#include <string>

namespace rmdup::utils {

/**
 * @brief Format a byte count for humans, 1024 based, two decimals.
 * ex. 5 -> "5.00 B", 1536 -> "1.50 KB"
 */
std::string format_size(const uint64_t size);

}  // namespace rmdup::utils
