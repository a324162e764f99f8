#pragma once

#include <syncstream>

namespace rmdup {

inline namespace detail_v1 {

// one temporary per log line keeps lines from worker threads whole
using oss = std::osyncstream;

}  // namespace detail_v1

}  // namespace rmdup
