#pragma once

namespace rmdup {

enum class rm_t {
  log,    // log entry
  remove  // remove file
};

}  // namespace rmdup
