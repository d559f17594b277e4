#pragma once

#include <cstdint>

#include "mdist_string.hpp"
#include "size-bytes-schema.hpp"

namespace mdist::schema {

struct LogConfig {
  string consoleLevel{"info"};
  string fileLevel{"off"};
  SizeBytes maxFileSize{5L * 1024 * 1024};  // 5Mi
  int32_t maxNbFiles{10};
};

}  // namespace mdist::schema
