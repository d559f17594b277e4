#pragma once

#include <string_view>

#include "concurrency-config.hpp"
#include "log-config.hpp"
#include "timedef.hpp"

namespace mdist {

namespace schema {

struct GeneralConfig {
  ConcurrencyConfig concurrency;
  LogConfig log;
};

}  // namespace schema

/// Reads general configuration file located in static directory of given data directory.
/// If it does not exist, it is created with default values.
schema::GeneralConfig ReadGeneralConfig(std::string_view dataDir);

/// Batch timeout of given configuration.
/// Throws invalid_argument if it is not strictly positive.
Duration BatchTimeout(const schema::GeneralConfig &generalConfig);

}  // namespace mdist
