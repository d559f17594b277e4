#pragma once

#include <string_view>

namespace mdist {

static constexpr std::string_view kDefaultDataDir = MDIST_DATA_DIR;

/// General configuration file, located in the static directory of the data directory.
static constexpr std::string_view kGeneralConfigFileName = "generalconfig.json";

}  // namespace mdist
