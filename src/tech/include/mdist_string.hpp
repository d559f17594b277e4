#pragma once

#include <string>

namespace mdist {

using string = std::string;

}  // namespace mdist
