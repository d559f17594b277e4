#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export

namespace mdist::json {

using glz::error_ctx;
using glz::format_error;
using glz::opts;
using glz::read;
using glz::write;

}  // namespace mdist::json
