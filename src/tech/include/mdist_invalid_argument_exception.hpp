#pragma once

#include "mdist_exception.hpp"

namespace mdist {

/// Error caused by a user input, from the command line or from the configuration file.
class invalid_argument : public exception {
 public:
  using exception::exception;
};

}  // namespace mdist
