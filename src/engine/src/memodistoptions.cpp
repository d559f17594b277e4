#include "memodistoptions.hpp"

#include <ostream>
#include <string_view>

#include "mdist_config.hpp"
#include "memodistoptionsdef.hpp"
#include "staticcommandlineoptioncheck.hpp"

namespace mdist {

static_assert(AreOptionNamesUnique(kMemodistOptionDefs), "Option names should be unique");
static_assert(AreOptionsWellFormed(kMemodistOptionDefs), "Option names and descriptions should be well formed");

std::ostream& MemodistCmdLineOptions::PrintVersion(std::string_view programName, std::ostream& os) noexcept {
  os << programName << " version " << MDIST_VERSION << '\n';
  os << "compiled with " << MDIST_COMPILER_VERSION << " on " << __DATE__ << " at " << __TIME__ << '\n';
  return os;
}

}  // namespace mdist
