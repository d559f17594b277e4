#include "general-config.hpp"

#include <string_view>

#include "durationstring.hpp"
#include "file.hpp"
#include "mdist_const.hpp"
#include "mdist_invalid_argument_exception.hpp"
#include "read-json.hpp"
#include "timedef.hpp"

namespace mdist {

schema::GeneralConfig ReadGeneralConfig(std::string_view dataDir) {
  return ReadJsonOrCreateFile<schema::GeneralConfig>(
      File{dataDir, File::Type::kStatic, kGeneralConfigFileName, File::IfError::kNoThrow});
}

Duration BatchTimeout(const schema::GeneralConfig &generalConfig) {
  const Duration batchTimeout = generalConfig.concurrency.batchTimeout.duration;
  if (batchTimeout <= Duration::zero()) {
    throw invalid_argument("Batch timeout '{}' should be strictly positive", DurationToString(batchTimeout));
  }
  return batchTimeout;
}

}  // namespace mdist
