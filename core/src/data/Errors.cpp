#include "tc/data/Errors.hpp"

namespace tc {

int exitCodeFor(const std::exception& e) {
  if (dynamic_cast<const IngestionError*>(&e)) return kExitIngestion;
  if (dynamic_cast<const DataError*>(&e)) return kExitData;
  if (dynamic_cast<const EmptySeriesError*>(&e)) return kExitData;
  if (dynamic_cast<const RenderError*>(&e)) return kExitRender;
  if (dynamic_cast<const ConfigError*>(&e)) return kExitUsage;
  return kExitInternal;
}

} // namespace tc
