#pragma once
#include "tc/data/Bar.hpp"
#include <string>
#include <vector>

namespace tc {

// Produces the raw bar series for one chart. Rows may come back in any
// date order. Implementations throw IngestionError on failure.
class BarSource {
public:
  virtual ~BarSource() = default;
  virtual std::vector<Bar> load() = 0;

  // Human-readable origin, e.g. a file path or "remote:TQQQ".
  virtual std::string describe() const = 0;
};

} // namespace tc
