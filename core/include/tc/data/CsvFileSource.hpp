#pragma once
#include "tc/data/BarSource.hpp"
#include <istream>
#include <string>
#include <vector>

namespace tc {

// Reads "Date","Time","Open","High","Low","Close","Vol","OI" tables.
// Header names are matched case-insensitively after stripping quotes and
// whitespace; Time and OI are optional.
class CsvFileSource : public BarSource {
public:
  explicit CsvFileSource(std::string path);

  std::vector<Bar> load() override;
  std::string describe() const override { return path_; }

  // Parse from an already-open stream. `origin` is used in error messages.
  static std::vector<Bar> parse(std::istream& in, const std::string& origin);

private:
  std::string path_;
};

} // namespace tc
