#include "tc/series/CandleClassifier.hpp"

namespace tc {

CandleGroups classifyCandles(const Series& series) {
  std::vector<std::size_t> up, down;
  for (std::size_t i = 0; i < series.size(); i++) {
    if (isUpBar(series[i].bar)) up.push_back(i);
    else down.push_back(i);
  }
  CandleGroups groups;
  groups.up = ClassifiedGroup(&series, std::move(up));
  groups.down = ClassifiedGroup(&series, std::move(down));
  return groups;
}

} // namespace tc
