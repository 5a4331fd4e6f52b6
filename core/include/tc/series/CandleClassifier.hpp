#pragma once
#include "tc/series/Series.hpp"
#include <cstddef>
#include <utility>
#include <vector>

namespace tc {

// Bars of one Series selected by a predicate. Holds positions, not copies;
// the Series must outlive the group.
class ClassifiedGroup {
public:
  ClassifiedGroup() = default;
  ClassifiedGroup(const Series* series, std::vector<std::size_t> indices)
    : series_(series), indices_(std::move(indices)) {}

  std::size_t size() const { return indices_.size(); }
  bool empty() const { return indices_.empty(); }

  const PreparedBar& operator[](std::size_t i) const { return (*series_)[indices_[i]]; }
  const std::vector<std::size_t>& indices() const { return indices_; }

private:
  const Series* series_{nullptr};
  std::vector<std::size_t> indices_;
};

struct CandleGroups {
  ClassifiedGroup up;    // close >= open
  ClassifiedGroup down;  // close < open
};

inline bool isUpBar(const Bar& b) { return b.close >= b.open; }

CandleGroups classifyCandles(const Series& series);

} // namespace tc
