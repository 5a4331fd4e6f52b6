#pragma once
#include "tc/data/Bar.hpp"
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace tc {

// A bar after preparation: its moving average over the full history and its
// dense position on the plot axis.
struct PreparedBar {
  Bar bar;
  std::optional<double> movingAverage;
  std::size_t plotIndex{0};
};

// Ordered, gap-free bar sequence. Dates strictly increase and
// bars()[i].plotIndex == i. Built by prepareSeries; read-only afterwards.
class Series {
public:
  Series() = default;
  Series(std::vector<PreparedBar> bars, int window)
    : bars_(std::move(bars)), window_(window) {}

  const std::vector<PreparedBar>& bars() const { return bars_; }
  const PreparedBar& operator[](std::size_t i) const { return bars_[i]; }
  std::size_t size() const { return bars_.size(); }
  bool empty() const { return bars_.empty(); }

  const PreparedBar& back() const { return bars_.back(); }

  // Moving-average window the series was prepared with.
  int window() const { return window_; }

  std::vector<Date> dates() const;

private:
  std::vector<PreparedBar> bars_;
  int window_{0};
};

} // namespace tc
