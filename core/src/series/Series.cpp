#include "tc/series/Series.hpp"

namespace tc {

std::vector<Date> Series::dates() const {
  std::vector<Date> out;
  out.reserve(bars_.size());
  for (const auto& pb : bars_) out.push_back(pb.bar.date);
  return out;
}

} // namespace tc
