#pragma once
#include "tc/data/BarSource.hpp"
#include <string>

namespace tc {

struct RemoteBarSourceConfig {
  std::string host{"query1.finance.yahoo.com"};
  int lookbackDays{730};
  int timeoutSec{20};
};

// Downloads a trailing daily series for one ticker. An empty or failed
// download is terminal: no retry.
class RemoteBarSource : public BarSource {
public:
  RemoteBarSource(std::string ticker, const RemoteBarSourceConfig& config);

  std::vector<Bar> load() override;
  std::string describe() const override { return "remote:" + ticker_; }

  const std::string& ticker() const { return ticker_; }

private:
  std::string ticker_;
  RemoteBarSourceConfig config_;
};

} // namespace tc
