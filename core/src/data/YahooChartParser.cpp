#include "tc/data/YahooChartParser.hpp"
#include "tc/data/Errors.hpp"

#include <rapidjson/document.h>

#include <cmath>
#include <cstdio>

namespace tc {

std::string yahooChartTarget(const std::string& ticker,
                             std::int64_t period1, std::int64_t period2) {
  char buf[160];
  std::snprintf(buf, sizeof(buf),
                "?period1=%lld&period2=%lld&interval=1d&events=history",
                static_cast<long long>(period1), static_cast<long long>(period2));
  return "/v8/finance/chart/" + ticker + buf;
}

static bool numberAt(const rapidjson::Value& arr, rapidjson::SizeType i, double& out) {
  if (!arr.IsArray() || i >= arr.Size() || !arr[i].IsNumber()) return false;
  out = arr[i].GetDouble();
  return std::isfinite(out);
}

std::vector<Bar> parseYahooChart(const std::string& json, const std::string& ticker) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    throw IngestionError("malformed chart response for " + ticker);
  }
  if (!doc.HasMember("chart") || !doc["chart"].IsObject()) {
    throw IngestionError("chart response for " + ticker + " has no 'chart' object");
  }
  const auto& chart = doc["chart"];

  if (chart.HasMember("error") && chart["error"].IsObject()) {
    const auto& err = chart["error"];
    std::string desc = (err.HasMember("description") && err["description"].IsString())
                           ? err["description"].GetString()
                           : "unknown error";
    throw IngestionError("remote source error for " + ticker + ": " + desc);
  }

  std::vector<Bar> bars;
  if (!chart.HasMember("result") || !chart["result"].IsArray() || chart["result"].Empty()) {
    return bars;
  }
  const auto& result = chart["result"][0];

  std::int64_t gmtOffset = 0;
  if (result.HasMember("meta") && result["meta"].IsObject()) {
    const auto& meta = result["meta"];
    if (meta.HasMember("gmtoffset") && meta["gmtoffset"].IsInt64())
      gmtOffset = meta["gmtoffset"].GetInt64();
  }

  if (!result.HasMember("timestamp") || !result["timestamp"].IsArray()) return bars;
  const auto& ts = result["timestamp"];

  if (!result.HasMember("indicators") || !result["indicators"].IsObject()) return bars;
  const auto& ind = result["indicators"];
  if (!ind.HasMember("quote") || !ind["quote"].IsArray() || ind["quote"].Empty()) return bars;
  const auto& quote = ind["quote"][0];

  static const char* kFields[] = {"open", "high", "low", "close", "volume"};
  for (const char* name : kFields) {
    if (!quote.HasMember(name) || !quote[name].IsArray()) {
      throw IngestionError("chart response for " + ticker + " lacks '" + name + "' series");
    }
  }

  const auto& opens = quote["open"];
  const auto& highs = quote["high"];
  const auto& lows = quote["low"];
  const auto& closes = quote["close"];
  const auto& volumes = quote["volume"];

  bars.reserve(ts.Size());
  for (rapidjson::SizeType i = 0; i < ts.Size(); i++) {
    if (!ts[i].IsInt64()) continue;
    Bar b;
    double vol = 0;
    if (!numberAt(opens, i, b.open) || !numberAt(highs, i, b.high) ||
        !numberAt(lows, i, b.low) || !numberAt(closes, i, b.close) ||
        !numberAt(volumes, i, vol)) {
      continue;
    }
    std::int64_t local = ts[i].GetInt64() + gmtOffset;
    std::int64_t day = local >= 0 ? local / 86400 : (local - 86399) / 86400;
    b.date = fromDayNumber(day);
    b.volume = vol > 0 ? static_cast<std::uint64_t>(std::llround(vol)) : 0;
    b.openInterest = 0;
    bars.push_back(b);
  }
  return bars;
}

} // namespace tc
