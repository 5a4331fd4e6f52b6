#include "tc/config/ChartConfig.hpp"
#include "tc/data/Errors.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <fstream>
#include <sstream>

namespace tc {

static void addColor(rapidjson::Value& obj, const char* key, const float rgba[4],
                     rapidjson::Document::AllocatorType& alloc) {
  std::string hex = formatHexColor(rgba);
  obj.AddMember(rapidjson::StringRef(key), rapidjson::Value(hex.c_str(), alloc), alloc);
}

std::string serializeChartConfig(const ChartConfig& config) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version", rapidjson::Value(config.version.c_str(), alloc), alloc);
  doc.AddMember("smaWindow", config.smaWindow, alloc);
  doc.AddMember("years", config.years, alloc);
  doc.AddMember("width", config.width, alloc);
  doc.AddMember("height", config.height, alloc);
  doc.AddMember("fontPath", rapidjson::Value(config.fontPath.c_str(), alloc), alloc);

  rapidjson::Value remote(rapidjson::kObjectType);
  remote.AddMember("host", rapidjson::Value(config.remoteHost.c_str(), alloc), alloc);
  remote.AddMember("lookbackDays", config.remoteLookbackDays, alloc);
  remote.AddMember("timeoutSec", config.httpTimeoutSec, alloc);
  doc.AddMember("remote", remote, alloc);

  const Theme& t = config.theme;
  rapidjson::Value theme(rapidjson::kObjectType);
  theme.AddMember("name", rapidjson::Value(t.name.c_str(), alloc), alloc);
  addColor(theme, "background", t.backgroundColor, alloc);
  addColor(theme, "candleUp", t.candleUp, alloc);
  addColor(theme, "candleDown", t.candleDown, alloc);
  addColor(theme, "grid", t.gridColor, alloc);
  addColor(theme, "tick", t.tickColor, alloc);
  addColor(theme, "label", t.labelColor, alloc);
  addColor(theme, "sma", t.smaColor, alloc);
  addColor(theme, "onSma", t.onSmaColor, alloc);
  addColor(theme, "text", t.textColor, alloc);
  theme.AddMember("gridLineWidth", static_cast<double>(t.gridLineWidth), alloc);
  theme.AddMember("tickLineWidth", static_cast<double>(t.tickLineWidth), alloc);
  theme.AddMember("smaLineWidth", static_cast<double>(t.smaLineWidth), alloc);
  doc.AddMember("theme", theme, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

static void readInt(const rapidjson::Value& obj, const char* key, int minValue, int& out) {
  if (!obj.HasMember(key)) return;
  const auto& v = obj[key];
  if (!v.IsInt()) throw ConfigError(std::string("'") + key + "' must be an integer");
  if (v.GetInt() < minValue) {
    throw ConfigError(std::string("'") + key + "' must be at least " + std::to_string(minValue));
  }
  out = v.GetInt();
}

static void readPositive(const rapidjson::Value& obj, const char* key, double& out) {
  if (!obj.HasMember(key)) return;
  const auto& v = obj[key];
  if (!v.IsNumber() || !(v.GetDouble() > 0.0)) {
    throw ConfigError(std::string("'") + key + "' must be a positive number");
  }
  out = v.GetDouble();
}

static void readPositive(const rapidjson::Value& obj, const char* key, float& out) {
  double d = out;
  readPositive(obj, key, d);
  out = static_cast<float>(d);
}

static void readString(const rapidjson::Value& obj, const char* key, std::string& out) {
  if (!obj.HasMember(key)) return;
  const auto& v = obj[key];
  if (!v.IsString()) throw ConfigError(std::string("'") + key + "' must be a string");
  out = v.GetString();
}

static void readColor(const rapidjson::Value& obj, const char* key, float out[4]) {
  if (!obj.HasMember(key)) return;
  const auto& v = obj[key];
  if (!v.IsString() || !parseHexColor(v.GetString(), out)) {
    throw ConfigError(std::string("theme color '") + key + "' must be \"#rrggbb\" or \"#rrggbbaa\"");
  }
}

void deserializeChartConfig(const std::string& json, ChartConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    throw ConfigError(std::string("config JSON parse error at offset ") +
                      std::to_string(doc.GetErrorOffset()) + ": " +
                      rapidjson::GetParseError_En(doc.GetParseError()));
  }
  if (!doc.IsObject()) throw ConfigError("config JSON must be an object");

  // Work on a copy so a rejected document leaves `out` untouched.
  ChartConfig cfg = out;

  readString(doc, "version", cfg.version);
  readInt(doc, "smaWindow", 1, cfg.smaWindow);
  readPositive(doc, "years", cfg.years);
  readInt(doc, "width", 64, cfg.width);
  readInt(doc, "height", 64, cfg.height);
  readString(doc, "fontPath", cfg.fontPath);

  if (doc.HasMember("remote")) {
    const auto& remote = doc["remote"];
    if (!remote.IsObject()) throw ConfigError("'remote' must be an object");
    readString(remote, "host", cfg.remoteHost);
    readInt(remote, "lookbackDays", 1, cfg.remoteLookbackDays);
    readInt(remote, "timeoutSec", 1, cfg.httpTimeoutSec);
  }

  if (doc.HasMember("theme")) {
    const auto& theme = doc["theme"];
    if (!theme.IsObject()) throw ConfigError("'theme' must be an object");
    Theme& t = cfg.theme;
    readString(theme, "name", t.name);
    readColor(theme, "background", t.backgroundColor);
    readColor(theme, "candleUp", t.candleUp);
    readColor(theme, "candleDown", t.candleDown);
    readColor(theme, "grid", t.gridColor);
    readColor(theme, "tick", t.tickColor);
    readColor(theme, "label", t.labelColor);
    readColor(theme, "sma", t.smaColor);
    readColor(theme, "onSma", t.onSmaColor);
    readColor(theme, "text", t.textColor);
    readPositive(theme, "gridLineWidth", t.gridLineWidth);
    readPositive(theme, "tickLineWidth", t.tickLineWidth);
    readPositive(theme, "smaLineWidth", t.smaLineWidth);
  }

  out = cfg;
}

void loadChartConfigFile(const std::string& path, ChartConfig& out) {
  std::ifstream in(path);
  if (!in) throw ConfigError("cannot open config file '" + path + "'");
  std::ostringstream ss;
  ss << in.rdbuf();
  try {
    deserializeChartConfig(ss.str(), out);
  } catch (const ConfigError& e) {
    throw ConfigError(path + ": " + e.what());
  }
}

} // namespace tc
