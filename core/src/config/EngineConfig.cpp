#include "pd/config/EngineConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdio>
#include <fstream>
#include <sstream>

namespace pd {

namespace {

// Each reader returns false only when the key exists with the wrong type.
bool readString(const rapidjson::Value& obj, const char* key, std::string& dst) {
  if (!obj.HasMember(key)) return true;
  if (!obj[key].IsString()) return false;
  dst = obj[key].GetString();
  return true;
}

bool readBool(const rapidjson::Value& obj, const char* key, bool& dst) {
  if (!obj.HasMember(key)) return true;
  if (!obj[key].IsBool()) return false;
  dst = obj[key].GetBool();
  return true;
}

bool readFloat(const rapidjson::Value& obj, const char* key, float& dst) {
  if (!obj.HasMember(key)) return true;
  if (!obj[key].IsNumber()) return false;
  dst = static_cast<float>(obj[key].GetDouble());
  return true;
}

bool readDouble(const rapidjson::Value& obj, const char* key, double& dst) {
  if (!obj.HasMember(key)) return true;
  if (!obj[key].IsNumber()) return false;
  dst = obj[key].GetDouble();
  return true;
}

bool readInt(const rapidjson::Value& obj, const char* key, int& dst) {
  if (!obj.HasMember(key)) return true;
  if (!obj[key].IsInt()) return false;
  dst = obj[key].GetInt();
  return true;
}

bool readChart(const rapidjson::Value& c, ChartStyleConfig& out) {
  return readFloat(c, "slotWidth", out.slotWidth) &&
         readDouble(c, "pricePadding", out.pricePadding) &&
         readFloat(c, "volumeHeightRatio", out.volumeHeightRatio) &&
         readFloat(c, "bodyWidthRatio", out.bodyWidthRatio) &&
         readFloat(c, "wickWidthRatio", out.wickWidthRatio) &&
         readInt(c, "gridHLines", out.gridHLines) &&
         readInt(c, "gridVLines", out.gridVLines) &&
         readFloat(c, "gridAlpha", out.gridAlpha) &&
         readFloat(c, "volumeBarRatio", out.volumeBarRatio) &&
         readFloat(c, "volumeAlpha", out.volumeAlpha) &&
         readFloat(c, "lineThickness", out.lineThickness) &&
         readFloat(c, "markerRadius", out.markerRadius);
}

Status invalid(const std::string& msg) {
  std::fprintf(stderr, "EngineConfig: %s\n", msg.c_str());
  return Status::fail(ErrorCode::ConfigInvalid, msg);
}

} // namespace

Status parseEngineConfig(const std::string& json, EngineConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) return invalid("malformed JSON");
  if (!doc.IsObject()) return invalid("top level must be an object");

  EngineConfig cfg = out;

  if (!readString(doc, "drmDevice", cfg.drmDevice))
    return invalid("drmDevice must be a string");
  if (!readString(doc, "inputDevice", cfg.inputDevice))
    return invalid("inputDevice must be a string");
  if (!readString(doc, "fontPath", cfg.fontPath))
    return invalid("fontPath must be a string");
  if (!readFloat(doc, "fontPixelHeight", cfg.fontPixelHeight))
    return invalid("fontPixelHeight must be a number");
  if (!readString(doc, "theme", cfg.theme))
    return invalid("theme must be a string");
  if (!readBool(doc, "emitKeyRepeats", cfg.emitKeyRepeats))
    return invalid("emitKeyRepeats must be a bool");

  if (doc.HasMember("chart")) {
    if (!doc["chart"].IsObject()) return invalid("chart must be an object");
    if (!readChart(doc["chart"], cfg.chart))
      return invalid("chart has a field of the wrong type");
  }

  if (cfg.fontPixelHeight <= 0.0f) return invalid("fontPixelHeight must be positive");
  if (cfg.chart.slotWidth <= 0.0f) return invalid("chart.slotWidth must be positive");

  out = cfg;
  return Status::success();
}

std::string serializeEngineConfig(const EngineConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("drmDevice", rapidjson::Value(cfg.drmDevice.c_str(), alloc), alloc);
  doc.AddMember("inputDevice", rapidjson::Value(cfg.inputDevice.c_str(), alloc), alloc);
  doc.AddMember("fontPath", rapidjson::Value(cfg.fontPath.c_str(), alloc), alloc);
  doc.AddMember("fontPixelHeight", static_cast<double>(cfg.fontPixelHeight), alloc);
  doc.AddMember("theme", rapidjson::Value(cfg.theme.c_str(), alloc), alloc);
  doc.AddMember("emitKeyRepeats", cfg.emitKeyRepeats, alloc);

  const ChartStyleConfig& c = cfg.chart;
  rapidjson::Value chart(rapidjson::kObjectType);
  chart.AddMember("slotWidth", static_cast<double>(c.slotWidth), alloc);
  chart.AddMember("pricePadding", c.pricePadding, alloc);
  chart.AddMember("volumeHeightRatio", static_cast<double>(c.volumeHeightRatio), alloc);
  chart.AddMember("bodyWidthRatio", static_cast<double>(c.bodyWidthRatio), alloc);
  chart.AddMember("wickWidthRatio", static_cast<double>(c.wickWidthRatio), alloc);
  chart.AddMember("gridHLines", c.gridHLines, alloc);
  chart.AddMember("gridVLines", c.gridVLines, alloc);
  chart.AddMember("gridAlpha", static_cast<double>(c.gridAlpha), alloc);
  chart.AddMember("volumeBarRatio", static_cast<double>(c.volumeBarRatio), alloc);
  chart.AddMember("volumeAlpha", static_cast<double>(c.volumeAlpha), alloc);
  chart.AddMember("lineThickness", static_cast<double>(c.lineThickness), alloc);
  chart.AddMember("markerRadius", static_cast<double>(c.markerRadius), alloc);
  doc.AddMember("chart", chart, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

Status loadEngineConfigFile(const std::string& path, EngineConfig& out) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    std::fprintf(stderr, "EngineConfig: cannot open '%s'\n", path.c_str());
    return Status::fail(ErrorCode::ConfigInvalid, "cannot open " + path);
  }
  std::stringstream ss;
  ss << file.rdbuf();
  return parseEngineConfig(ss.str(), out);
}

} // namespace pd
