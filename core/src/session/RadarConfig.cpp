#include "rc/session/RadarConfig.hpp"
#include "rc/radar/WebGridPlanner.hpp"

#include <algorithm>

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace rc {

RadarConfig sanitizeRadarConfig(const RadarConfig& cfg) {
  RadarConfig out = cfg;
  out.skipWebLineCount = std::max(0, out.skipWebLineCount);
  out.ringLabelCount = std::max(1, std::min(out.ringLabelCount, kMaxRingLabelCount));
  return out;
}

std::string serializeRadarConfig(const RadarConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version",
                rapidjson::Value(cfg.version.c_str(), alloc), alloc);

  // Web
  rapidjson::Value web(rapidjson::kObjectType);
  web.AddMember("draw", cfg.drawWeb, alloc);
  web.AddMember("skipLineCount", cfg.skipWebLineCount, alloc);
  web.AddMember("lineWidth", cfg.webLineWidth, alloc);
  web.AddMember("innerLineWidth", cfg.innerWebLineWidth, alloc);
  web.AddMember("alpha", cfg.webAlpha, alloc);
  web.AddMember("ringLabelCount", cfg.ringLabelCount, alloc);
  doc.AddMember("web", web, alloc);

  // Hole
  rapidjson::Value hole(rapidjson::kObjectType);
  hole.AddMember("enabled", cfg.drawHoleEnabled, alloc);
  hole.AddMember("radiusPercent", cfg.holeRadiusPercent, alloc);
  doc.AddMember("hole", hole, alloc);

  // Axis: unset overrides are written as null
  rapidjson::Value axis(rapidjson::kObjectType);
  rapidjson::Value minV, maxV;
  if (cfg.hasAxisMinimum) minV.SetDouble(cfg.axisMinimum);
  if (cfg.hasAxisMaximum) maxV.SetDouble(cfg.axisMaximum);
  axis.AddMember("minimum", minV, alloc);
  axis.AddMember("maximum", maxV, alloc);
  axis.AddMember("spaceTopPercent", cfg.spaceTopPercent, alloc);
  axis.AddMember("spaceBottomPercent", cfg.spaceBottomPercent, alloc);
  doc.AddMember("axis", axis, alloc);

  doc.AddMember("rotation", cfg.rotationDegrees, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

static void readBool(const rapidjson::Value& obj, const char* key, bool& out) {
  if (obj.HasMember(key) && obj[key].IsBool()) out = obj[key].GetBool();
}

static void readDouble(const rapidjson::Value& obj, const char* key, double& out) {
  if (obj.HasMember(key) && obj[key].IsNumber()) out = obj[key].GetDouble();
}

static void readInt(const rapidjson::Value& obj, const char* key, int& out) {
  if (obj.HasMember(key) && obj[key].IsInt()) out = obj[key].GetInt();
}

static void readOverride(const rapidjson::Value& obj, const char* key,
                         bool& has, double& out) {
  if (!obj.HasMember(key)) return;
  const auto& v = obj[key];
  if (v.IsNull()) {
    has = false;
    out = 0;
  } else if (v.IsNumber()) {
    has = true;
    out = v.GetDouble();
  }
}

bool deserializeRadarConfig(const std::string& json, RadarConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  RadarConfig cfg = out;

  if (doc.HasMember("version") && doc["version"].IsString())
    cfg.version = doc["version"].GetString();

  if (doc.HasMember("web") && doc["web"].IsObject()) {
    const auto& web = doc["web"];
    readBool(web, "draw", cfg.drawWeb);
    readInt(web, "skipLineCount", cfg.skipWebLineCount);
    readDouble(web, "lineWidth", cfg.webLineWidth);
    readDouble(web, "innerLineWidth", cfg.innerWebLineWidth);
    readDouble(web, "alpha", cfg.webAlpha);
    readInt(web, "ringLabelCount", cfg.ringLabelCount);
  }

  if (doc.HasMember("hole") && doc["hole"].IsObject()) {
    const auto& hole = doc["hole"];
    readBool(hole, "enabled", cfg.drawHoleEnabled);
    readDouble(hole, "radiusPercent", cfg.holeRadiusPercent);
  }

  if (doc.HasMember("axis") && doc["axis"].IsObject()) {
    const auto& axis = doc["axis"];
    readOverride(axis, "minimum", cfg.hasAxisMinimum, cfg.axisMinimum);
    readOverride(axis, "maximum", cfg.hasAxisMaximum, cfg.axisMaximum);
    readDouble(axis, "spaceTopPercent", cfg.spaceTopPercent);
    readDouble(axis, "spaceBottomPercent", cfg.spaceBottomPercent);
  }

  readDouble(doc, "rotation", cfg.rotationDegrees);

  out = sanitizeRadarConfig(cfg);
  return true;
}

} // namespace rc
