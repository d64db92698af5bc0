#include "rc/commands/CommandProcessor.hpp"
#include "rc/chart/RadarChart.hpp"
#include "rc/chart/RadarHighlighter.hpp"
#include "rc/session/RadarConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <cstdio>
#include <string>

namespace rc {

CommandProcessor::CommandProcessor(RadarChart& chart)
  : chart_(chart) {}

CmdResult CommandProcessor::fail(const std::string& code,
                                 const std::string& message,
                                 const std::string& detailsJson) {
  std::fprintf(stderr, "[CommandProcessor] %s: %s\n", code.c_str(), message.c_str());
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  return r;
}

const rapidjson::Value* CommandProcessor::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

bool CommandProcessor::getNumber(const rapidjson::Value& obj, const char* key, double& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsNumber()) return false;
  out = v->GetDouble();
  return std::isfinite(out);
}

bool CommandProcessor::getBool(const rapidjson::Value& obj, const char* key, bool& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsBool()) return false;
  out = v->GetBool();
  return true;
}

CmdResult CommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "CommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult CommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  if (cmd == "setSkipWebLineCount") return cmdSetSkipWebLineCount(obj);
  if (cmd == "setHoleRadiusPercent") return cmdSetHoleRadiusPercent(obj);
  if (cmd == "setDrawHoleEnabled") return cmdSetDrawHoleEnabled(obj);
  if (cmd == "setDrawWeb") return cmdSetDrawWeb(obj);
  if (cmd == "setWebLineWidth") return cmdSetWebLineWidth(obj);
  if (cmd == "setRotation") return cmdSetRotation(obj);
  if (cmd == "setAxisMinimum") return cmdSetAxisMinimum(obj);
  if (cmd == "setAxisMaximum") return cmdSetAxisMaximum(obj);
  if (cmd == "resetAxisMinimum") { chart_.resetAxisMinimum(); return CmdResult{}; }
  if (cmd == "resetAxisMaximum") { chart_.resetAxisMaximum(); return CmdResult{}; }
  if (cmd == "setContentRect") return cmdSetContentRect(obj);
  if (cmd == "setSeriesVisible") return cmdSetSeriesVisible(obj);
  if (cmd == "applyConfig") return cmdApplyConfig(obj);
  if (cmd == "highlightAt") return cmdHighlightAt(obj);
  if (cmd == "clearHighlights") { chart_.clearHighlights(); return CmdResult{}; }

  return fail("UNKNOWN_COMMAND",
              "Unknown cmd",
              std::string(R"({"cmd":")") + cmd + R"("})");
}

// -------------------- web / hole --------------------

CmdResult CommandProcessor::cmdSetSkipWebLineCount(const rapidjson::Value& obj) {
  const auto* v = getMember(obj, "value");
  if (!v) return fail("MISSING_FIELD", "setSkipWebLineCount: missing value");
  if (!v->IsInt()) return fail("BAD_VALUE", "setSkipWebLineCount: value must be an integer");

  // Negative counts are clamped, not rejected
  chart_.setSkipWebLineCount(v->GetInt());
  return CmdResult{};
}

CmdResult CommandProcessor::cmdSetHoleRadiusPercent(const rapidjson::Value& obj) {
  double v = 0;
  if (!getNumber(obj, "value", v)) {
    return fail("MISSING_FIELD", "setHoleRadiusPercent: missing numeric value");
  }
  chart_.setHoleRadiusPercent(v);
  return CmdResult{};
}

CmdResult CommandProcessor::cmdSetDrawHoleEnabled(const rapidjson::Value& obj) {
  bool v = false;
  if (!getBool(obj, "value", v)) {
    return fail("MISSING_FIELD", "setDrawHoleEnabled: missing bool value");
  }
  chart_.setDrawHoleEnabled(v);
  return CmdResult{};
}

CmdResult CommandProcessor::cmdSetDrawWeb(const rapidjson::Value& obj) {
  bool v = false;
  if (!getBool(obj, "value", v)) {
    return fail("MISSING_FIELD", "setDrawWeb: missing bool value");
  }
  chart_.setDrawWeb(v);
  return CmdResult{};
}

CmdResult CommandProcessor::cmdSetWebLineWidth(const rapidjson::Value& obj) {
  double v = 0;
  if (!getNumber(obj, "value", v)) {
    return fail("MISSING_FIELD", "setWebLineWidth: missing numeric value");
  }
  if (v < 0.0) return fail("BAD_VALUE", "setWebLineWidth: width must be >= 0");
  chart_.setWebLineWidth(v);
  return CmdResult{};
}

CmdResult CommandProcessor::cmdSetRotation(const rapidjson::Value& obj) {
  double deg = 0;
  if (!getNumber(obj, "degrees", deg)) {
    return fail("MISSING_FIELD", "setRotation: missing numeric degrees");
  }
  chart_.setRotationDegrees(deg);
  return CmdResult{};
}

// -------------------- axis --------------------

CmdResult CommandProcessor::cmdSetAxisMinimum(const rapidjson::Value& obj) {
  double v = 0;
  if (!getNumber(obj, "value", v)) {
    return fail("MISSING_FIELD", "setAxisMinimum: missing numeric value");
  }
  chart_.setAxisMinimum(v);
  return CmdResult{};
}

CmdResult CommandProcessor::cmdSetAxisMaximum(const rapidjson::Value& obj) {
  double v = 0;
  if (!getNumber(obj, "value", v)) {
    return fail("MISSING_FIELD", "setAxisMaximum: missing numeric value");
  }
  chart_.setAxisMaximum(v);
  return CmdResult{};
}

// -------------------- layout / data --------------------

CmdResult CommandProcessor::cmdSetContentRect(const rapidjson::Value& obj) {
  Rect r;
  if (!getNumber(obj, "x", r.x) || !getNumber(obj, "y", r.y) ||
      !getNumber(obj, "width", r.width) || !getNumber(obj, "height", r.height)) {
    return fail("MISSING_FIELD", "setContentRect: requires numeric x, y, width, height");
  }
  if (r.width < 0.0 || r.height < 0.0) {
    return fail("BAD_VALUE", "setContentRect: negative size");
  }
  chart_.setContentRect(r);
  return CmdResult{};
}

CmdResult CommandProcessor::cmdSetSeriesVisible(const rapidjson::Value& obj) {
  const auto* s = getMember(obj, "series");
  bool visible = true;
  if (!s || !s->IsUint() || !getBool(obj, "visible", visible)) {
    return fail("MISSING_FIELD", "setSeriesVisible: requires series index and visible");
  }
  if (!chart_.setSeriesVisible(s->GetUint(), visible)) {
    return fail("BAD_VALUE", "setSeriesVisible: unknown series",
                R"({"series":)" + std::to_string(s->GetUint()) + "}");
  }
  return CmdResult{};
}

CmdResult CommandProcessor::cmdApplyConfig(const rapidjson::Value& obj) {
  const auto* cfgV = getMember(obj, "config");
  if (!cfgV || !cfgV->IsObject()) {
    return fail("MISSING_FIELD", "applyConfig: missing config object");
  }

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  cfgV->Accept(writer);

  RadarConfig cfg = chart_.config();
  if (!deserializeRadarConfig(sb.GetString(), cfg)) {
    return fail("BAD_VALUE", "applyConfig: config did not parse");
  }
  chart_.setConfig(cfg);
  return CmdResult{};
}

// -------------------- interaction --------------------

CmdResult CommandProcessor::cmdHighlightAt(const rapidjson::Value& obj) {
  double x = 0, y = 0;
  if (!getNumber(obj, "x", x) || !getNumber(obj, "y", y)) {
    return fail("MISSING_FIELD", "highlightAt: requires numeric x, y");
  }

  RadarHighlighter highlighter(chart_);
  RadarHit hit = highlighter.pick(x, y);
  if (hit.hit) {
    chart_.highlightValues({hit.highlight});
  } else {
    chart_.clearHighlights();
  }
  return CmdResult{};
}

} // namespace rc
