#pragma once
#include <string>

#include <rapidjson/document.h>

namespace rc {

class RadarChart;

struct CmdError {
  std::string code;     // e.g. "MISSING_FIELD"
  std::string message;  // human text
  std::string details;  // small JSON string with fields
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
};

// Applies JSON option commands to a RadarChart, e.g.
//   {"cmd":"setSkipWebLineCount","value":2}
//   {"cmd":"setAxisMinimum","value":0}
//   {"cmd":"highlightAt","x":120,"y":40}
class CommandProcessor {
public:
  explicit CommandProcessor(RadarChart& chart);

  CmdResult applyJson(const rapidjson::Value& obj);

  // Convenience: parse string then apply.
  CmdResult applyJsonText(const std::string& jsonText);

private:
  RadarChart& chart_;

  // ---- handlers ----
  CmdResult cmdSetSkipWebLineCount(const rapidjson::Value& obj);
  CmdResult cmdSetHoleRadiusPercent(const rapidjson::Value& obj);
  CmdResult cmdSetDrawHoleEnabled(const rapidjson::Value& obj);
  CmdResult cmdSetDrawWeb(const rapidjson::Value& obj);
  CmdResult cmdSetWebLineWidth(const rapidjson::Value& obj);
  CmdResult cmdSetRotation(const rapidjson::Value& obj);
  CmdResult cmdSetAxisMinimum(const rapidjson::Value& obj);
  CmdResult cmdSetAxisMaximum(const rapidjson::Value& obj);
  CmdResult cmdSetContentRect(const rapidjson::Value& obj);
  CmdResult cmdSetSeriesVisible(const rapidjson::Value& obj);
  CmdResult cmdApplyConfig(const rapidjson::Value& obj);
  CmdResult cmdHighlightAt(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static bool getNumber(const rapidjson::Value& obj, const char* key, double& out);
  static bool getBool(const rapidjson::Value& obj, const char* key, bool& out);
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
};

} // namespace rc
