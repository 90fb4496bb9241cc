#pragma once

#include <string>

#include <json/json.h>

#include <vecarrows/config/SceneConfig.hpp>

namespace VecArrows {
class SceneConfigParser {
 public:
  SceneConfigParser();

  bool LoadFromJson(const std::string& path);

  bool LoadFromString(const std::string& text);

  TurntableSettings settings = TurntableSettings::Default();

 private:
  bool Parse(const Json::Value& root);

  bool ParseArrow(const Json::Value& value, ArrowSettings& arrow);

  bool ParseEvent(const Json::Value& value, SceneEvent& event);
};
}  // namespace VecArrows
