#include <vecarrows/config/SceneConfigParser.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

#include <vecarrows/utils/Logger.hpp>

namespace VecArrows {
SceneConfigParser::SceneConfigParser() = default;

namespace {
bool ParseVector3(const Json::Value& value, Vector3& out) {
  if (!value.isArray() || value.size() != 3) {
    return false;
  }
  for (Json::ArrayIndex i = 0; i < 3; i++) {
    if (!value[i].isNumeric()) {
      return false;
    }
    out[i] = value[i].asFloat();
  }
  return true;
}

// RGB or RGBA, linear
bool ParseColor(const Json::Value& value, Color& out) {
  if (!value.isArray() || (value.size() != 3 && value.size() != 4)) {
    return false;
  }
  Color color = Colors::WHITE;
  for (Json::ArrayIndex i = 0; i < value.size(); i++) {
    if (!value[i].isNumeric()) {
      return false;
    }
    color[i] = value[i].asFloat();
  }
  out = color;
  return true;
}

bool ParseOptionalScalar(const Json::Value& root, const char* key, Scalar& out) {
  if (!root.isMember(key)) {
    return true;
  }
  if (!root[key].isNumeric()) {
    LOG_ERROR("{} must be a number", key);
    return false;
  }
  out = root[key].asFloat();
  return true;
}
}  // namespace

bool SceneConfigParser::LoadFromJson(const std::string& path) {
  LOG_INFO("Reading scene config from: {}", path);

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    LOG_ERROR("Error opening file: {}", path);
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return LoadFromString(buffer.str());
}

bool SceneConfigParser::LoadFromString(const std::string& text) {
  Json::Reader reader;
  Json::Value root;

  if (!reader.parse(text, root, false)) {
    LOG_ERROR("Failed to parse scene config: {}", reader.getFormattedErrorMessages());
    return false;
  }
  if (!root.isObject()) {
    LOG_ERROR("Scene config must be a json object");
    return false;
  }

  // keep the previous settings untouched on failure
  TurntableSettings backup = settings;
  if (!Parse(root)) {
    settings = backup;
    return false;
  }
  return true;
}

bool SceneConfigParser::Parse(const Json::Value& root) {
  if (root.isMember("CUBE_POSITION") && !ParseVector3(root["CUBE_POSITION"], settings.cube_position)) {
    LOG_ERROR("CUBE_POSITION must be an array of 3 numbers");
    return false;
  }
  if (!ParseOptionalScalar(root, "TURNTABLE_SPEED", settings.turntable_speed)) {
    return false;
  }
  if (root.isMember("SEED")) {
    if (!root["SEED"].isUInt()) {
      LOG_ERROR("SEED must be a non-negative integer");
      return false;
    }
    settings.seed = root["SEED"].asUInt();
  }

  if (root.isMember("ARROWS")) {
    const Json::Value& arrows = root["ARROWS"];
    if (!arrows.isArray()) {
      LOG_ERROR("ARROWS must be an array of objects");
      return false;
    }
    settings.arrows.clear();
    for (Json::ArrayIndex i = 0; i < arrows.size(); i++) {
      ArrowSettings arrow;
      arrow.name = "Arrow " + std::to_string(i);
      if (!ParseArrow(arrows[i], arrow)) {
        LOG_ERROR("Invalid arrow at index {}", i);
        return false;
      }
      settings.arrows.push_back(arrow);
    }
  }

  if (root.isMember("EVENTS")) {
    const Json::Value& events = root["EVENTS"];
    if (!events.isArray()) {
      LOG_ERROR("EVENTS must be an array of objects");
      return false;
    }
    settings.events.clear();
    for (Json::ArrayIndex i = 0; i < events.size(); i++) {
      SceneEvent event;
      if (!ParseEvent(events[i], event)) {
        LOG_ERROR("Invalid event at index {}", i);
        return false;
      }
      settings.events.push_back(event);
    }
    std::stable_sort(settings.events.begin(), settings.events.end(),
                     [](const SceneEvent& a, const SceneEvent& b) { return a.tick < b.tick; });
  }

  LOG_DEBUG("Scene config: {} arrows, {} events", settings.arrows.size(), settings.events.size());
  return true;
}

bool SceneConfigParser::ParseArrow(const Json::Value& value, ArrowSettings& arrow) {
  if (!value.isObject()) {
    return false;
  }
  if (value.isMember("NAME")) {
    if (!value["NAME"].isString()) {
      LOG_ERROR("NAME must be a string");
      return false;
    }
    arrow.name = value["NAME"].asString();
  }
  if (!ParseVector3(value["TARGET"], arrow.target)) {
    LOG_ERROR("TARGET must be an array of 3 numbers");
    return false;
  }
  if (value.isMember("SPACE") && (!value["SPACE"].isString() ||
                                  !ParseTargetCoordinateSpace(value["SPACE"].asString(), arrow.space))) {
    LOG_ERROR("Unknown SPACE {}, expected LOCAL or GLOBAL", value["SPACE"].toStyledString());
    return false;
  }
  if (value.isMember("COLOR") && !ParseColor(value["COLOR"], arrow.color)) {
    LOG_ERROR("COLOR must be an array of 3 or 4 numbers");
    return false;
  }
  if (!ParseOptionalScalar(value, "THICKNESS", arrow.thickness) ||
      !ParseOptionalScalar(value, "TIP_THICKNESS", arrow.tip_thickness) ||
      !ParseOptionalScalar(value, "TIP_LENGTH", arrow.tip_length)) {
    return false;
  }
  if (value.isMember("PARENT")) {
    if (!value["PARENT"].isString()) {
      LOG_ERROR("PARENT must be a string");
      return false;
    }
    std::string parent = value["PARENT"].asString();
    if (parent == "CUBE") {
      arrow.parent = ArrowParent::CUBE;
    } else if (parent == "WORLD") {
      arrow.parent = ArrowParent::WORLD;
    } else {
      LOG_ERROR("Unknown PARENT {}, expected CUBE or WORLD", parent);
      return false;
    }
  }
  return true;
}

bool SceneConfigParser::ParseEvent(const Json::Value& value, SceneEvent& event) {
  if (!value.isObject()) {
    return false;
  }
  if (!value["TICK"].isUInt()) {
    LOG_ERROR("TICK must be a non-negative integer");
    return false;
  }
  event.tick = value["TICK"].asUInt();

  if (!value["ACTION"].isString() || !ParseSceneAction(value["ACTION"].asString(), event.action)) {
    LOG_ERROR("Unknown ACTION {}", value["ACTION"].toStyledString());
    return false;
  }

  if (event.action == SceneAction::MOVE && !ParseVector3(value["OFFSET"], event.offset)) {
    LOG_ERROR("MOVE requires an OFFSET array of 3 numbers");
    return false;
  }
  return true;
}
}  // namespace VecArrows
