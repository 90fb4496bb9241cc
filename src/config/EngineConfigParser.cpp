#include <vecarrows/config/EngineConfigParser.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <json/json.h>

#include <vecarrows/core/Global.hpp>

namespace VecArrows {
EngineConfigParser::EngineConfigParser() = default;

bool EngineConfigParser::LoadFromJson(const std::string& path) {
  // the logger is built from this config, so report through the console
  std::cout << "Reading engine config from: " << path << std::endl;

  std::ifstream file(path, std::ios::binary);

  if (!file.is_open()) {
    std::cerr << "Error opening file:" << path << std::endl;
    return false;
  }

  Json::Reader reader;
  Json::Value root;

  if (!reader.parse(file, root, false)) {
    std::cerr << "Failed to parse file: " << reader.getFormattedErrorMessages() << std::endl;
    return false;
  }
  if (!root.isObject()) {
    std::cerr << "Engine config must be a json object." << std::endl;
    return false;
  }

  EngineConfig config;
  try {
    config.log_path = root.get("LOG_PATH", config.log_path).asString();
    config.log_level = root.get("LOG_LEVEL", config.log_level).asInt();
    config.log_to_file = root.get("LOG_TO_FILE", config.log_to_file).asBool();
    config.num_ticks = root.get("NUM_TICKS", config.num_ticks).asUInt();
    config.report_interval = root.get("REPORT_INTERVAL", config.report_interval).asUInt();
  } catch (const Json::Exception& e) {
    std::cerr << "Invalid engine config value: " << e.what() << std::endl;
    return false;
  }

  // spdlog levels, trace(0) to off(6)
  if (config.log_level < 0 || config.log_level > 6) {
    std::cerr << "LOG_LEVEL must be within [0, 6], got " << config.log_level << std::endl;
    return false;
  }

  config_ = config;
  return true;
}

void EngineConfigParser::Apply() {
  Global::engine_config = config_;

  if (config_.log_to_file && !std::filesystem::exists(config_.log_path)) {
    std::error_code ec;
    std::filesystem::create_directories(config_.log_path, ec);
    if (ec) {
      std::cerr << "Failed to create log directory " << config_.log_path << ": " << ec.message()
                << std::endl;
    }
  }
}

const EngineConfig& EngineConfigParser::config() const {
  return config_;
}
}  // namespace VecArrows
