#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <vecarrows/config/EngineConfigParser.hpp>
#include <vecarrows/config/SceneConfigParser.hpp>
#include <vecarrows/demo/TurntableScene.hpp>
#include <vecarrows/runtime/engine/Engine.hpp>
#include <vecarrows/utils/Logger.hpp>

#include "cxxopts.hpp"

using namespace VecArrows;

void PrintUsage() {
  std::cout << "\nUsage: "
            << "VecArrowsTurntable"
            << " [options]" << std::endl
            << "Options:" << std::endl
            << "  -e, --engine_config            path to engine json config file\n"
            << "  -s, --scene_config             path to turntable scene json config file\n"
            << "  -h, --help                     show help info\n"
            << "\n"
            << "Example usage:\n"
            << "  (Use customed scene):\n"
            << "    ./VecArrowsTurntable --engine_config \"./configs/engine_conf.json\" "
               "--scene_config \"./configs/turntable.json\"\n"
            << "  (Use built-in scene):\n"
            << R"(    ./VecArrowsTurntable --engine_config "./configs/engine_conf.json")"
            << std::endl;
}

int main(int argc, char* argv[]) {
  cxxopts::Options options("VecArrows", "Vector arrow gadgets on a headless turntable scene");

  options.add_options()
      ("e,engine_config", "Engine config", cxxopts::value<std::string>()->default_value("./engine_conf.json"))
      ("s,scene_config", "Scene config", cxxopts::value<std::string>())
      ("h,help", "Usage");

  cxxopts::ParseResult result;
  try {
    result = options.parse(argc, argv);
  } catch (const cxxopts::exceptions::parsing& e) {
    std::cout << e.what() << std::endl;
    return VECARROWS_EXIT::ARGUMENT_PARSING_ERROR;
  }

  if (result.count("help")) {
    PrintUsage();
    return VECARROWS_EXIT::SUCCESS;
  }

  if (result.count("engine_config") == 0) {
    std::cout << "No engine config file specified, using default config: "
              << result["engine_config"].as<std::string>() << std::endl;
  }
  std::string engine_config_path = result["engine_config"].as<std::string>();

  EngineConfigParser engine_config;
  if (!engine_config.LoadFromJson(engine_config_path)) {
    return VECARROWS_EXIT::INVALID_ENGINE_CONFIG;
  }
  engine_config.Apply();

  SceneConfigParser scene_config;
  if (result.count("scene_config") > 1) {
    LOG_ERROR("Only one scene config is allowed, exit engine.");
    return VECARROWS_EXIT::ARGUMENT_PARSING_ERROR;
  } else if (result.count("scene_config") == 1) {
    std::string scene_config_path = result["scene_config"].as<std::string>();
    LOG_DEBUG("Scene config path: {}", scene_config_path);
    if (!scene_config.LoadFromJson(scene_config_path)) {
      LOG_ERROR("An error occured when reading {}, exit engine.", scene_config_path);
      return VECARROWS_EXIT::INVALID_SCENE_CONFIG;
    }
  } else {
    LOG_INFO("No scene config specified, using the built-in turntable scene");
  }

  auto engine = std::make_shared<Engine>();
  std::vector<std::shared_ptr<Scene>> scenes;
  scenes.push_back(std::make_shared<TurntableScene>(scene_config.settings));
  engine->SetScenes(scenes);

  return engine->Run();
}
