#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <vecarrows/config/EngineConfigParser.hpp>
#include <vecarrows/config/SceneConfigParser.hpp>
#include <vecarrows/core/Global.hpp>

using namespace VecArrows;

namespace {
class TempJson {
 public:
  TempJson(const std::string& name, const std::string& content) {
    path_ = std::filesystem::temp_directory_path() / ("vecarrows_" + name + ".json");
    std::ofstream file(path_);
    file << content;
  }

  ~TempJson() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  std::string path() const { return path_.string(); }

 private:
  std::filesystem::path path_;
};
}  // namespace

TEST(EngineConfigParser, ReadsAllKeys) {
  TempJson json("engine_full", R"({
    "LOG_PATH": "./custom_log/",
    "LOG_LEVEL": 1,
    "LOG_TO_FILE": false,
    "NUM_TICKS": 42,
    "REPORT_INTERVAL": 7
  })");

  EngineConfigParser parser;
  ASSERT_TRUE(parser.LoadFromJson(json.path()));
  EXPECT_EQ(parser.config().log_path, "./custom_log/");
  EXPECT_EQ(parser.config().log_level, 1);
  EXPECT_FALSE(parser.config().log_to_file);
  EXPECT_EQ(parser.config().num_ticks, 42u);
  EXPECT_EQ(parser.config().report_interval, 7u);

  EngineConfig previous = Global::engine_config;
  parser.Apply();
  EXPECT_EQ(Global::engine_config.num_ticks, 42u);
  Global::engine_config = previous;
}

TEST(EngineConfigParser, MissingKeysKeepDefaults) {
  TempJson json("engine_partial", R"({ "NUM_TICKS": 10 })");

  EngineConfigParser parser;
  ASSERT_TRUE(parser.LoadFromJson(json.path()));
  EngineConfig defaults;
  EXPECT_EQ(parser.config().num_ticks, 10u);
  EXPECT_EQ(parser.config().log_path, defaults.log_path);
  EXPECT_EQ(parser.config().log_level, defaults.log_level);
  EXPECT_EQ(parser.config().report_interval, defaults.report_interval);
}

TEST(EngineConfigParser, RejectsBadInput) {
  EngineConfigParser parser;
  EXPECT_FALSE(parser.LoadFromJson("/nonexistent/vecarrows/engine_conf.json"));

  TempJson broken("engine_broken", R"({ "LOG_LEVEL": )");
  EXPECT_FALSE(parser.LoadFromJson(broken.path()));

  TempJson level("engine_level", R"({ "LOG_LEVEL": 9 })");
  EXPECT_FALSE(parser.LoadFromJson(level.path()));

  TempJson ticks("engine_ticks", R"({ "NUM_TICKS": "many" })");
  EXPECT_FALSE(parser.LoadFromJson(ticks.path()));
}

TEST(SceneConfigParser, DefaultsDescribeAxisArrows) {
  SceneConfigParser parser;
  const auto& arrows = parser.settings.arrows;
  ASSERT_EQ(arrows.size(), 4u);
  EXPECT_EQ(arrows[0].target, Vector3(2.0f, 0.0f, 0.0f));
  EXPECT_EQ(arrows[0].color, Colors::RED);
  EXPECT_EQ(arrows[1].color, Colors::GREEN);
  EXPECT_EQ(arrows[2].color, Colors::BLUE);
  EXPECT_EQ(arrows[3].target, Vector3(2.0f, 2.0f, 0.0f));
  EXPECT_EQ(arrows[3].color, Colors::YELLOW);
  for (const auto& arrow : arrows) {
    EXPECT_EQ(arrow.space, TargetCoordinateSpace::LOCAL);
    EXPECT_EQ(arrow.parent, ArrowParent::CUBE);
  }
  EXPECT_FALSE(parser.settings.events.empty());
}

TEST(SceneConfigParser, ReadsArrowsAndEvents) {
  SceneConfigParser parser;
  ASSERT_TRUE(parser.LoadFromString(R"({
    "CUBE_POSITION": [1, 2, 3],
    "TURNTABLE_SPEED": 1.5,
    "SEED": 11,
    "ARROWS": [
      { "NAME": "Up", "TARGET": [0, 1, 0], "SPACE": "GLOBAL", "COLOR": [0.5, 0.25, 1, 0.5],
        "TIP_LENGTH": 0.3, "PARENT": "WORLD" },
      { "TARGET": [1, 0, 0] }
    ],
    "EVENTS": [
      { "TICK": 30, "ACTION": "MOVE", "OFFSET": [0, 0, 1] },
      { "TICK": 10, "ACTION": "TOGGLE_SPACE" }
    ]
  })"));

  const auto& settings = parser.settings;
  EXPECT_EQ(settings.cube_position, Vector3(1.0f, 2.0f, 3.0f));
  EXPECT_FLOAT_EQ(settings.turntable_speed, 1.5f);
  EXPECT_EQ(settings.seed, 11u);

  ASSERT_EQ(settings.arrows.size(), 2u);
  EXPECT_EQ(settings.arrows[0].name, "Up");
  EXPECT_EQ(settings.arrows[0].space, TargetCoordinateSpace::GLOBAL);
  EXPECT_EQ(settings.arrows[0].color, Color(0.5f, 0.25f, 1.0f, 0.5f));
  EXPECT_FLOAT_EQ(settings.arrows[0].tip_length, 0.3f);
  EXPECT_FLOAT_EQ(settings.arrows[0].tip_thickness, 0.075f);
  EXPECT_EQ(settings.arrows[0].parent, ArrowParent::WORLD);

  EXPECT_EQ(settings.arrows[1].name, "Arrow 1");
  EXPECT_EQ(settings.arrows[1].space, TargetCoordinateSpace::LOCAL);
  EXPECT_EQ(settings.arrows[1].color, Colors::WHITE);
  EXPECT_EQ(settings.arrows[1].parent, ArrowParent::CUBE);

  // events come back ordered by tick
  ASSERT_EQ(settings.events.size(), 2u);
  EXPECT_EQ(settings.events[0].tick, 10u);
  EXPECT_EQ(settings.events[0].action, SceneAction::TOGGLE_SPACE);
  EXPECT_EQ(settings.events[1].action, SceneAction::MOVE);
  EXPECT_EQ(settings.events[1].offset, Vector3(0.0f, 0.0f, 1.0f));
}

TEST(SceneConfigParser, FailureKeepsPreviousSettings) {
  SceneConfigParser parser;
  EXPECT_FALSE(parser.LoadFromString(R"({
    "ARROWS": [ { "TARGET": [1, 0, 0], "SPACE": "SIDEWAYS" } ]
  })"));
  EXPECT_EQ(parser.settings.arrows.size(), 4u);

  EXPECT_FALSE(parser.LoadFromString(R"({ "EVENTS": [ { "TICK": 5, "ACTION": "MOVE" } ] })"));
  EXPECT_FALSE(parser.LoadFromString(R"({ "EVENTS": [ { "TICK": 5, "ACTION": "JUMP" } ] })"));
  EXPECT_FALSE(parser.LoadFromString(R"({ "ARROWS": [ { "TARGET": [1, 0] } ] })"));
  EXPECT_FALSE(parser.LoadFromString(R"({ "ARROWS": { "TARGET": [1, 0, 0] } })"));
  EXPECT_FALSE(parser.LoadFromString(R"({ "ARROWS": [ { "TARGET": [1, 0, 0], "COLOR": [1] } ] })"));
  EXPECT_FALSE(parser.LoadFromString("[1, 2, 3]"));
  EXPECT_FALSE(parser.LoadFromString("{ not json"));
  EXPECT_EQ(parser.settings.arrows.size(), 4u);
}

TEST(SceneConfigParser, ReadsFile) {
  TempJson json("scene", R"({ "SEED": 3, "EVENTS": [] })");

  SceneConfigParser parser;
  ASSERT_TRUE(parser.LoadFromJson(json.path()));
  EXPECT_EQ(parser.settings.seed, 3u);
  EXPECT_TRUE(parser.settings.events.empty());
  EXPECT_EQ(parser.settings.arrows.size(), 4u);

  EXPECT_FALSE(parser.LoadFromJson("/nonexistent/vecarrows/turntable.json"));
}

TEST(SceneConfig, ActionNames) {
  SceneAction action = SceneAction::ROLL;
  EXPECT_TRUE(ParseSceneAction("REMOVE_ARROWS", action));
  EXPECT_EQ(action, SceneAction::REMOVE_ARROWS);
  EXPECT_EQ(ToString(SceneAction::ADD_ARROWS), "ADD_ARROWS");
  EXPECT_FALSE(ParseSceneAction("roll", action));
}
