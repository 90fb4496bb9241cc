#pragma once

#include <memory>
#include <vector>

#include <vecarrows/config/SceneConfig.hpp>
#include <vecarrows/runtime/scene/Scene.hpp>

namespace VecArrows {

// Spins its actor around +Y every tick.
class Turntable : public Component {
 public:
  Turntable(Scalar _degrees_per_tick);

  void Update() override;

  Scalar degrees_per_tick;
};

// Plays scripted scene events on the ticks they are scheduled for.
class EventScript : public Component {
 public:
  EventScript(const TurntableSettings& _settings, ActorId _cube, std::vector<ActorId> _arrows);

  void Update() override;

  void Fire(const SceneEvent& event);

 private:
  void RemoveArrows();

  void AddArrows();

  TurntableSettings settings_;
  ActorId cube_;
  // owners, same order as settings_.arrows
  std::vector<ActorId> arrows_;
  size_t next_event_ = 0;
};

// Logs tip position and color of every materialized arrow at a fixed interval.
class ArrowReporter : public Component {
 public:
  ArrowReporter(uint _interval);

  void Update() override;

  void Report();

  uint interval;
};

std::shared_ptr<VecArrow> MakeVecArrow(const ArrowSettings& arrow);

// Cube on a turntable with axis arrows attached, driven by a scripted event list.
class TurntableScene : public Scene {
 public:
  TurntableScene(const TurntableSettings& settings);

  void PopulateActors(GameInstance* game) override;

 private:
  TurntableSettings settings_;
};
}  // namespace VecArrows
