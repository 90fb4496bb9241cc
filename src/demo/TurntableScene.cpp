#include <vecarrows/demo/TurntableScene.hpp>

#include <utility>

#include <vecarrows/arrows/VecArrowSystem.hpp>
#include <vecarrows/core/Global.hpp>
#include <vecarrows/runtime/scene/Visibility.hpp>
#include <vecarrows/utils/Helper.hpp>
#include <vecarrows/utils/Logger.hpp>

namespace VecArrows {

Turntable::Turntable(Scalar _degrees_per_tick) : degrees_per_tick(_degrees_per_tick) {
  SET_COMPONENT_NAME;
}

void Turntable::Update() {
  auto t = transform();
  t->rotation =
      glm::normalize(glm::angleAxis(glm::radians(degrees_per_tick), Vector3(0, 1, 0)) * t->rotation);
}

EventScript::EventScript(const TurntableSettings& _settings, ActorId _cube,
                         std::vector<ActorId> _arrows)
    : settings_(_settings), cube_(_cube), arrows_(std::move(_arrows)) {
  SET_COMPONENT_NAME;
}

void EventScript::Update() {
  uint64_t tick = actor->GetGame()->FrameCount();
  while (next_event_ < settings_.events.size() && settings_.events[next_event_].tick <= tick) {
    Fire(settings_.events[next_event_]);
    next_event_++;
  }
}

void EventScript::Fire(const SceneEvent& event) {
  GameInstance* game = actor->GetGame();
  LOG_INFO("[tick {}] {}", game->FrameCount(), ToString(event.action));

  switch (event.action) {
    case SceneAction::ROLL: {
      auto cube = game->FindActor(cube_);
      if (cube) {
        cube->transform->rotation = Helper::RandomRotation();
      }
      break;
    }
    case SceneAction::TOGGLE_SPACE: {
      for (VecArrow* arrow : game->FindComponents<VecArrow>()) {
        arrow->target_coordinate_space =
            arrow->target_coordinate_space == TargetCoordinateSpace::LOCAL
                ? TargetCoordinateSpace::GLOBAL
                : TargetCoordinateSpace::LOCAL;
      }
      break;
    }
    case SceneAction::MOVE: {
      auto cube = game->FindActor(cube_);
      if (cube) {
        cube->transform->position += event.offset;
      }
      break;
    }
    case SceneAction::REMOVE_ARROWS:
      RemoveArrows();
      break;
    case SceneAction::ADD_ARROWS:
      AddArrows();
      break;
  }
}

void EventScript::RemoveArrows() {
  GameInstance* game = actor->GetGame();
  for (ActorId id : arrows_) {
    auto owner = game->FindActor(id);
    if (owner) {
      owner->RemoveComponent<VecArrow>();
    }
  }
}

void EventScript::AddArrows() {
  GameInstance* game = actor->GetGame();
  for (size_t i = 0; i < arrows_.size(); i++) {
    auto owner = game->FindActor(arrows_[i]);
    if (owner && owner->GetComponent<VecArrow>() == nullptr) {
      owner->AddComponent(MakeVecArrow(settings_.arrows[i]));
    }
  }
}

ArrowReporter::ArrowReporter(uint _interval) : interval(_interval) {
  SET_COMPONENT_NAME;
}

void ArrowReporter::Update() {
  if (interval == 0) {
    return;
  }
  if (actor->GetGame()->FrameCount() % interval == 0) {
    Report();
  }
}

void ArrowReporter::Report() {
  GameInstance* game = actor->GetGame();
  for (VecArrowTip* tip : game->FindComponents<VecArrowTip>()) {
    auto owner = game->FindActor(tip->owner);
    VecArrow* arrow = owner ? owner->GetComponent<VecArrow>() : nullptr;
    if (arrow == nullptr) {
      continue;
    }
    Vector3 p = tip->transform()->position;
    LOG_INFO("[tick {}] {} ({}) tip ({:.3f}, {:.3f}, {:.3f}) color ({:.2f}, {:.2f}, {:.2f})",
             game->FrameCount(), owner->name, ToString(arrow->target_coordinate_space), p.x, p.y,
             p.z, arrow->color.r, arrow->color.g, arrow->color.b);
  }
}

std::shared_ptr<VecArrow> MakeVecArrow(const ArrowSettings& arrow) {
  auto result = std::make_shared<VecArrow>(arrow.target, arrow.space);
  result->WithColor(arrow.color)
      .WithThickness(arrow.thickness)
      .WithTipThickness(arrow.tip_thickness)
      .WithTipLength(arrow.tip_length);
  return result;
}

TurntableScene::TurntableScene(const TurntableSettings& settings) : settings_(settings) {
  name = "Turntable";
}

void TurntableScene::PopulateActors(GameInstance* game) {
  Helper::SeedRandom(settings_.seed);

  // circular base
  auto base = SpawnShape(game, "Base", MeshShape::Cylinder(4.0f, 0.01f), Colors::WHITE);
  base->Initialize(Vector3(0.0f, -1.0f, 0.0f));

  auto turntable = game->CreateActor("Turntable root");
  turntable->AddComponents({std::make_shared<Turntable>(settings_.turntable_speed),
                            std::make_shared<Visibility>(VisibilityState::HIDDEN)});

  // srgb (124, 144, 255) in linear space
  auto cube = SpawnColoredCube(game, Color(0.202f, 0.279f, 1.0f, 1.0f));
  cube->Initialize(settings_.cube_position);
  cube->SetParent(turntable);

  std::vector<ActorId> arrows;
  for (const auto& arrow : settings_.arrows) {
    auto owner = game->CreateActor(arrow.name);
    if (arrow.parent == ArrowParent::CUBE) {
      owner->SetParent(cube);
    }
    owner->AddComponent(MakeVecArrow(arrow));
    arrows.push_back(owner->GetId());
  }

  auto director = game->CreateActor("Director");
  director->AddComponents({std::make_shared<EventScript>(settings_, cube->GetId(), arrows),
                           std::make_shared<ArrowReporter>(Global::engine_config.report_interval)});

  LOG_INFO("Turntable scene: {} arrows, {} scripted events", settings_.arrows.size(),
           settings_.events.size());
}
}  // namespace VecArrows
