#include <vecarrows/runtime/scene/Actor.hpp>

#include <algorithm>

#include <vecarrows/runtime/engine/GameInstance.hpp>
#include <vecarrows/utils/Helper.hpp>
#include <vecarrows/utils/Logger.hpp>

namespace VecArrows {
Actor::Actor() = default;

Actor::Actor(std::string name) : name(name) {}

void Actor::Initialize(Vector3 position, Vector3 scale, Vector3 rotation) {
  transform->position = position;
  transform->scale = scale;
  transform->rotation = Helper::RotateWithDegree(rotation);
}

void Actor::Rotate(Vector3 rotation) {
  transform->rotation = Helper::RotateWithDegree(rotation);
}

bool Actor::SetParent(const std::shared_ptr<Actor>& parent) {
  if (parent == nullptr) {
    transform->SetParent(nullptr);
    return true;
  }

  for (auto t = parent->transform; t != nullptr; t = t->GetParent()) {
    if (t == transform) {
      LOG_ERROR("Cannot parent {} to {}: cycle in hierarchy", name, parent->name);
      return false;
    }
  }

  transform->SetParent(parent->transform);
  return true;
}

void Actor::Start() {
  for (const auto& c : components) {
    if (!c->started) {
      c->started = true;
      c->Start();
    }
  }
}

void Actor::AddComponent(std::shared_ptr<Component> component) {
  component->actor = this;
  components.push_back(component);

  if (game_ != nullptr) {
    game_->OnComponentAdded(this, component);
  }
}

void Actor::AddComponents(const std::initializer_list<std::shared_ptr<Component>>& new_components) {
  for (const auto& c : new_components) {
    AddComponent(c);
  }
}

bool Actor::RemoveComponent(Component* component) {
  auto iter = std::find_if(components.begin(), components.end(),
                           [component](const auto& c) { return c.get() == component; });
  if (iter == components.end()) {
    return false;
  }

  std::shared_ptr<Component> removed = *iter;
  components.erase(iter);
  removed->actor = nullptr;

  if (game_ != nullptr) {
    game_->OnComponentRemoved(id_, removed);
  }
  return true;
}

void Actor::OnDestroy() {
  // copy, OnDestroy hooks may touch the component list
  auto current = components;
  for (const auto& c : current) {
    c->OnDestroy();
  }
}

void Actor::Update() {
  auto current = components;
  for (const auto& c : current) {
    if (c->enabled) {
      c->Update();
    }
  }
}

const std::string Actor::GetName() {
  return name;
}

ActorId Actor::GetId() const {
  return id_;
}

GameInstance* Actor::GetGame() const {
  return game_;
}
}  // namespace VecArrows
