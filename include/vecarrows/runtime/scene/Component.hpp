#pragma once

#include <memory>
#include <string>

#include <vecarrows/runtime/scene/Transform.hpp>

#define SET_COMPONENT_NAME name = __func__

namespace VecArrows {
class Actor;

class Component {
 public:
  virtual ~Component() = default;

  virtual void Start() {}

  virtual void Update() {}

  virtual void OnDestroy() {}

  std::string name = "Component";

  Actor* actor = nullptr;

  std::shared_ptr<Transform> transform();

  bool enabled = true;

  bool started = false;
};
}  // namespace VecArrows
