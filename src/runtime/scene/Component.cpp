#include <vecarrows/runtime/scene/Component.hpp>
#include <vecarrows/runtime/scene/Actor.hpp>

namespace VecArrows {

std::shared_ptr<Transform> Component::transform() {
  if (actor != nullptr) {
    return actor->transform;
  }

  return std::make_shared<Transform>();
}

}  // namespace VecArrows
