#pragma once

#include <memory>
#include <optional>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <vecarrows/core/Scalar.hpp>

namespace VecArrows {

// Plain translation/rotation/scale value.
struct Pose {
  Vector3 translation = Vector3(0.0f);
  Quat rotation = Quat(1.0f, 0.0f, 0.0f, 0.0f);
  Vector3 scale = Vector3(1.0f);

  static Pose Identity() { return Pose(); }

  static Pose FromScale(const Vector3& scale) {
    Pose result;
    result.scale = scale;
    return result;
  }

  // Full composition, this is the parent of child.
  Pose Compose(const Pose& child) const;
};

class Transform {
 public:
  Pose local() const;

  void SetLocal(const Pose& pose);

  void SetParent(const std::shared_ptr<Transform>& parent);

  std::shared_ptr<Transform> GetParent() const;

  // World pose as of the last propagation, absent until the first one.
  const std::optional<Pose>& world() const;

  // Recomputes the cached world pose from the parent chain.
  const Pose& UpdateWorld();

  Vector3 position = Vector3(0.0f);
  Quat rotation = Quat(1.0f, 0.0f, 0.0f, 0.0f);
  Vector3 scale = Vector3(1.0f);

 private:
  std::weak_ptr<Transform> parent_;
  std::optional<Pose> world_;
};
}  // namespace VecArrows
