#pragma once

#include <vecarrows/runtime/scene/Component.hpp>

#include <vecarrows/runtime/resources/ResourcePool.hpp>

namespace VecArrows {
// Binds a pooled mesh and material to an actor. Both handles go back to the
// pool when the actor is destroyed.
class MeshRenderer : public Component {
 public:
  MeshRenderer(ResourcePool* pool, MeshHandle mesh, MaterialHandle material);

  // Writes the base color of the bound material. Returns false when the pool
  // no longer knows the material.
  bool SetColor(const Color& color);

  MeshHandle mesh() const;

  MaterialHandle material() const;

  void OnDestroy() override;

 protected:
  ResourcePool* pool_;
  MeshHandle mesh_;
  MaterialHandle material_;
  bool released_ = false;
};
}  // namespace VecArrows
