#pragma once

#include <cstdint>

#include <vecarrows/core/Scalar.hpp>
#include <vecarrows/runtime/mesh/MeshData.hpp>

namespace VecArrows {

struct MeshHandle {
  uint id = 0;

  bool IsValid() const { return id != 0; }

  bool operator==(const MeshHandle& other) const { return id == other.id; }
  bool operator!=(const MeshHandle& other) const { return id != other.id; }
};

struct MaterialHandle {
  uint id = 0;

  bool IsValid() const { return id != 0; }

  bool operator==(const MaterialHandle& other) const { return id == other.id; }
  bool operator!=(const MaterialHandle& other) const { return id != other.id; }
};

// Mesh/material store the scene allocates visual primitives from. The host owns
// the pool; implementations synchronize their own tables.
class ResourcePool {
 public:
  virtual ~ResourcePool() = default;

  virtual MeshHandle AllocateMesh(const MeshShape& shape) = 0;

  virtual MaterialHandle AllocateMaterial(const Color& color) = 0;

  // Returns false when the handle is unknown to the pool.
  virtual bool UpdateMaterialColor(MaterialHandle handle, const Color& color) = 0;

  virtual bool ReleaseMesh(MeshHandle handle) = 0;

  virtual bool ReleaseMaterial(MaterialHandle handle) = 0;
};
}  // namespace VecArrows
