#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>

#include <vecarrows/runtime/mesh/MeshData.hpp>
#include <vecarrows/runtime/resources/Material.hpp>
#include <vecarrows/runtime/resources/ResourcePool.hpp>

namespace VecArrows {

struct MeshResource {
  MeshShape shape;
  MeshData data;
};

// In-process pool that keeps generated mesh data and materials in hash maps.
// Handles are never reused.
class MemoryResourcePool : public ResourcePool {
 public:
  MemoryResourcePool();

  MeshHandle AllocateMesh(const MeshShape& shape) override;

  MaterialHandle AllocateMaterial(const Color& color) override;

  bool UpdateMaterialColor(MaterialHandle handle, const Color& color) override;

  bool ReleaseMesh(MeshHandle handle) override;

  bool ReleaseMaterial(MaterialHandle handle) override;

  std::shared_ptr<const MeshResource> GetMesh(MeshHandle handle) const;

  std::shared_ptr<const Material> GetMaterial(MaterialHandle handle) const;

  size_t NumMeshes() const;

  size_t NumMaterials() const;

  void Clear();

 private:
  mutable std::mutex mutex_;
  uint next_mesh_id_ = 1;
  uint next_material_id_ = 1;
  std::unordered_map<uint, std::shared_ptr<MeshResource>> meshes_;
  std::unordered_map<uint, std::shared_ptr<Material>> materials_;
};
}  // namespace VecArrows
