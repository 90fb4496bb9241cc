#include <vecarrows/runtime/resources/MemoryResourcePool.hpp>

#include <vecarrows/runtime/mesh/Primitives.hpp>
#include <vecarrows/utils/Logger.hpp>

namespace VecArrows {

MemoryResourcePool::MemoryResourcePool() = default;

MeshHandle MemoryResourcePool::AllocateMesh(const MeshShape& shape) {
  auto resource = std::make_shared<MeshResource>();
  resource->shape = shape;
  resource->data = Primitives::Build(shape);

  std::lock_guard<std::mutex> lock(mutex_);
  MeshHandle handle{next_mesh_id_++};
  meshes_[handle.id] = resource;
  LOG_TRACE("Allocate mesh #{} ({}, {} triangles)", handle.id, ToString(shape.type),
            resource->data.NumTriangles());
  return handle;
}

MaterialHandle MemoryResourcePool::AllocateMaterial(const Color& color) {
  auto material = std::make_shared<Material>(color);

  std::lock_guard<std::mutex> lock(mutex_);
  MaterialHandle handle{next_material_id_++};
  material->name = "Material#" + std::to_string(handle.id);
  materials_[handle.id] = material;
  return handle;
}

bool MemoryResourcePool::UpdateMaterialColor(MaterialHandle handle, const Color& color) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto iter = materials_.find(handle.id);
  if (iter == materials_.end()) {
    return false;
  }
  iter->second->base_color = color;
  return true;
}

bool MemoryResourcePool::ReleaseMesh(MeshHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  return meshes_.erase(handle.id) > 0;
}

bool MemoryResourcePool::ReleaseMaterial(MaterialHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  return materials_.erase(handle.id) > 0;
}

std::shared_ptr<const MeshResource> MemoryResourcePool::GetMesh(MeshHandle handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto iter = meshes_.find(handle.id);
  if (iter == meshes_.end()) {
    return nullptr;
  }
  return iter->second;
}

std::shared_ptr<const Material> MemoryResourcePool::GetMaterial(MaterialHandle handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto iter = materials_.find(handle.id);
  if (iter == materials_.end()) {
    return nullptr;
  }
  return iter->second;
}

size_t MemoryResourcePool::NumMeshes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return meshes_.size();
}

size_t MemoryResourcePool::NumMaterials() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return materials_.size();
}

void MemoryResourcePool::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  meshes_.clear();
  materials_.clear();
}

}  // namespace VecArrows
