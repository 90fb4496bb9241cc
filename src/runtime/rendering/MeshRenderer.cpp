#include <vecarrows/runtime/rendering/MeshRenderer.hpp>

#include <vecarrows/runtime/scene/Actor.hpp>
#include <vecarrows/utils/Logger.hpp>

namespace VecArrows {
MeshRenderer::MeshRenderer(ResourcePool* pool, MeshHandle mesh, MaterialHandle material)
    : pool_(pool), mesh_(mesh), material_(material) {
  SET_COMPONENT_NAME;
}

bool MeshRenderer::SetColor(const Color& color) {
  if (pool_ == nullptr || released_) {
    return false;
  }
  if (!pool_->UpdateMaterialColor(material_, color)) {
    LOG_WARN("Material #{} of {} is not in the resource pool", material_.id,
             actor ? actor->name : std::string("<detached>"));
    return false;
  }
  return true;
}

MeshHandle MeshRenderer::mesh() const {
  return mesh_;
}

MaterialHandle MeshRenderer::material() const {
  return material_;
}

void MeshRenderer::OnDestroy() {
  if (pool_ == nullptr || released_) {
    return;
  }
  released_ = true;
  if (!pool_->ReleaseMesh(mesh_)) {
    LOG_WARN("Mesh #{} was already released", mesh_.id);
  }
  if (!pool_->ReleaseMaterial(material_)) {
    LOG_WARN("Material #{} was already released", material_.id);
  }
}
}  // namespace VecArrows
