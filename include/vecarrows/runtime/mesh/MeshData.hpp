#pragma once

#include <string>
#include <vector>

#include <vecarrows/core/Scalar.hpp>

namespace VecArrows {

enum class MeshShapeType { CYLINDER, CONE, CUBOID };

// Procedural shape request handed to a resource pool.
struct MeshShape {
  MeshShapeType type = MeshShapeType::CUBOID;
  Scalar radius = 0.5f;
  Scalar height = 1.0f;
  Vector3 half_extents = Vector3(0.5f);
  uint segments = 32;

  static MeshShape Cylinder(Scalar radius, Scalar height, uint segments = 32);

  static MeshShape Cone(Scalar radius, Scalar height, uint segments = 32);

  static MeshShape Cuboid(Scalar x_length, Scalar y_length, Scalar z_length);
};

std::string ToString(MeshShapeType type);

struct MeshData {
  std::vector<Vector3> positions;
  std::vector<Vector3> normals;
  std::vector<uint> indices;

  size_t NumTriangles() const { return indices.size() / 3; }
};
}  // namespace VecArrows
