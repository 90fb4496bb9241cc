#include <vecarrows/runtime/mesh/MeshData.hpp>

namespace VecArrows {

MeshShape MeshShape::Cylinder(Scalar radius, Scalar height, uint segments) {
  MeshShape shape;
  shape.type = MeshShapeType::CYLINDER;
  shape.radius = radius;
  shape.height = height;
  shape.segments = segments;
  return shape;
}

MeshShape MeshShape::Cone(Scalar radius, Scalar height, uint segments) {
  MeshShape shape;
  shape.type = MeshShapeType::CONE;
  shape.radius = radius;
  shape.height = height;
  shape.segments = segments;
  return shape;
}

MeshShape MeshShape::Cuboid(Scalar x_length, Scalar y_length, Scalar z_length) {
  MeshShape shape;
  shape.type = MeshShapeType::CUBOID;
  shape.half_extents = Vector3(x_length, y_length, z_length) * 0.5f;
  return shape;
}

std::string ToString(MeshShapeType type) {
  switch (type) {
    case MeshShapeType::CYLINDER:
      return "Cylinder";
    case MeshShapeType::CONE:
      return "Cone";
    case MeshShapeType::CUBOID:
      return "Cuboid";
  }
  return "Unknown";
}

}  // namespace VecArrows
