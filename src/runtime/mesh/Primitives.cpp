#include <vecarrows/runtime/mesh/Primitives.hpp>

#include <algorithm>
#include <cmath>

#include <glm/gtc/constants.hpp>

#include <vecarrows/utils/Logger.hpp>

namespace VecArrows {

namespace Primitives {

namespace {
// Disk at height y facing normal_y (+1 or -1), appended to data.
void AppendCap(MeshData& data, Scalar radius, Scalar y, Scalar normal_y, uint segments) {
  const Vector3 normal(0.0f, normal_y, 0.0f);
  const uint center = static_cast<uint>(data.positions.size());
  data.positions.push_back(Vector3(0.0f, y, 0.0f));
  data.normals.push_back(normal);

  const Scalar step = glm::two_pi<Scalar>() / static_cast<Scalar>(segments);
  for (uint i = 0; i < segments; i++) {
    Scalar angle = step * static_cast<Scalar>(i);
    data.positions.push_back(Vector3(radius * std::cos(angle), y, radius * std::sin(angle)));
    data.normals.push_back(normal);
  }

  for (uint i = 0; i < segments; i++) {
    uint a = center + 1 + i;
    uint b = center + 1 + (i + 1) % segments;
    if (normal_y > 0.0f) {
      data.indices.insert(data.indices.end(), {center, b, a});
    } else {
      data.indices.insert(data.indices.end(), {center, a, b});
    }
  }
}
}  // namespace

MeshData Build(const MeshShape& shape) {
  switch (shape.type) {
    case MeshShapeType::CYLINDER:
      return BuildCylinder(shape.radius, shape.height, shape.segments);
    case MeshShapeType::CONE:
      return BuildCone(shape.radius, shape.height, shape.segments);
    case MeshShapeType::CUBOID:
      return BuildCuboid(shape.half_extents);
  }
  LOG_ERROR("Unsupported mesh shape {}", static_cast<int>(shape.type));
  return MeshData();
}

MeshData BuildCylinder(Scalar radius, Scalar height, uint segments) {
  segments = std::max(segments, 3u);
  MeshData data;
  const Scalar half_height = height * 0.5f;
  const Scalar step = glm::two_pi<Scalar>() / static_cast<Scalar>(segments);

  // side, one bottom/top vertex pair per segment
  for (uint i = 0; i < segments; i++) {
    Scalar angle = step * static_cast<Scalar>(i);
    Scalar c = std::cos(angle);
    Scalar s = std::sin(angle);
    data.positions.push_back(Vector3(radius * c, -half_height, radius * s));
    data.positions.push_back(Vector3(radius * c, half_height, radius * s));
    data.normals.push_back(Vector3(c, 0.0f, s));
    data.normals.push_back(Vector3(c, 0.0f, s));
  }
  for (uint i = 0; i < segments; i++) {
    uint b0 = 2 * i;
    uint t0 = b0 + 1;
    uint b1 = 2 * ((i + 1) % segments);
    uint t1 = b1 + 1;
    data.indices.insert(data.indices.end(), {b0, t0, b1, b1, t0, t1});
  }

  AppendCap(data, radius, half_height, 1.0f, segments);
  AppendCap(data, radius, -half_height, -1.0f, segments);
  return data;
}

MeshData BuildCone(Scalar radius, Scalar height, uint segments) {
  segments = std::max(segments, 3u);
  MeshData data;
  const Scalar half_height = height * 0.5f;
  const Scalar step = glm::two_pi<Scalar>() / static_cast<Scalar>(segments);

  // slanted side, the apex is duplicated per segment to keep smooth normals
  for (uint i = 0; i < segments; i++) {
    Scalar angle = step * static_cast<Scalar>(i);
    Scalar c = std::cos(angle);
    Scalar s = std::sin(angle);
    Vector3 normal = glm::normalize(Vector3(c * height, radius, s * height));
    data.positions.push_back(Vector3(radius * c, -half_height, radius * s));
    data.positions.push_back(Vector3(0.0f, half_height, 0.0f));
    data.normals.push_back(normal);
    data.normals.push_back(normal);
  }
  for (uint i = 0; i < segments; i++) {
    uint b0 = 2 * i;
    uint apex = b0 + 1;
    uint b1 = 2 * ((i + 1) % segments);
    data.indices.insert(data.indices.end(), {b0, apex, b1});
  }

  AppendCap(data, radius, -half_height, -1.0f, segments);
  return data;
}

MeshData BuildCuboid(const Vector3& half_extents) {
  MeshData data;

  // (normal, u, v) with cross(u, v) == normal
  const Vector3 faces[6][3] = {
      {Vector3(1, 0, 0), Vector3(0, 1, 0), Vector3(0, 0, 1)},
      {Vector3(-1, 0, 0), Vector3(0, 0, 1), Vector3(0, 1, 0)},
      {Vector3(0, 1, 0), Vector3(0, 0, 1), Vector3(1, 0, 0)},
      {Vector3(0, -1, 0), Vector3(1, 0, 0), Vector3(0, 0, 1)},
      {Vector3(0, 0, 1), Vector3(1, 0, 0), Vector3(0, 1, 0)},
      {Vector3(0, 0, -1), Vector3(0, 1, 0), Vector3(1, 0, 0)},
  };

  for (const auto& face : faces) {
    const Vector3 normal = face[0];
    const Vector3 center = normal * half_extents;
    const Vector3 u = face[1] * half_extents;
    const Vector3 v = face[2] * half_extents;
    const uint base = static_cast<uint>(data.positions.size());

    data.positions.push_back(center - u - v);
    data.positions.push_back(center + u - v);
    data.positions.push_back(center + u + v);
    data.positions.push_back(center - u + v);
    for (int i = 0; i < 4; i++) {
      data.normals.push_back(normal);
    }
    data.indices.insert(data.indices.end(),
                        {base, base + 1, base + 2, base, base + 2, base + 3});
  }
  return data;
}

}  // namespace Primitives
}  // namespace VecArrows
