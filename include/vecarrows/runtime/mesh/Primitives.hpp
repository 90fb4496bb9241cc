#pragma once

#include <vecarrows/runtime/mesh/MeshData.hpp>

namespace VecArrows {
namespace Primitives {

// Shapes are centered on the origin with their axis along +Y.
MeshData Build(const MeshShape& shape);

MeshData BuildCylinder(Scalar radius, Scalar height, uint segments);

// Base disk at -height/2, apex at +height/2.
MeshData BuildCone(Scalar radius, Scalar height, uint segments);

MeshData BuildCuboid(const Vector3& half_extents);

}  // namespace Primitives
}  // namespace VecArrows
