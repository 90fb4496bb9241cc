#pragma once

#include <vecarrows/core/Scalar.hpp>

namespace VecArrows {
namespace Helper {

// Builds a rotation from euler angles in degrees, applied in Y, Z, X order.
Quat RotateWithDegree(const Vector3& rotation);

// Normalizes v into out. Fails for zero-length, infinite or NaN input.
bool TryNormalize(const Vector3& v, Vector3& out);

Vector3 AnyOrthonormalVector(const Vector3& v);

// Shortest-arc rotation taking unit vector from onto unit vector to.
Quat FromRotationArc(const Vector3& from, const Vector3& to);

void SeedRandom(uint seed);

Scalar Random(Scalar min = 0, Scalar max = 1);

// Uniformly distributed orientation.
Quat RandomRotation();

}  // namespace Helper
}  // namespace VecArrows
