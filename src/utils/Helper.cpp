#include <vecarrows/utils/Helper.hpp>

#include <cmath>
#include <cstdlib>
#include <limits>

#include <glm/gtc/constants.hpp>

namespace VecArrows {
namespace Helper {

Quat RotateWithDegree(const Vector3& rotation) {
  Quat result = Quat(1.0f, 0.0f, 0.0f, 0.0f);
  result = result * glm::angleAxis(glm::radians(rotation.y), Vector3(0, 1, 0));
  result = result * glm::angleAxis(glm::radians(rotation.z), Vector3(0, 0, 1));
  result = result * glm::angleAxis(glm::radians(rotation.x), Vector3(1, 0, 0));

  return result;
}

bool TryNormalize(const Vector3& v, Vector3& out) {
  Scalar rcp = 1.0f / glm::length(v);
  if (!std::isfinite(rcp) || !(rcp > 0.0f)) {
    return false;
  }
  out = v * rcp;
  return true;
}

Vector3 AnyOrthonormalVector(const Vector3& v) {
  // Duff et al., "Building an Orthonormal Basis, Revisited"
  Scalar sign = std::copysign(1.0f, v.z);
  Scalar a = -1.0f / (sign + v.z);
  Scalar b = v.x * v.y * a;
  return Vector3(b, sign + v.y * v.y * a, -v.y);
}

Quat FromRotationArc(const Vector3& from, const Vector3& to) {
  const Scalar one_minus_eps = 1.0f - 2.0f * std::numeric_limits<Scalar>::epsilon();
  Scalar dot = glm::dot(from, to);
  if (dot > one_minus_eps) {
    return Quat(1.0f, 0.0f, 0.0f, 0.0f);
  }
  if (dot < -one_minus_eps) {
    // antiparallel, any perpendicular axis works
    return glm::angleAxis(glm::pi<Scalar>(), AnyOrthonormalVector(from));
  }
  Vector3 c = glm::cross(from, to);
  return glm::normalize(Quat(1.0f + dot, c.x, c.y, c.z));
}

void SeedRandom(uint seed) {
  srand(seed);
}

Scalar Random(Scalar min, Scalar max) {
  Scalar zero_to_one = static_cast<Scalar>(rand()) / RAND_MAX;
  return min + zero_to_one * (max - min);
}

Quat RandomRotation() {
  // Shoemake, "Uniform random rotations"
  const Scalar tau = glm::two_pi<Scalar>();
  Scalar u = Random();
  Scalar v = Random();
  Scalar w = Random();
  Scalar sqrt_u = std::sqrt(u);
  Scalar sqrt_neg_u = std::sqrt(1.0f - u);

  return glm::normalize(Quat(sqrt_u * std::cos(tau * w), sqrt_neg_u * std::sin(tau * v),
                             sqrt_neg_u * std::cos(tau * v), sqrt_u * std::sin(tau * w)));
}

}  // namespace Helper
}  // namespace VecArrows
