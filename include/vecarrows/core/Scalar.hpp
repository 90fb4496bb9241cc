#pragma once
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace VecArrows {

using Scalar = float;
using Vector3 = glm::vec3;
using Quat = glm::quat;

using uint = unsigned int;

// linear RGBA
using Color = glm::vec4;

namespace Colors {
const Color WHITE = Color(1.0f, 1.0f, 1.0f, 1.0f);
const Color RED = Color(1.0f, 0.0f, 0.0f, 1.0f);
const Color GREEN = Color(0.0f, 1.0f, 0.0f, 1.0f);
const Color BLUE = Color(0.0f, 0.0f, 1.0f, 1.0f);
const Color YELLOW = Color(1.0f, 1.0f, 0.0f, 1.0f);
}  // namespace Colors

}  // namespace VecArrows
