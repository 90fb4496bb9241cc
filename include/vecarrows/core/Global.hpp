#pragma once

#include <vecarrows/core/Common.hpp>

namespace VecArrows {
class GameInstance;

namespace Global {
inline GameInstance* game = nullptr;

inline EngineConfig engine_config;
}  // namespace Global
}  // namespace VecArrows
