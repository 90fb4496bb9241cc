#pragma once

#include <string>

#include <vecarrows/core/Common.hpp>

namespace VecArrows {
class EngineConfigParser {
 public:
  EngineConfigParser();

  bool LoadFromJson(const std::string& path);

  void Apply();

  const EngineConfig& config() const;

 private:
  EngineConfig config_;
};
}  // namespace VecArrows
