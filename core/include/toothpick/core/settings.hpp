#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>

#include "toothpick/core/result.hpp"

namespace toothpick::core {

struct SimulationSettings {
  double toothpick_length = 0.0;
  std::uint64_t max_generations = 10;
  // Frames between automatic steps. 0 disables auto-advance.
  std::uint64_t generation_delay = 30;
  bool auto_zoom_enabled = true;
  double zoom_padding = 50.0;
  double zoom_speed = 0.1;
  int window_width = 1280;
  int window_height = 720;
};

constexpr const char* kDefaultSettingsFile = "toothpick.ini";

// Parses key=value lines. toothpick_length is required; unknown keys are ignored.
[[nodiscard]] OpResult<SimulationSettings> ParseSimulationSettings(std::istream& input);
[[nodiscard]] OpResult<SimulationSettings> LoadSimulationSettings(const std::string& path);

[[nodiscard]] bool parse_bool(std::string_view value, bool* out_value);

}  // namespace toothpick::core
