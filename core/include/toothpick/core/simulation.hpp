#pragma once

#include <cstdint>

#include "toothpick/core/growth_state.hpp"
#include "toothpick/core/result.hpp"
#include "toothpick/core/settings.hpp"

namespace toothpick::core {

// Driver that owns the current GrowthState and enforces max_generations.
class Simulation {
 public:
  explicit Simulation(const SimulationSettings& settings);

  // Manual step. Fails once the generation bound has been reached.
  OpResult<StepStats> RequestStep();

  // Per-frame update. Steps automatically every generation_delay frames; returns true when it stepped.
  bool Tick();

  void Reset();

  [[nodiscard]] bool at_generation_limit() const;
  [[nodiscard]] const GrowthState& state() const { return state_; }
  [[nodiscard]] const SimulationSettings& settings() const { return settings_; }
  [[nodiscard]] const StepStats& last_step_stats() const { return last_step_stats_; }
  [[nodiscard]] std::uint64_t frame_counter() const { return frame_counter_; }

 private:
  void apply_step();

  SimulationSettings settings_{};
  GrowthState state_;
  StepStats last_step_stats_{};
  std::uint64_t frame_counter_ = 0;
};

}  // namespace toothpick::core
