#include "toothpick/core/simulation.hpp"

#include <string>

namespace toothpick::core {

Simulation::Simulation(const SimulationSettings& settings)
    : settings_(settings), state_(initialize(settings.toothpick_length)) {}

bool Simulation::at_generation_limit() const {
  return state_.generation() >= settings_.max_generations;
}

void Simulation::apply_step() {
  StepStats stats{};
  state_ = step(state_, &stats);
  last_step_stats_ = stats;
}

OpResult<StepStats> Simulation::RequestStep() {
  if (at_generation_limit()) {
    return make_error<StepStats>("MaxGenerationsReached: generation " + std::to_string(state_.generation()) +
                                 " of " + std::to_string(settings_.max_generations));
  }
  apply_step();
  return make_ok(last_step_stats_);
}

bool Simulation::Tick() {
  if (settings_.generation_delay == 0 || at_generation_limit()) {
    return false;
  }
  ++frame_counter_;
  if (frame_counter_ < settings_.generation_delay) {
    return false;
  }
  apply_step();
  frame_counter_ = 0;
  return true;
}

void Simulation::Reset() {
  state_ = reset(settings_.toothpick_length);
  last_step_stats_ = {};
  frame_counter_ = 0;
}

}  // namespace toothpick::core
