#include <algorithm>
#include <cstddef>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "imgui.h"
#include "raylib.h"
#include "rlImGui.h"
#include "toothpick/core/growth_state.hpp"
#include "toothpick/core/settings.hpp"
#include "toothpick/core/simulation.hpp"
#include "toothpick/core/view_fit.hpp"

namespace {

using toothpick::core::Simulation;
using toothpick::core::SimulationSettings;

constexpr float kLineThicknessPx = 2.0f;
constexpr float kTopbarHeight = 58.0f;
constexpr std::size_t kMaxLogLines = 12;
constexpr const char* kViewerSettingsFile = "viewer_state.ini";

struct ViewerUiState {
  bool paused = false;
  bool show_workspace = true;
  bool show_endpoints = false;
  float workspace_width = 360.0f;
  bool validation_ran = false;
  toothpick::core::ValidationResult last_validation{};
  std::vector<std::string> logs;
};

struct ViewerPersistentSettings {
  bool loaded = false;
  int window_width = 1280;
  int window_height = 720;
  bool show_workspace = true;
  float workspace_width = 360.0f;
};

ViewerPersistentSettings LoadViewerPersistentSettings() {
  ViewerPersistentSettings settings{};
  std::ifstream ifs(kViewerSettingsFile);
  if (!ifs.is_open()) {
    return settings;
  }
  settings.loaded = true;

  std::string line;
  while (std::getline(ifs, line)) {
    const std::size_t eq = line.find('=');
    if (line.empty() || eq == std::string::npos || eq == 0 || eq + 1 >= line.size()) {
      continue;
    }
    const std::string key = line.substr(0, eq);
    const std::string value = line.substr(eq + 1);
    try {
      if (key == "window_width") {
        settings.window_width = std::max(640, std::stoi(value));
      } else if (key == "window_height") {
        settings.window_height = std::max(480, std::stoi(value));
      } else if (key == "show_workspace") {
        bool parsed = settings.show_workspace;
        if (toothpick::core::parse_bool(value, &parsed)) {
          settings.show_workspace = parsed;
        }
      } else if (key == "workspace_width") {
        settings.workspace_width = std::clamp(std::stof(value), 260.0f, 700.0f);
      }
    } catch (const std::exception&) {
      // Malformed line keeps the default.
    }
  }
  return settings;
}

void SaveViewerPersistentSettings(const ViewerPersistentSettings& settings) {
  std::ofstream ofs(kViewerSettingsFile, std::ios::trunc);
  if (!ofs.is_open()) {
    return;
  }
  ofs << "window_width=" << settings.window_width << "\n";
  ofs << "window_height=" << settings.window_height << "\n";
  ofs << "show_workspace=" << (settings.show_workspace ? 1 : 0) << "\n";
  ofs << "workspace_width=" << settings.workspace_width << "\n";
}

void PushLog(ViewerUiState& ui_state, const std::string& line) {
  ui_state.logs.push_back(line);
  if (ui_state.logs.size() > kMaxLogLines) {
    ui_state.logs.erase(ui_state.logs.begin());
  }
}

std::string StepSummary(const Simulation& sim) {
  const auto& stats = sim.last_step_stats();
  return "[step] gen " + std::to_string(sim.state().generation()) + " +" + std::to_string(stats.spawned) +
         " (total " + std::to_string(sim.state().segment_count()) + ")";
}

void DoManualStep(Simulation& sim, ViewerUiState& ui_state) {
  const auto result = sim.RequestStep();
  if (!result.ok) {
    PushLog(ui_state, "[warn] " + result.error);
    return;
  }
  PushLog(ui_state, StepSummary(sim));
}

void DoReset(Simulation& sim, ViewerUiState& ui_state) {
  sim.Reset();
  ui_state.validation_ran = false;
  PushLog(ui_state, "[info] reset to seed");
}

const char* SeverityLabel(toothpick::core::ValidationSeverity severity) {
  switch (severity) {
  case toothpick::core::ValidationSeverity::kError:
    return "Error";
  case toothpick::core::ValidationSeverity::kWarning:
    return "Warning";
  default:
    return "Unknown";
  }
}

Vector2 ToRaylib(const toothpick::core::Vec2d& p) {
  return {static_cast<float>(p.x), static_cast<float>(p.y)};
}

Camera2D BuildCamera(const Simulation& sim, toothpick::core::ViewSmoother& smoother) {
  const float screen_w = static_cast<float>(GetScreenWidth());
  const float screen_h = static_cast<float>(GetScreenHeight());
  Camera2D camera{};
  camera.offset = {screen_w * 0.5f, screen_h * 0.5f};
  camera.rotation = 0.0f;
  if (!sim.settings().auto_zoom_enabled) {
    camera.target = {0.0f, 0.0f};
    camera.zoom = 1.0f;
    return camera;
  }
  const auto target = toothpick::core::compute_view_fit(toothpick::core::bounds(sim.state()), screen_w, screen_h,
                                                        sim.settings().zoom_padding);
  const auto& current = smoother.Update(target);
  camera.target = ToRaylib(current.center);
  camera.zoom = static_cast<float>(current.scale);
  return camera;
}

void DrawSegments(const Simulation& sim, const Camera2D& camera, const ViewerUiState& ui_state) {
  const float thickness = kLineThicknessPx / std::max(camera.zoom, 1e-6f);
  const auto& state = sim.state();
  for (const auto& segment : state.segments()) {
    const auto [negative, positive] = segment.endpoints();
    DrawLineEx(ToRaylib(negative), ToRaylib(positive), thickness, RAYWHITE);
  }
  if (!ui_state.show_endpoints) {
    return;
  }
  const float radius = 3.0f / std::max(camera.zoom, 1e-6f);
  for (const auto& used : state.used_endpoints()) {
    DrawCircleV(ToRaylib(used), radius, Color{230, 120, 60, 255});
  }
}

void HandleKeyboard(Simulation& sim, ViewerUiState& ui_state, bool* out_quit) {
  if (ImGui::GetIO().WantCaptureKeyboard) {
    return;
  }
  if (IsKeyPressed(KEY_SPACE)) {
    DoManualStep(sim, ui_state);
  }
  if (IsKeyPressed(KEY_R)) {
    DoReset(sim, ui_state);
  }
  if (IsKeyPressed(KEY_P)) {
    ui_state.paused = !ui_state.paused;
    PushLog(ui_state, ui_state.paused ? "[info] auto-advance paused" : "[info] auto-advance resumed");
  }
  if (IsKeyPressed(KEY_ESCAPE)) {
    *out_quit = true;
  }
}

void DrawTopbarWindow(const Simulation& sim, ViewerUiState& ui_state) {
  const float w = static_cast<float>(GetScreenWidth());
  ImGui::SetNextWindowPos(ImVec2(8.0f, 8.0f), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(std::max(320.0f, w - 16.0f), kTopbarHeight), ImGuiCond_Always);
  const ImGuiWindowFlags flags =
      ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize |
      ImGuiWindowFlags_NoTitleBar;
  if (!ImGui::Begin("Topbar", nullptr, flags)) {
    ImGui::End();
    return;
  }
  ImGui::Text("Generation: %llu | Toothpicks: %llu", static_cast<unsigned long long>(sim.state().generation()),
              static_cast<unsigned long long>(sim.state().segment_count()));
  ImGui::SameLine();
  ImGui::Text("|  Limit: %llu%s", static_cast<unsigned long long>(sim.settings().max_generations),
              sim.at_generation_limit() ? " (reached)" : "");
  ImGui::SameLine();
  ImGui::SetCursorPosX(std::max(ImGui::GetCursorPosX(), ImGui::GetWindowWidth() - 160.0f));
  ImGui::Checkbox("Show Workspace", &ui_state.show_workspace);
  ImGui::TextDisabled("Space: step  R: reset  P: pause  Esc: quit");
  ImGui::End();
}

void DrawControlsContent(Simulation& sim, ViewerUiState& ui_state) {
  ImGui::Text("Length: %.3f", sim.settings().toothpick_length);
  ImGui::Text("Auto-advance: every %llu frames", static_cast<unsigned long long>(sim.settings().generation_delay));
  ImGui::Text("Auto zoom: %s", sim.settings().auto_zoom_enabled ? "on" : "off");
  ImGui::Separator();
  if (ImGui::Button("Step")) {
    DoManualStep(sim, ui_state);
  }
  ImGui::SameLine();
  if (ImGui::Button("Reset")) {
    DoReset(sim, ui_state);
  }
  ImGui::SameLine();
  ImGui::Checkbox("Paused", &ui_state.paused);
  ImGui::Checkbox("Show used endpoints", &ui_state.show_endpoints);

  const auto b = toothpick::core::bounds(sim.state());
  ImGui::Separator();
  ImGui::Text("Bounds x: [%.2f, %.2f]", b.min_x, b.max_x);
  ImGui::Text("Bounds y: [%.2f, %.2f]", b.min_y, b.max_y);
  ImGui::Text("Used endpoints: %d", static_cast<int>(sim.state().used_endpoints().size()));
}

void DrawDiagnosticsContent(const Simulation& sim, ViewerUiState& ui_state) {
  const auto& stats = sim.last_step_stats();
  ImGui::Text("Last step");
  ImGui::BulletText("scanned: %d", static_cast<int>(stats.endpoints_scanned));
  ImGui::BulletText("skipped used: %d", static_cast<int>(stats.skipped_used));
  ImGui::BulletText("skipped junction: %d", static_cast<int>(stats.skipped_junction));
  ImGui::BulletText("duplicates: %d", static_cast<int>(stats.duplicates_suppressed));
  ImGui::BulletText("spawned: %d", static_cast<int>(stats.spawned));
  ImGui::Separator();
  if (ImGui::Button("Validate")) {
    ui_state.last_validation = sim.state().Validate();
    ui_state.validation_ran = true;
    PushLog(ui_state, ui_state.last_validation.ok() ? "[info] validation ok" : "[error] validation failed");
  }
  if (!ui_state.validation_ran) {
    return;
  }
  if (ui_state.last_validation.issues.empty()) {
    ImGui::TextUnformatted("No issues");
    return;
  }
  for (const auto& issue : ui_state.last_validation.issues) {
    if (issue.segment_index == toothpick::core::kNoSegmentIndex) {
      ImGui::BulletText("%s %s: %s", SeverityLabel(issue.severity), issue.code.c_str(), issue.message.c_str());
    } else {
      ImGui::BulletText("%s %s: %s (#%d)", SeverityLabel(issue.severity), issue.code.c_str(), issue.message.c_str(),
                        static_cast<int>(issue.segment_index));
    }
  }
}

void DrawLogContent(const ViewerUiState& ui_state) {
  for (const std::string& line : ui_state.logs) {
    ImGui::TextUnformatted(line.c_str());
  }
}

void DrawWorkspaceWindow(Simulation& sim, ViewerUiState& ui_state) {
  if (!ui_state.show_workspace) {
    return;
  }
  const float screen_w = static_cast<float>(GetScreenWidth());
  const float screen_h = static_cast<float>(GetScreenHeight());
  const float margin = 8.0f;
  const float y = kTopbarHeight + margin * 2.0f;
  const float x = std::max(margin, screen_w - ui_state.workspace_width - margin);
  const float h = std::max(200.0f, screen_h - y - margin);

  ImGui::SetNextWindowPos(ImVec2(x, y), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(ui_state.workspace_width, h), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSizeConstraints(ImVec2(260.0f, 200.0f), ImVec2(700.0f, h));
  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoMove;
  if (!ImGui::Begin("Workspace", nullptr, flags)) {
    ImGui::End();
    return;
  }
  ui_state.workspace_width = ImGui::GetWindowSize().x;
  if (ImGui::BeginTabBar("WorkspaceTabs")) {
    if (ImGui::BeginTabItem("Controls")) {
      DrawControlsContent(sim, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Diagnostics")) {
      DrawDiagnosticsContent(sim, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Log")) {
      DrawLogContent(ui_state);
      ImGui::EndTabItem();
    }
    ImGui::EndTabBar();
  }
  ImGui::End();
}

}  // namespace

int main(int argc, char** argv) {
  const std::string settings_path = (argc > 1) ? argv[1] : toothpick::core::kDefaultSettingsFile;
  const auto loaded = toothpick::core::LoadSimulationSettings(settings_path);
  if (!loaded.ok) {
    std::cerr << "toothpick_viewer: " << loaded.error << "\n";
    return 1;
  }
  const SimulationSettings& settings = loaded.value;

  const ViewerPersistentSettings persisted = LoadViewerPersistentSettings();
  const int window_w = persisted.loaded ? persisted.window_width : settings.window_width;
  const int window_h = persisted.loaded ? persisted.window_height : settings.window_height;

  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT | FLAG_VSYNC_HINT);
  InitWindow(window_w, window_h, "toothpick viewer");
  SetExitKey(KEY_NULL);
  SetTargetFPS(60);

  Simulation sim(settings);
  toothpick::core::ViewSmoother smoother(settings.zoom_speed);
  ViewerUiState ui_state;
  ui_state.show_workspace = persisted.show_workspace;
  ui_state.workspace_width = persisted.workspace_width;
  PushLog(ui_state, "[info] viewer started");
  PushLog(ui_state, "[info] settings loaded from " + settings_path);
  PushLog(ui_state, "[hint] Space step, R reset, P pause, Esc quit");

  rlImGuiSetup(true);
  ImGui::StyleColorsDark();
  {
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 3.0f;
    style.FrameRounding = 2.0f;
    style.WindowBorderSize = 1.0f;
  }

  bool quit = false;
  while (!quit && !WindowShouldClose()) {
    BeginDrawing();
    ClearBackground(Color{20, 24, 30, 255});

    rlImGuiBegin();
    HandleKeyboard(sim, ui_state, &quit);
    if (!ui_state.paused && sim.Tick()) {
      PushLog(ui_state, StepSummary(sim));
    }

    const Camera2D camera = BuildCamera(sim, smoother);
    BeginMode2D(camera);
    DrawSegments(sim, camera, ui_state);
    EndMode2D();

    DrawTopbarWindow(sim, ui_state);
    DrawWorkspaceWindow(sim, ui_state);
    rlImGuiEnd();

    EndDrawing();
  }

  rlImGuiShutdown();
  {
    ViewerPersistentSettings out{};
    out.window_width = GetScreenWidth();
    out.window_height = GetScreenHeight();
    out.show_workspace = ui_state.show_workspace;
    out.workspace_width = ui_state.workspace_width;
    SaveViewerPersistentSettings(out);
  }
  CloseWindow();
  return 0;
}
