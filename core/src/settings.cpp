#include "toothpick/core/settings.hpp"

#include <cmath>
#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string>

namespace toothpick::core {

namespace {

std::string trim_copy(const std::string& value) {
  const std::size_t begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const std::size_t end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

bool parse_double(const std::string& value, double* out_value) {
  try {
    std::size_t consumed = 0;
    const double parsed = std::stod(value, &consumed);
    if (consumed != value.size()) {
      return false;
    }
    *out_value = parsed;
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

bool parse_uint(const std::string& value, std::uint64_t* out_value) {
  if (value.empty() || value.front() == '-' || value.front() == '+') {
    return false;
  }
  try {
    std::size_t consumed = 0;
    const unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      return false;
    }
    *out_value = static_cast<std::uint64_t>(parsed);
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

bool parse_int(const std::string& value, int* out_value) {
  try {
    std::size_t consumed = 0;
    const int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      return false;
    }
    *out_value = parsed;
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

std::string line_error(std::size_t line_no, const std::string& message) {
  return "line " + std::to_string(line_no) + ": " + message;
}

}  // namespace

bool parse_bool(std::string_view value, bool* out_value) {
  if (value == "1" || value == "true" || value == "True") {
    *out_value = true;
    return true;
  }
  if (value == "0" || value == "false" || value == "False") {
    *out_value = false;
    return true;
  }
  return false;
}

OpResult<SimulationSettings> ParseSimulationSettings(std::istream& input) {
  SimulationSettings settings{};
  bool has_length = false;

  std::string raw;
  std::size_t line_no = 0;
  while (std::getline(input, raw)) {
    ++line_no;
    const std::string line = trim_copy(raw);
    if (line.empty() || line.front() == '#' || line.front() == ';') {
      continue;
    }
    const std::size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
      return make_error<SimulationSettings>(line_error(line_no, "expected key=value, got '" + line + "'"));
    }
    const std::string key = trim_copy(line.substr(0, eq));
    const std::string value = trim_copy(line.substr(eq + 1));

    if (key == "toothpick_length") {
      double length = 0.0;
      if (!parse_double(value, &length)) {
        return make_error<SimulationSettings>(line_error(line_no, "toothpick_length is not a number: '" + value + "'"));
      }
      if (!std::isfinite(length) || length <= 0.0) {
        return make_error<SimulationSettings>(line_error(line_no, "toothpick_length must be positive and finite"));
      }
      settings.toothpick_length = length;
      has_length = true;
    } else if (key == "max_generations") {
      if (!parse_uint(value, &settings.max_generations)) {
        return make_error<SimulationSettings>(
            line_error(line_no, "max_generations must be a non-negative integer: '" + value + "'"));
      }
    } else if (key == "generation_delay") {
      if (!parse_uint(value, &settings.generation_delay)) {
        return make_error<SimulationSettings>(
            line_error(line_no, "generation_delay must be a non-negative integer: '" + value + "'"));
      }
    } else if (key == "auto_zoom_enabled") {
      if (!parse_bool(value, &settings.auto_zoom_enabled)) {
        return make_error<SimulationSettings>(line_error(line_no, "auto_zoom_enabled must be a bool: '" + value + "'"));
      }
    } else if (key == "zoom_padding") {
      if (!parse_double(value, &settings.zoom_padding) || !std::isfinite(settings.zoom_padding) ||
          settings.zoom_padding < 0.0) {
        return make_error<SimulationSettings>(line_error(line_no, "zoom_padding must be a non-negative number"));
      }
    } else if (key == "zoom_speed") {
      if (!parse_double(value, &settings.zoom_speed) || !(settings.zoom_speed > 0.0) ||
          settings.zoom_speed > 1.0) {
        return make_error<SimulationSettings>(line_error(line_no, "zoom_speed must be in (0, 1]"));
      }
    } else if (key == "window_width") {
      if (!parse_int(value, &settings.window_width) || settings.window_width < 640) {
        return make_error<SimulationSettings>(line_error(line_no, "window_width must be an integer >= 640"));
      }
    } else if (key == "window_height") {
      if (!parse_int(value, &settings.window_height) || settings.window_height < 480) {
        return make_error<SimulationSettings>(line_error(line_no, "window_height must be an integer >= 480"));
      }
    }
  }

  if (!has_length) {
    return make_error<SimulationSettings>("missing required key toothpick_length");
  }
  return make_ok(settings);
}

OpResult<SimulationSettings> LoadSimulationSettings(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    return make_error<SimulationSettings>("cannot open settings file: " + path);
  }
  OpResult<SimulationSettings> result = ParseSimulationSettings(ifs);
  if (!result.ok) {
    result.error = path + ": " + result.error;
  }
  return result;
}

}  // namespace toothpick::core
