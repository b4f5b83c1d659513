#pragma once

#include "model/AppState.hpp"
#include "ui/Config.hpp"
#include <string>
#include <vector>

namespace svcdash::ui {

// Everything render() needs besides the state. Kept outside AppState so
// rendering stays a pure function of its arguments.
struct RenderContext {
  Theme theme;
  std::string title{"Service Manager"};
  std::string platform;  // shown beside the title
  std::string cwd;       // shown in the add form
  bool streaming{false}; // log follower still attached
  bool unicode{true};
};

// Full frame for the current mode: exactly `height` lines, each exactly
// `width` display columns.
std::vector<std::string> render(const model::AppState& s, int width, int height, const RenderContext& ctx);

// Spinner glyph for a frame counter.
std::string spinner_glyph(int frame, bool unicode);
inline constexpr int kSpinnerFrames = 10;

} // namespace svcdash::ui
