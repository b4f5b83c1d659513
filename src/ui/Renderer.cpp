#include "ui/Renderer.hpp"
#include "ui/Formatting.hpp"
#include "ui/Layout.hpp"
#include <algorithm>

namespace svcdash::ui {

using model::AppState;
using model::LogChannel;
using model::Mode;
using model::Tone;

namespace {

using Hints = std::vector<std::pair<const char*, const char*>>;

std::string blank(int w) { return std::string((size_t)std::max(0, w), ' '); }

// Left-padded content fitted to the full width.
std::string row(const std::string& content, int w) {
  return trunc_pad(std::string(kPadX, ' ') + content, w);
}

std::string styled(const std::string& sgr, const std::string& text, const Theme& t) {
  if (sgr.empty()) return text;
  return sgr + text + t.reset;
}

std::string hint_bar(const Hints& hints, int w, const RenderContext& ctx) {
  const Theme& t = ctx.theme;
  const std::string sep = styled(t.muted, ctx.unicode ? "  ·  " : "  |  ", t);
  std::string out;
  for (size_t i = 0; i < hints.size(); ++i) {
    if (i) out += sep;
    out += styled(t.bold, hints[i].first, t) + " " + styled(t.muted, hints[i].second, t);
  }
  return row(out, w);
}

std::string tone_color(Tone tone, const Theme& t) {
  switch (tone) {
    case Tone::Success: return t.success;
    case Tone::Error:   return t.error;
    case Tone::Info:    return t.info;
  }
  return t.info;
}

// Status row: confirmation prompt, then flash, then the busy spinner.
std::string status_line(const AppState& s, int w, const RenderContext& ctx) {
  const Theme& t = ctx.theme;
  if (s.mode == Mode::ConfirmRemove && s.confirm_target) {
    return row(styled(t.error, "Remove " + *s.confirm_target + "?", t) + "  " +
               styled(t.muted, "y to confirm, any other key cancels", t), w);
  }
  if (s.flash) return row(styled(tone_color(s.flash->tone, t), s.flash->text, t), w);
  if (s.busy) return row(styled(t.info, spinner_glyph(s.spinner_frame, ctx.unicode) + " Working...", t), w);
  return blank(w);
}

// Body rows fill everything above the status and footer rows.
std::vector<std::string> compose(std::vector<std::string> body, std::string status, std::string footer, int w, int h) {
  const int room = std::max(0, h - 2);
  body.resize((size_t)room, blank(w));
  body.push_back(std::move(status));
  body.push_back(std::move(footer));
  if ((int)body.size() > h) body.erase(body.begin(), body.end() - h);
  return body;
}

std::string header(const std::string& left, const std::string& right, int w) {
  const int iw = std::max(0, w - 2 * kPadX);
  return trunc_pad(std::string(kPadX, ' ') + lr_align(iw, left, right), w);
}

std::vector<std::string> render_dashboard(const AppState& s, int w, int h, const RenderContext& ctx) {
  const Theme& t = ctx.theme;
  const auto view = model::filtered_view(s);
  std::vector<std::string> lines;

  std::string count = std::to_string(view.size()) + (view.size() == 1 ? " service" : " services");
  lines.push_back(header(styled(t.bold, ctx.title, t) + "  " + styled(t.muted, ctx.platform, t),
                         styled(t.muted, count, t), w));

  if (s.mode == Mode::Search) {
    lines.push_back(row(styled(t.accent, "/", t) + " " + s.search_query + styled(t.cursor, ctx.unicode ? "▏" : "_", t), w));
  } else if (!s.search_query.empty()) {
    lines.push_back(row(styled(t.muted, "filter: ", t) + s.search_query + styled(t.muted, "  (esc clears)", t), w));
  } else {
    lines.push_back(blank(w));
  }

  const int cw = std::max(0, w - 2 * kPadX);
  const int sw = std::min(34, std::max(12, cw / 3));
  const int ew = 8;
  const int nw = std::max(8, cw - sw - ew - 7);
  const std::string dot = ctx.unicode ? "●" : "*";

  lines.push_back(row("  " + styled(t.muted, dot, t) + " " + styled(t.muted, trunc_pad("NAME", nw), t) + " " +
                      styled(t.muted, trunc_pad("STATUS", sw), t) + " " + styled(t.muted, trunc_pad("BOOT", ew), t), w));

  if (view.empty()) {
    if (!s.search_query.empty()) {
      lines.push_back(row(styled(t.muted, "  No services match '" + s.search_query + "'", t), w));
    } else {
      lines.push_back(row(styled(t.muted, "  No services found. Press ", t) + styled(t.bold, "a", t) +
                          styled(t.muted, " to add one.", t), w));
    }
  } else {
    const int win = dashboard_rows(h);
    const int sel = std::clamp(s.selection, 0, (int)view.size() - 1);
    const auto range = window_range((int)view.size(), sel, win);
    for (int i = range.start; i < range.end; ++i) {
      const auto rec = s.services[view[(size_t)i]].view();
      const bool is_sel = i == sel;
      // Selected rows stay bold across the per-cell resets
      auto cell = [&](const std::string& color, const std::string& text) {
        std::string out = styled(color, text, t);
        if (is_sel && !color.empty()) out += t.bold;
        return out;
      };
      const std::string& state_color = rec.active ? t.success : t.error;
      std::string boot = !rec.enabled ? "-" : (*rec.enabled ? "enabled" : "disabled");
      std::string content = (is_sel ? cell(t.cursor, ctx.unicode ? "❯" : ">") : std::string(" ")) + " " +
                            cell(state_color, dot) + " " +
                            cell(t.accent, trunc_pad(rec.name, nw)) + " " +
                            cell(state_color, trunc_pad(rec.status, sw)) + " " +
                            cell(t.muted, trunc_pad(boot, ew));
      if (is_sel) content = t.bold + content + t.reset;
      lines.push_back(row(content, w));
    }
  }

  Hints hints;
  switch (s.mode) {
    case Mode::Search:
      hints = {{"type", "filter"}, {"↑↓", "move"}, {"enter", "keep"}, {"esc", "clear"}};
      break;
    case Mode::ConfirmRemove:
      hints = {{"y", "remove"}, {"any key", "cancel"}};
      break;
    default:
      hints = {{"↑↓", "move"}, {"/", "search"}, {"s", "start/stop"}, {"r", "restart"}, {"e", "enable"},
               {"l", "logs"}, {"a", "add"}, {"d", "remove"}, {"R", "refresh"}, {"esc", "quit"}};
      break;
  }
  return compose(std::move(lines), status_line(s, w, ctx), hint_bar(hints, w, ctx), w, h);
}

std::vector<std::string> render_add_form(const AppState& s, int w, int h, const RenderContext& ctx) {
  const Theme& t = ctx.theme;
  const model::AddFormState form = s.add_form.value_or(model::AddFormState{});
  std::vector<std::string> lines;
  lines.push_back(row(styled(t.bold, "Add Service", t), w));
  lines.push_back(blank(w));

  const int form_lines = 5;
  const int pad_top = std::max(0, (h - 4 - form_lines) / 2);
  for (int i = 0; i < pad_top; ++i) lines.push_back(blank(w));

  auto field = [&](int idx, const char* label, const std::string& value, const char* placeholder) {
    std::string shown = value.empty() ? styled(t.muted, placeholder, t) : value;
    std::string text = styled(t.muted, label, t) + " " + shown;
    if (form.focus != idx) return row("  " + text, w);
    return row(t.bold + styled(t.cursor, ctx.unicode ? "❯" : ">", t) + t.bold + " " + text + t.reset, w);
  };
  lines.push_back(field(0, "Name    ", form.name, "my-app"));
  lines.push_back(field(1, "Command ", form.command, "/usr/local/bin/myapp --port 3000"));
  lines.push_back(blank(w));
  lines.push_back(row(styled(t.muted, "  CWD      " + ctx.cwd, t), w));
  lines.push_back(blank(w));

  Hints hints = {{"enter", "next/save"}, {"tab", "switch"}, {"esc", "cancel"}};
  return compose(std::move(lines), status_line(s, w, ctx), hint_bar(hints, w, ctx), w, h);
}

std::vector<std::string> render_logs(const AppState& s, int w, int h, const RenderContext& ctx) {
  const Theme& t = ctx.theme;
  std::vector<std::string> lines;
  const std::string service = s.log ? s.log->service : std::string();
  const int viewport = log_rows(h);
  const int total = s.log ? (int)s.log->lines.size() : 0;
  const int scroll = s.log ? model::clamp_scroll(s.log->scroll, total, viewport) : 0;

  std::string left = styled(t.bold, "Logs", t) + "  " + styled(t.accent, service, t);
  if (!ctx.streaming) left += "  " + styled(t.muted, "(stopped)", t);
  std::string right = scroll > 0 ? styled(t.muted, std::to_string(scroll) + " lines back", t) : std::string();
  lines.push_back(header(left, right, w));
  lines.push_back(blank(w));

  if (total == 0) {
    lines.push_back(row(styled(t.muted, "Waiting for output...", t), w));
  } else {
    const int end = total - scroll;
    const int start = std::max(0, end - viewport);
    for (int i = start; i < end; ++i) {
      const auto& ln = s.log->lines[(size_t)i];
      switch (ln.channel) {
        case LogChannel::Primary:    lines.push_back(row(ln.text, w)); break;
        case LogChannel::Diagnostic: lines.push_back(row(styled(t.error, ln.text, t), w)); break;
        case LogChannel::Marker:     lines.push_back(row(styled(t.muted, ln.text, t), w)); break;
      }
    }
  }

  Hints hints = {{"↑↓", "scroll"}, {"pgup/pgdn", "page"}, {"home/end", "oldest/live"}, {"esc", "back"}};
  return compose(std::move(lines), status_line(s, w, ctx), hint_bar(hints, w, ctx), w, h);
}

} // namespace

std::string spinner_glyph(int frame, bool unicode) {
  static const char* kBraille[kSpinnerFrames] = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
  static const char* kAscii[4] = {"|", "/", "-", "\\"};
  if (frame < 0) frame = 0;
  return unicode ? kBraille[frame % kSpinnerFrames] : kAscii[frame % 4];
}

std::vector<std::string> render(const AppState& s, int width, int height, const RenderContext& ctx) {
  const int w = std::max(kMinCols, width);
  const int h = std::max(1, height);
  switch (s.mode) {
    case Mode::AddForm: return render_add_form(s, w, h, ctx);
    case Mode::LogView: return render_logs(s, w, h, ctx);
    default:            return render_dashboard(s, w, h, ctx);
  }
}

} // namespace svcdash::ui
