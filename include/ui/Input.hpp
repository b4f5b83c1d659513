#pragma once

#include <string>
#include <vector>

namespace svcdash::ui {

enum class Key {
  Char, Up, Down, Left, Right, PageUp, PageDown, Home, End,
  Enter, Escape, Backspace, Tab, Interrupt, Unknown
};

struct KeyEvent {
  Key key{Key::Unknown};
  std::string text;  // one UTF-8 code point when key == Char

  [[nodiscard]] bool is_char(char c) const { return key == Key::Char && text.size() == 1 && text[0] == c; }
  bool operator==(const KeyEvent&) const = default;
};

// Turns raw terminal bytes into ordered key events. An incomplete escape
// sequence at the end of a chunk is held until the next feed().
class InputDecoder {
public:
  std::vector<KeyEvent> feed(const char* data, size_t len);
  std::vector<KeyEvent> feed(const std::string& s) { return feed(s.data(), s.size()); }
  // Resolve bytes held past an input pause: a lone ESC becomes Escape,
  // anything else is discarded as Unknown.
  std::vector<KeyEvent> flush();
  [[nodiscard]] bool has_pending() const { return !pending_.empty(); }

private:
  std::string pending_;
};

} // namespace svcdash::ui
