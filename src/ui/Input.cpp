#include "ui/Input.hpp"
#include "ui/Formatting.hpp"

namespace svcdash::ui {

static Key csi_final(char final, const std::string& params) {
  switch (final) {
    case 'A': return Key::Up;
    case 'B': return Key::Down;
    case 'C': return Key::Right;
    case 'D': return Key::Left;
    case 'H': return Key::Home;
    case 'F': return Key::End;
    case '~':
      if (params == "5") return Key::PageUp;
      if (params == "6") return Key::PageDown;
      if (params == "1" || params == "7") return Key::Home;
      if (params == "4" || params == "8") return Key::End;
      return Key::Unknown;
    default:
      return Key::Unknown;
  }
}

std::vector<KeyEvent> InputDecoder::feed(const char* data, size_t len) {
  std::string buf = std::move(pending_);
  pending_.clear();
  buf.append(data, len);
  std::vector<KeyEvent> out;
  const size_t n = buf.size();

  // A chunk holding nothing but ESC is the Escape key itself
  if (n == 1 && buf[0] == '\x1B') {
    out.push_back({Key::Escape, {}});
    return out;
  }

  size_t i = 0;
  while (i < n) {
    unsigned char c = (unsigned char)buf[i];
    if (c == 0x1B) {
      if (i + 1 >= n) { pending_ = buf.substr(i); break; }
      char next = buf[i+1];
      if (next == '[') {
        size_t j = i + 2;
        while (j < n && buf[j] >= 0x30 && buf[j] <= 0x3F) j++;
        size_t pend = j;
        while (j < n && buf[j] >= 0x20 && buf[j] <= 0x2F) j++;
        if (j >= n) { pending_ = buf.substr(i); break; }
        std::string params = buf.substr(i + 2, pend - (i + 2));
        out.push_back({csi_final(buf[j], params), {}});
        i = j + 1;
      } else if (next == 'O') {
        if (i + 2 >= n) { pending_ = buf.substr(i); break; }
        out.push_back({csi_final(buf[i+2], {}), {}});
        i += 3;
      } else if (next == '\x1B') {
        out.push_back({Key::Escape, {}});
        i += 1;
      } else {
        // Alt+key and other two-byte sequences are not bound
        out.push_back({Key::Unknown, {}});
        i += 2;
      }
      continue;
    }
    if (c == 0x03) { out.push_back({Key::Interrupt, {}}); ++i; continue; }
    if (c == '\r' || c == '\n') {
      out.push_back({Key::Enter, {}});
      if (c == '\r' && i + 1 < n && buf[i+1] == '\n') ++i;
      ++i;
      continue;
    }
    if (c == 0x7F || c == 0x08) { out.push_back({Key::Backspace, {}}); ++i; continue; }
    if (c == '\t') { out.push_back({Key::Tab, {}}); ++i; continue; }
    if (c < 0x20) { out.push_back({Key::Unknown, {}}); ++i; continue; }
    int cl = u8_len(c);
    if (i + (size_t)cl > n) { pending_ = buf.substr(i); break; }
    out.push_back({Key::Char, buf.substr(i, (size_t)cl)});
    i += (size_t)cl;
  }
  return out;
}

std::vector<KeyEvent> InputDecoder::flush() {
  std::vector<KeyEvent> out;
  if (pending_ == "\x1B") out.push_back({Key::Escape, {}});
  else if (!pending_.empty()) out.push_back({Key::Unknown, {}});
  pending_.clear();
  return out;
}

} // namespace svcdash::ui
