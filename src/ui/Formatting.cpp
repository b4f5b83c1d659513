#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <cwchar>

namespace svcdash::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

// Decode one code point starting at s[i]; returns its byte length (>=1).
static int decode_u8(const std::string& s, size_t i, wchar_t& out) {
  unsigned char c = (unsigned char)s[i];
  int len = u8_len(c);
  if (i + (size_t)len > s.size()) { out = c; return 1; }
  switch (len) {
    case 1: out = c; break;
    case 2: out = ((c & 0x1F) << 6) | (s[i+1] & 0x3F); break;
    case 3: out = ((c & 0x0F) << 12) | ((s[i+1] & 0x3F) << 6) | (s[i+2] & 0x3F); break;
    default: out = ((c & 0x07) << 18) | ((s[i+1] & 0x3F) << 12) | ((s[i+2] & 0x3F) << 6) | (s[i+3] & 0x3F); break;
  }
  return len;
}

static int cp_width(wchar_t wc) {
  int w = ::wcwidth(wc);
  if (w < 0) return 1;  // unknown in this locale: assume narrow
  return w;
}

// Length of a CSI sequence starting at s[i] (ESC '['), or 0 if none.
static size_t csi_len(const std::string& s, size_t i) {
  if (s[i] != '\x1B' || i + 1 >= s.size() || s[i+1] != '[') return 0;
  size_t j = i + 2;
  while (j < s.size() && (s[j] < '@' || s[j] > '~')) j++;
  if (j < s.size()) j++;
  return j - i;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i = 0; i < s.size();) {
    if (size_t n = csi_len(s, i)) { i += n; continue; }
    wchar_t wc;
    i += decode_u8(s, i, wc);
    cols += cp_width(wc);
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    if (size_t n = csi_len(s, i)) {
      out.append(s, i, n);
      i += n;
      continue;
    }
    wchar_t wc;
    int len = decode_u8(s, i, wc);
    int w = cp_width(wc);
    if (seen + w > cols) break;
    out.append(s, i, len);
    i += len;
    seen += w;
  }
  return out;
}

std::string sanitize_text(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  bool in_break = false;
  for (size_t i = 0; i < raw.size(); ++i) {
    unsigned char c = (unsigned char)raw[i];
    if (c == '\n' || c == '\r') {
      if (!in_break && !out.empty()) out.push_back(' ');
      in_break = true;
      continue;
    }
    in_break = false;
    if (c == '\x1B') {
      if (size_t n = csi_len(raw, i); n >= 3 && raw[i + n - 1] >= '@' && raw[i + n - 1] <= '~') {
        out.append(raw, i, n);
        i += n - 1;
      } else if (i + 1 < raw.size() && raw[i + 1] == '[') {
        i = raw.size();  // unterminated CSI runs to the end
      }
      continue;
    }
    if (c == '\t') {
      out.append((size_t)(8 - display_cols(out) % 8), ' ');
      continue;
    }
    if (c < 0x20 || c == 0x7F) continue;
    out.push_back((char)c);
  }
  if (in_break && !out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

static std::string pad_to(std::string s, int w) {
  int cols = display_cols(s);
  if (cols < w) s.append((size_t)(w - cols), ' ');
  return s;
}

std::string trunc_pad(const std::string& raw, int w) {
  if (w <= 0) return "";
  const std::string s = sanitize_text(raw);
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  std::string t = (w <= 1) ? take_cols(s, w) : take_cols(s, w - 1) + (use_unicode() ? "…" : ".");
  if (t.find('\x1B') != std::string::npos) t += "\x1B[0m";
  return pad_to(std::move(t), w);
}

std::string lr_align(int iw, const std::string& left, const std::string& right){
  if (iw <= 0) return std::string();
  std::string r = display_cols(right) > iw ? take_cols(right, iw) : right;
  int rvis = display_cols(r);
  int tlw = iw - rvis - 1;
  if (tlw < 0) tlw = 0;
  std::string l = trunc_pad(left, tlw);
  int lvis = display_cols(l);
  int space = iw - lvis - rvis;
  if (space < 0) space = 0;
  return trunc_pad(l + std::string(space, ' ') + r, iw);
}

void pop_codepoint(std::string& s) {
  if (s.empty()) return;
  size_t i = s.size() - 1;
  while (i > 0 && ((unsigned char)s[i] & 0xC0) == 0x80) --i;
  s.erase(i);
}

std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\n' || s[b] == '\r')) ++b;
  while (e > b && (s[e-1] == ' ' || s[e-1] == '\t' || s[e-1] == '\n' || s[e-1] == '\r')) --e;
  return s.substr(b, e - b);
}

} // namespace svcdash::ui
