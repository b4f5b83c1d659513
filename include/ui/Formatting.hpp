#pragma once

#include <string>

namespace svcdash::ui {

// UTF-8 text width utilities. CSI styling sequences are zero-width,
// wide code points (CJK etc.) are two columns.
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Make text safe for a single screen row: line breaks collapse to one
// space (dropped at the end), tabs expand to 8-column stops, other control
// bytes and unterminated escapes are dropped. Complete CSI sequences stay.
std::string sanitize_text(const std::string& raw);

// Text fitting: every result is exactly w display columns.
std::string trunc_pad(const std::string& s, int w);
std::string lr_align(int iw, const std::string& left, const std::string& right);

// Remove the last UTF-8 code point (for Backspace in text fields).
void pop_codepoint(std::string& s);

// Trim ASCII whitespace from both ends.
std::string trim(const std::string& s);

} // namespace svcdash::ui
