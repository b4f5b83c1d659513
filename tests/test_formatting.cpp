#include "minitest.hpp"
#include "ui/Formatting.hpp"
#include <cwchar>
#include <string>

using namespace svcdash::ui;

static bool wide_locale() { return ::wcwidth(L'中') == 2; }

TEST(width_ascii_and_csi) {
  ASSERT_EQ(display_cols("hello"), 5);
  ASSERT_EQ(display_cols("\x1B[1mhello\x1B[0m"), 5);
  ASSERT_EQ(display_cols("\x1B[38;5;14mab\x1B[0mcd"), 4);
  ASSERT_EQ(display_cols(""), 0);
}

TEST(width_wide_characters) {
  if (!wide_locale()) return;  // needs a UTF-8 ctype
  ASSERT_EQ(display_cols("\xE4\xB8\xAD\xE6\x96\x87"), 4);  // two CJK ideographs
  ASSERT_EQ(display_cols("a\xE4\xB8\xAD"), 3);
}

TEST(take_cols_never_splits_wide_char) {
  if (!wide_locale()) return;
  std::string s = "\xE4\xB8\xAD\xE6\x96\x87";
  ASSERT_EQ(take_cols(s, 3), "\xE4\xB8\xAD");
  ASSERT_EQ(display_cols(take_cols(s, 3)), 2);
}

TEST(trunc_pad_exact_width) {
  for (int w = 1; w <= 12; ++w) {
    ASSERT_EQ(display_cols(trunc_pad("service-name", w)), w);
    ASSERT_EQ(display_cols(trunc_pad("\x1B[32mactive (running)\x1B[0m", w)), w);
    ASSERT_EQ(display_cols(trunc_pad("", w)), w);
  }
  if (wide_locale()) {
    for (int w = 1; w <= 8; ++w) ASSERT_EQ(display_cols(trunc_pad("\xE4\xB8\xAD\xE6\x96\x87\xE5\xAD\x97", w)), w);
  }
}

TEST(trunc_pad_resets_truncated_style) {
  std::string t = trunc_pad("\x1B[31mabcdefghij", 5);
  ASSERT_EQ(display_cols(t), 5);
  ASSERT_TRUE(t.find("\x1B[0m") != std::string::npos);
  // Unstyled text gets no reset appended
  ASSERT_TRUE(trunc_pad("abcdefghij", 5).find('\x1B') == std::string::npos);
}

TEST(lr_align_fills_width) {
  std::string s = lr_align(20, "left", "right");
  ASSERT_EQ(display_cols(s), 20);
  ASSERT_EQ(s.substr(0, 4), "left");
  ASSERT_EQ(s.substr(s.size() - 5), "right");
}

TEST(sanitize_text_single_line) {
  ASSERT_EQ(sanitize_text("Job failed.\nSee status"), "Job failed. See status");
  ASSERT_EQ(sanitize_text("running\r\nPID 1"), "running PID 1");
  ASSERT_EQ(sanitize_text("trailing\r\n"), "trailing");
  ASSERT_EQ(sanitize_text("\nleading"), "leading");
  ASSERT_EQ(sanitize_text("a\x07" "b\x1B" "c\x7F"), "abc");
}

TEST(sanitize_text_tabs_and_csi) {
  ASSERT_EQ(sanitize_text("a\tb"), "a       b");
  ASSERT_EQ(sanitize_text("12345678\tx"), "12345678        x");
  ASSERT_EQ(sanitize_text("\x1B[32mok\tx\x1B[0m"), "\x1B[32mok      x\x1B[0m");
  ASSERT_EQ(sanitize_text("cut\x1B[3"), "cut");
  ASSERT_EQ(sanitize_text("cut\x1B["), "cut");
}

TEST(trunc_pad_scrubs_control_bytes) {
  std::string s = trunc_pad("two\nlines\r\tend", 30);
  ASSERT_EQ(s.find('\n'), std::string::npos);
  ASSERT_EQ(s.find('\r'), std::string::npos);
  ASSERT_EQ(s.find('\t'), std::string::npos);
  ASSERT_EQ(display_cols(s), 30);
  ASSERT_EQ(s.substr(0, 9), "two lines");
}

TEST(pop_codepoint_utf8) {
  std::string s = "ab\xC3\xA9";  // "abé"
  pop_codepoint(s);
  ASSERT_EQ(s, "ab");
  pop_codepoint(s);
  ASSERT_EQ(s, "a");
  std::string empty;
  pop_codepoint(empty);
  ASSERT_TRUE(empty.empty());
}

TEST(trim_whitespace) {
  ASSERT_EQ(trim("  my-app \t"), "my-app");
  ASSERT_EQ(trim("   "), "");
  ASSERT_EQ(trim("x"), "x");
}
