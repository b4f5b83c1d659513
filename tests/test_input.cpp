#include "minitest.hpp"
#include "ui/Input.hpp"
#include <string>
#include <vector>

using svcdash::ui::InputDecoder;
using svcdash::ui::Key;
using svcdash::ui::KeyEvent;

static std::vector<Key> keys(const std::vector<KeyEvent>& evs) {
  std::vector<Key> out;
  for (const auto& e : evs) out.push_back(e.key);
  return out;
}

TEST(decode_printable_chars) {
  InputDecoder d;
  auto evs = d.feed("jk/");
  ASSERT_EQ(evs.size(), 3u);
  ASSERT_TRUE(evs[0].is_char('j'));
  ASSERT_TRUE(evs[1].is_char('k'));
  ASSERT_TRUE(evs[2].is_char('/'));
}

TEST(decode_lone_escape_chunk) {
  InputDecoder d;
  auto evs = d.feed("\x1B");
  ASSERT_EQ(keys(evs), std::vector<Key>{Key::Escape});
  ASSERT_FALSE(d.has_pending());
}

TEST(decode_navigation_sequences) {
  InputDecoder d;
  auto evs = d.feed("\x1B[A\x1B[B\x1B[C\x1B[D\x1B[5~\x1B[6~\x1B[H\x1B[F\x1B[1~\x1B[4~");
  std::vector<Key> want{Key::Up, Key::Down, Key::Right, Key::Left, Key::PageUp, Key::PageDown,
                        Key::Home, Key::End, Key::Home, Key::End};
  ASSERT_EQ(keys(evs), want);
}

TEST(decode_ss3_and_modified_arrows) {
  InputDecoder d;
  auto evs = d.feed("\x1BOA\x1BOB\x1B[1;5A");
  ASSERT_EQ(keys(evs), (std::vector<Key>{Key::Up, Key::Down, Key::Up}));
}

TEST(decode_control_bytes) {
  InputDecoder d;
  auto evs = d.feed(std::string("\r\x7F\x08\t\x03\n", 6));
  std::vector<Key> want{Key::Enter, Key::Backspace, Key::Backspace, Key::Tab, Key::Interrupt, Key::Enter};
  ASSERT_EQ(keys(evs), want);
}

TEST(decode_crlf_is_one_enter) {
  InputDecoder d;
  ASSERT_EQ(keys(d.feed("\r\n")), std::vector<Key>{Key::Enter});
}

TEST(decode_split_csi_is_held) {
  InputDecoder d;
  auto first = d.feed("x\x1B[");
  ASSERT_EQ(first.size(), 1u);
  ASSERT_TRUE(first[0].is_char('x'));
  ASSERT_TRUE(d.has_pending());
  auto second = d.feed("B");
  ASSERT_EQ(keys(second), std::vector<Key>{Key::Down});
  ASSERT_FALSE(d.has_pending());
}

TEST(decode_split_pageup_three_chunks) {
  InputDecoder d;
  ASSERT_TRUE(d.feed("\x1B[").empty());
  ASSERT_TRUE(d.feed("5").empty());
  ASSERT_EQ(keys(d.feed("~")), std::vector<Key>{Key::PageUp});
}

TEST(decode_split_utf8_char) {
  InputDecoder d;
  ASSERT_TRUE(d.feed("\xC3").empty());
  auto evs = d.feed("\xA9");
  ASSERT_EQ(evs.size(), 1u);
  ASSERT_EQ(evs[0].key, Key::Char);
  ASSERT_EQ(evs[0].text, "\xC3\xA9");
}

TEST(decode_no_partial_leak_into_chars) {
  InputDecoder d;
  std::vector<KeyEvent> all;
  for (const char* chunk : {"\x1B[", "6", "~", "q"}) {
    auto evs = d.feed(std::string(chunk));
    all.insert(all.end(), evs.begin(), evs.end());
  }
  ASSERT_EQ(keys(all), (std::vector<Key>{Key::PageDown, Key::Char}));
  ASSERT_TRUE(all.back().is_char('q'));
}

TEST(decode_unknown_sequence_ignored) {
  InputDecoder d;
  auto evs = d.feed("\x1B[99zq");
  ASSERT_EQ(keys(evs), (std::vector<Key>{Key::Unknown, Key::Char}));
}

TEST(decode_flush_resolves_pending) {
  InputDecoder d;
  ASSERT_TRUE(d.feed("a\x1B").size() == 1);
  ASSERT_TRUE(d.has_pending());
  ASSERT_EQ(keys(d.flush()), std::vector<Key>{Key::Escape});
  ASSERT_TRUE(d.feed("\x1B[1").empty());
  ASSERT_EQ(keys(d.flush()), std::vector<Key>{Key::Unknown});
  ASSERT_FALSE(d.has_pending());
}
