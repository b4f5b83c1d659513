#include "minitest.hpp"
#include "ui/Screen.hpp"
#include <string>
#include <vector>

using svcdash::ui::Screen;

static bool contains(const std::string& hay, const std::string& needle) {
  return hay.find(needle) != std::string::npos;
}

TEST(screen_first_paint_writes_every_row) {
  Screen sc;
  std::string out = sc.paint({"aaa", "bbb", "ccc"});
  ASSERT_TRUE(out.rfind("\x1B[?2026h", 0) == 0);
  ASSERT_TRUE(contains(out, "\x1B[?2026l"));
  ASSERT_TRUE(contains(out, "\x1B[1;1H\x1B[Kaaa"));
  ASSERT_TRUE(contains(out, "\x1B[2;1H\x1B[Kbbb"));
  ASSERT_TRUE(contains(out, "\x1B[3;1H\x1B[Kccc"));
}

TEST(screen_repaint_same_frame_is_empty) {
  Screen sc;
  std::vector<std::string> frame{"header", "row one", "row two", "footer"};
  ASSERT_FALSE(sc.paint(frame).empty());
  ASSERT_TRUE(sc.paint(frame).empty());
  ASSERT_TRUE(sc.paint(frame).empty());
}

TEST(screen_only_changed_rows) {
  Screen sc;
  (void)sc.paint({"a", "b", "c"});
  std::string out = sc.paint({"a", "B", "c"});
  ASSERT_TRUE(contains(out, "\x1B[2;1H\x1B[KB"));
  ASSERT_FALSE(contains(out, "\x1B[1;1H"));
  ASSERT_FALSE(contains(out, "\x1B[3;1H"));
}

TEST(screen_clears_rows_that_disappear) {
  Screen sc;
  (void)sc.paint({"a", "b", "c"});
  std::string out = sc.paint({"a"});
  ASSERT_TRUE(contains(out, "\x1B[2;1H\x1B[K"));
  ASSERT_TRUE(contains(out, "\x1B[3;1H\x1B[K"));
  ASSERT_FALSE(contains(out, "\x1B[1;1H"));
  ASSERT_EQ(sc.previous().size(), 1u);
}

TEST(screen_invalidate_forces_full_repaint) {
  Screen sc;
  std::vector<std::string> frame{"x", "y"};
  (void)sc.paint(frame);
  sc.invalidate();
  std::string out = sc.paint(frame);
  ASSERT_TRUE(contains(out, "\x1B[2J"));
  ASSERT_TRUE(contains(out, "\x1B[1;1H\x1B[Kx"));
  ASSERT_TRUE(contains(out, "\x1B[2;1H\x1B[Ky"));
  ASSERT_TRUE(sc.paint(frame).empty());
}
