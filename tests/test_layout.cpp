#include "minitest.hpp"
#include "model/AppState.hpp"
#include "ui/Layout.hpp"

using svcdash::model::clamp_scroll;
using svcdash::ui::window_range;

TEST(window_clamped_at_top) {
  auto r = window_range(100, 5, 10);
  ASSERT_EQ(r.start, 0);
  ASSERT_EQ(r.end, 10);
}

TEST(window_clamped_at_bottom) {
  auto r = window_range(100, 95, 10);
  ASSERT_EQ(r.end, 100);
  ASSERT_EQ(r.start, 90);
}

TEST(window_centred_in_middle) {
  auto r = window_range(100, 50, 10);
  ASSERT_EQ(r.start, 45);
  ASSERT_EQ(r.end, 55);
  ASSERT_TRUE(r.start <= 50 && 50 < r.end);
}

TEST(window_shows_everything_when_it_fits) {
  auto r = window_range(7, 6, 10);
  ASSERT_EQ(r.start, 0);
  ASSERT_EQ(r.end, 7);
  auto e = window_range(0, 0, 10);
  ASSERT_EQ(e.start, 0);
  ASSERT_EQ(e.end, 0);
}

TEST(window_always_contains_selection) {
  for (int total = 1; total <= 40; ++total) {
    for (int win = 1; win <= 12; ++win) {
      for (int sel = 0; sel < total; ++sel) {
        auto r = window_range(total, sel, win);
        ASSERT_TRUE(r.start <= sel && sel < r.end);
        ASSERT_EQ(r.end - r.start, total < win ? total : win);
      }
    }
  }
}

TEST(scroll_clamp_all_combinations) {
  for (int total = 0; total <= 30; ++total) {
    for (int viewport = 1; viewport <= 12; ++viewport) {
      for (int scroll = -5; scroll <= 40; ++scroll) {
        int c = clamp_scroll(scroll, total, viewport);
        int hi = total - viewport > 0 ? total - viewport : 0;
        ASSERT_TRUE(c >= 0 && c <= hi);
        if (scroll >= 0 && scroll <= hi) ASSERT_EQ(c, scroll);
      }
    }
  }
  ASSERT_EQ(clamp_scroll(10, 0, 5), 0);
}

TEST(layout_rows_never_below_one) {
  ASSERT_EQ(svcdash::ui::dashboard_rows(3), 1);
  ASSERT_EQ(svcdash::ui::dashboard_rows(24), 19);
  ASSERT_EQ(svcdash::ui::log_rows(2), 1);
  ASSERT_EQ(svcdash::ui::log_rows(24), 20);
}
