// D1.1: Layout flex distribution, fixed/percent sizing, tag lookup
// Tests:
//   1. distributeFlex sums to the available space, remainder on the last weight
//   2. Row of fixed + grow children fills the parent exactly
//   3. Percent children size against the inner box
//   4. Padding and gap offset children
//   5. Tag lookup: find, boundsOf, missing tag, duplicate tag keeps the first
//   6. findByPrefix returns chart regions in arena order
//   7. Auto-sized text panels use the measure callback
//   8. Recomputing on the same tree resets the arena

#include "pd/layout/LayoutTree.hpp"
#include "pd/layout/PanelBuilder.hpp"

#include <cstdio>
#include <cstdlib>
#include <numeric>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireEq(int a, int b, const char* msg) {
  if (a != b) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %d, expected %d)\n", msg, a, b);
    std::exit(1);
  }
}

int main() {
  // --- Test 1: distributeFlex ---
  {
    std::vector<int> out = pd::distributeFlex(100, {1.0f, 1.0f, 1.0f});
    requireEq(static_cast<int>(out.size()), 3, "three shares");
    requireEq(out[0], 33, "share 0");
    requireEq(out[1], 33, "share 1");
    requireEq(out[2], 34, "remainder on last");

    out = pd::distributeFlex(101, {1.0f, 0.0f, 2.0f, 0.0f});
    requireEq(out[1], 0, "zero weight gets nothing");
    requireEq(out[3], 0, "trailing zero weight gets nothing");
    requireEq(out[0] + out[2], 101, "sum exact with zero weights");
    requireEq(out[0], 33, "1/3 floored");
    requireEq(out[2], 68, "last positive weight takes remainder");

    // Sum property across many sizes and weight sets
    const std::vector<std::vector<float>> sets = {
        {1}, {1, 1}, {3, 1, 7}, {0.5f, 0.25f, 0.25f}, {1, 2, 3, 4, 5, 6, 7}};
    for (const auto& w : sets) {
      for (int space = 0; space < 500; space += 7) {
        std::vector<int> d = pd::distributeFlex(space, w);
        int sum = std::accumulate(d.begin(), d.end(), 0);
        requireEq(sum, space, "flex shares sum to space");
        for (int v : d) requireTrue(v >= 0, "no negative share");
      }
    }

    out = pd::distributeFlex(50, {0.0f, 0.0f});
    requireEq(out[0] + out[1], 0, "no positive weights: nothing handed out");
    out = pd::distributeFlex(-5, {1.0f});
    requireEq(out[0], 0, "negative space: nothing handed out");

    std::printf("  Test 1 (distributeFlex): PASS\n");
  }

  // --- Test 2: fixed + grow row ---
  {
    auto root = pd::panel().row()
        .child(pd::panel().width(pd::px(100)))
        .child(pd::panel().flexGrow(1))
        .child(pd::panel().flexGrow(2))
        .child(pd::panel().width(pd::px(50)));

    pd::LayoutTree tree;
    tree.compute(root, 400, 200);
    requireEq(static_cast<int>(tree.size()), 5, "root + 4 children");
    const pd::LayoutNode& r = tree.root();
    requireEq(static_cast<int>(r.childCount), 4, "child count");

    const auto& a = tree.node(r.firstChild + 0).bounds;
    const auto& b = tree.node(r.firstChild + 1).bounds;
    const auto& c = tree.node(r.firstChild + 2).bounds;
    const auto& d = tree.node(r.firstChild + 3).bounds;
    requireEq(a.w, 100, "fixed width");
    requireEq(b.w, 83, "grow 1 of 250");
    requireEq(c.w, 167, "grow 2 of 250 takes remainder");
    requireEq(d.w, 50, "fixed tail");
    requireEq(a.w + b.w + c.w + d.w, 400, "row filled exactly");
    requireEq(b.x, 100, "b follows a");
    requireEq(d.x, 350, "d at the end");
    requireEq(a.h, 200, "auto height stretches on cross axis");

    std::printf("  Test 2 (fixed + grow row): PASS\n");
  }

  // --- Test 3: percent sizing ---
  {
    auto root = pd::panel().column().padding(10)
        .child(pd::panel().height(pd::percent(25)).width(pd::percent(50)))
        .child(pd::panel().height(pd::percent(75)));

    pd::LayoutTree tree;
    tree.compute(root, 220, 420);
    const pd::LayoutNode& r = tree.root();
    const auto& top = tree.node(r.firstChild).bounds;
    const auto& bottom = tree.node(r.firstChild + 1).bounds;
    requireEq(top.h, 100, "25% of inner 400");
    requireEq(top.w, 100, "50% of inner 200");
    requireEq(bottom.h, 300, "75% of inner 400");
    requireEq(bottom.w, 200, "auto width stretches to inner");
    requireEq(top.y, 10, "top padding");
    requireEq(bottom.y, 110, "stacked below");

    std::printf("  Test 3 (percent sizing): PASS\n");
  }

  // --- Test 4: padding + gap ---
  {
    auto root = pd::panel().row().padding(5, 10, 5, 20).gap(6)
        .child(pd::panel().flexGrow(1))
        .child(pd::panel().flexGrow(1))
        .child(pd::panel().flexGrow(1));

    pd::LayoutTree tree;
    tree.compute(root, 300, 100);
    const pd::LayoutNode& r = tree.root();
    const auto& c0 = tree.node(r.firstChild).bounds;
    const auto& c1 = tree.node(r.firstChild + 1).bounds;
    const auto& c2 = tree.node(r.firstChild + 2).bounds;
    requireEq(c0.x, 20, "left padding");
    requireEq(c0.y, 5, "top padding");
    requireEq(c0.h, 90, "inner height");
    // inner width 270, minus two gaps = 258 -> 86 each
    requireEq(c0.w + c1.w + c2.w, 258, "grow shares fill inner minus gaps");
    requireEq(c1.x, c0.right() + 6, "gap after c0");
    requireEq(c2.x, c1.right() + 6, "gap after c1");
    requireEq(c2.right(), 290, "right padding respected");

    std::printf("  Test 4 (padding + gap): PASS\n");
  }

  // --- Test 5: tag lookup ---
  {
    auto root = pd::panel().column()
        .child(pd::panel().height(pd::px(30)).tag("header"))
        .child(pd::panel().flexGrow(1).tag("body"))
        .child(pd::panel().height(pd::px(20)).tag("header"));

    pd::LayoutTree tree;
    tree.compute(root, 200, 100);

    const pd::LayoutNode* h = tree.find("header");
    requireTrue(h != nullptr, "header found");
    requireEq(h->bounds.y, 0, "first duplicate wins");
    requireEq(h->bounds.h, 30, "first duplicate height");

    pd::PixelBounds pb;
    requireTrue(tree.boundsOf("body", pb), "body bounds");
    requireEq(pb.y, 30, "body y");
    requireEq(pb.h, 50, "body height");

    requireTrue(tree.find("nope") == nullptr, "missing tag is nullptr");
    requireTrue(!tree.boundsOf("nope", pb), "missing tag bounds false");
    requireEq(pb.h, 50, "out untouched on miss");

    std::printf("  Test 5 (tag lookup): PASS\n");
  }

  // --- Test 6: findByPrefix ---
  {
    auto root = pd::panel().row()
        .child(pd::panel().flexGrow(1).tag("chart_0"))
        .child(pd::panel().flexGrow(1).tag("legend"))
        .child(pd::panel().flexGrow(1).child(pd::panel().flexGrow(1).tag("chart_1")));

    pd::LayoutTree tree;
    tree.compute(root, 300, 100);
    auto charts = tree.findByPrefix("chart_");
    requireEq(static_cast<int>(charts.size()), 2, "two chart regions");
    requireTrue(charts[0]->tag == "chart_0", "chart_0 first");
    requireTrue(charts[1]->tag == "chart_1", "chart_1 second");
    requireEq(charts[1]->depth, 2, "nested depth");
    requireTrue(tree.findByPrefix("zzz").empty(), "no match is empty");

    std::printf("  Test 6 (findByPrefix): PASS\n");
  }

  // --- Test 7: auto text sizing ---
  {
    pd::TextMeasureFn measure = [](const pd::TextContent& t, float& w, float& h) {
      w = 10.0f * static_cast<float>(t.text.size()) * t.scale;
      h = 20.0f * t.scale;
    };
    auto root = pd::panel().column()
        .child(pd::panel().text("abcd", pd::Color{}, 1.0f).padding(2))
        .child(pd::panel().flexGrow(1))
        .child(pd::panel().row()
                   .child(pd::panel().text("xy", pd::Color{}, 2.0f))
                   .child(pd::panel().flexGrow(1)));

    pd::LayoutTree tree;
    tree.compute(root, 200, 200, measure);
    const pd::LayoutNode& r = tree.root();
    const auto& label = tree.node(r.firstChild).bounds;
    const auto& bottomRow = tree.node(r.firstChild + 2);
    requireEq(label.h, 24, "text height + padding");
    requireEq(bottomRow.bounds.h, 40, "row takes its tallest text");
    requireEq(tree.node(bottomRow.firstChild).bounds.w, 40, "text width at scale 2");
    requireEq(tree.node(r.firstChild + 1).bounds.h, 200 - 24 - 40, "grow fills the rest");

    std::printf("  Test 7 (auto text sizing): PASS\n");
  }

  // --- Test 8: recompute resets ---
  {
    pd::LayoutTree tree;
    auto big = pd::panel().row()
        .child(pd::panel().flexGrow(1).tag("a"))
        .child(pd::panel().flexGrow(1).tag("b"));
    tree.compute(big, 100, 100);
    requireEq(static_cast<int>(tree.size()), 3, "first compute");

    auto small = pd::panel().tag("c");
    tree.compute(small, 50, 50);
    requireEq(static_cast<int>(tree.size()), 1, "second compute replaces");
    requireTrue(tree.find("a") == nullptr, "old tags gone");
    requireTrue(tree.find("c") != nullptr, "new tag present");
    requireEq(tree.root().bounds.w, 50, "root takes the given size");

    tree.reset();
    requireTrue(tree.empty(), "reset empties arena");

    std::printf("  Test 8 (recompute resets): PASS\n");
  }

  std::printf("D1.1 layout flex: ALL PASS\n");
  return 0;
}
