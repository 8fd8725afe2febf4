#pragma once
#include "pd/layout/PanelBuilder.hpp"
#include "pd/render/Rect.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pd {

// Computed bounds in whole pixels.
struct PixelBounds {
  int x{0}, y{0}, w{0}, h{0};

  int right() const { return x + w; }
  int bottom() const { return y + h; }

  bool contains(const PixelBounds& o) const {
    return o.x >= x && o.y >= y && o.right() <= right() && o.bottom() <= bottom();
  }

  // Part of `o` inside this box; zero-sized (but still inside) when disjoint.
  PixelBounds clip(const PixelBounds& o) const {
    int x0 = std::clamp(o.x, x, right()), x1 = std::clamp(o.right(), x, right());
    int y0 = std::clamp(o.y, y, bottom()), y1 = std::clamp(o.bottom(), y, bottom());
    return PixelBounds{x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0)};
  }

  Rect toRect() const {
    return Rect{static_cast<float>(x), static_cast<float>(y),
                static_cast<float>(w), static_cast<float>(h)};
  }
};

constexpr std::uint32_t kNoNode = 0xFFFFFFFFu;

struct LayoutNode {
  PixelBounds bounds;   // visible box, always inside the parent's bounds
  PixelBounds frame;    // unclipped box; differs from bounds only under scrolling
  PanelStyle style;
  std::string tag;
  bool hasText{false};
  TextContent text;

  std::uint32_t parent{kNoNode};
  std::uint32_t firstChild{kNoNode};  // children occupy [firstChild, firstChild + childCount)
  std::uint32_t childCount{0};
  std::uint32_t depth{0};

  // Main-axis extents of the children run, filled for scrollable panels.
  int contentLength{0};
  int viewportLength{0};
  int scrolled{0};      // offset actually applied after clamping
};

// Measures a text run at its scale. Used for Auto-sized text panels.
using TextMeasureFn = std::function<void(const TextContent&, float& w, float& h)>;

// Splits `space` pixels over `weights` in proportion. Entries with weight
// <= 0 get 0. The result sums to `space` exactly whenever any weight is
// positive; the rounding remainder goes to the last positive weight.
std::vector<int> distributeFlex(int space, const std::vector<float>& weights);

// Arena of computed layout nodes. Node 0 is the root; children of a node
// are contiguous. compute() resets the arena and can be called every frame
// on the same instance without reallocating.
class LayoutTree {
public:
  void compute(const PanelDesc& root, int width, int height,
               const TextMeasureFn& measure = TextMeasureFn{});
  void compute(const PanelBuilder& root, int width, int height,
               const TextMeasureFn& measure = TextMeasureFn{}) {
    compute(root.desc(), width, height, measure);
  }

  void reset();

  std::size_t size() const { return nodes_.size(); }
  bool empty() const { return nodes_.empty(); }
  const LayoutNode& node(std::uint32_t idx) const { return nodes_[idx]; }
  const LayoutNode& root() const { return nodes_.front(); }
  const std::vector<LayoutNode>& nodes() const { return nodes_; }

  // Tag lookup. Absent tags are not an error: nullptr / false.
  const LayoutNode* find(const std::string& tag) const;
  bool boundsOf(const std::string& tag, PixelBounds& out) const;

  // All tagged nodes whose tag starts with `prefix`, in arena order.
  std::vector<const LayoutNode*> findByPrefix(const std::string& prefix) const;

  // Focus ids in depth-first paint order, first occurrence only.
  std::vector<std::string> focusOrder() const;

private:
  void layoutChildren(std::uint32_t idx, const PanelDesc& desc,
                      const TextMeasureFn& measure);

  std::vector<LayoutNode> nodes_;
  std::vector<const PanelDesc*> pending_;  // desc for each node during compute
  std::unordered_map<std::string, std::uint32_t> tags_;
};

} // namespace pd
