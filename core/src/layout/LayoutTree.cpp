#include "pd/layout/LayoutTree.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace pd {

std::vector<int> distributeFlex(int space, const std::vector<float>& weights) {
  std::vector<int> out(weights.size(), 0);
  if (space <= 0) return out;

  double total = 0.0;
  std::size_t last = weights.size();
  for (std::size_t i = 0; i < weights.size(); i++) {
    if (weights[i] > 0.0f) {
      total += weights[i];
      last = i;
    }
  }
  if (last == weights.size() || total <= 0.0) return out;

  int given = 0;
  for (std::size_t i = 0; i < last; i++) {
    if (weights[i] <= 0.0f) continue;
    out[i] = static_cast<int>(std::floor(static_cast<double>(space) * weights[i] / total));
    given += out[i];
  }
  out[last] = space - given;
  return out;
}

namespace {

int roundPx(float v) {
  return static_cast<int>(std::lround(std::max(0.0f, v)));
}

const Dimension& dimAlong(const PanelStyle& s, bool horizontal) {
  return horizontal ? s.width : s.height;
}

float paddingAlong(const PanelStyle& s, bool horizontal) {
  return horizontal ? s.padding.left + s.padding.right
                    : s.padding.top + s.padding.bottom;
}

// Content size of an Auto panel along one axis.
float intrinsicSize(const PanelDesc& d, bool horizontal, const TextMeasureFn& measure) {
  float pad = std::max(0.0f, paddingAlong(d.style, horizontal));
  if (d.hasText && measure) {
    float w = 0, h = 0;
    measure(d.text, w, h);
    return std::max(0.0f, horizontal ? w : h) + pad;
  }
  if (d.children.empty()) return pad;

  bool alongMain = (d.style.direction == FlexDirection::Row) == horizontal;
  float acc = 0.0f;
  for (const auto& c : d.children) {
    const Dimension& dim = dimAlong(c.style, horizontal);
    float sz = 0.0f;
    if (dim.mode == SizeMode::Fixed) sz = std::max(0.0f, dim.value);
    else if (dim.mode == SizeMode::Auto) sz = intrinsicSize(c, horizontal, measure);
    if (alongMain) acc += sz;
    else acc = std::max(acc, sz);
  }
  if (alongMain && d.children.size() > 1) {
    acc += std::max(0.0f, d.style.gap) * static_cast<float>(d.children.size() - 1);
  }
  return acc + pad;
}

int resolveBasis(const PanelDesc& c, bool horizontal, int parentInner,
                 const TextMeasureFn& measure) {
  const Dimension& dim = dimAlong(c.style, horizontal);
  switch (dim.mode) {
    case SizeMode::Fixed:
      return roundPx(dim.value);
    case SizeMode::Percent:
      return static_cast<int>(std::floor(std::max(0.0f, dim.value) *
                                         static_cast<float>(parentInner) / 100.0f));
    case SizeMode::Auto:
      break;
  }
  return static_cast<int>(std::ceil(intrinsicSize(c, horizontal, measure)));
}

int resolveCross(const PanelDesc& c, bool horizontal, int parentInner) {
  const Dimension& dim = dimAlong(c.style, horizontal);
  int sz = parentInner;  // Auto stretches
  if (dim.mode == SizeMode::Fixed) sz = roundPx(dim.value);
  else if (dim.mode == SizeMode::Percent)
    sz = static_cast<int>(std::floor(std::max(0.0f, dim.value) *
                                     static_cast<float>(parentInner) / 100.0f));
  return std::min(sz, parentInner);
}

} // namespace

void LayoutTree::reset() {
  nodes_.clear();
  pending_.clear();
  tags_.clear();
}

void LayoutTree::compute(const PanelDesc& root, int width, int height,
                         const TextMeasureFn& measure) {
  reset();

  LayoutNode r;
  r.bounds = PixelBounds{0, 0, std::max(0, width), std::max(0, height)};
  r.frame = r.bounds;
  r.style = root.style;
  r.tag = root.tag;
  r.hasText = root.hasText;
  r.text = root.text;
  nodes_.push_back(std::move(r));
  pending_.push_back(&root);

  // Breadth-first: each node's children are appended as one contiguous run.
  for (std::uint32_t i = 0; i < nodes_.size(); i++) {
    const PanelDesc* desc = pending_[i];
    if (!nodes_[i].tag.empty()) {
      auto inserted = tags_.emplace(nodes_[i].tag, i);
      if (!inserted.second) {
        std::fprintf(stderr, "LayoutTree: duplicate tag '%s' ignored\n",
                     nodes_[i].tag.c_str());
      }
    }
    if (!desc->children.empty()) layoutChildren(i, *desc, measure);
  }
  pending_.clear();
}

void LayoutTree::layoutChildren(std::uint32_t idx, const PanelDesc& desc,
                                const TextMeasureFn& measure) {
  const PixelBounds pf = nodes_[idx].frame;
  const PixelBounds pb = nodes_[idx].bounds;
  const PanelStyle& st = desc.style;

  // Inner box, clamped so padding never escapes the node.
  int padL = roundPx(st.padding.left), padR = roundPx(st.padding.right);
  int padT = roundPx(st.padding.top),  padB = roundPx(st.padding.bottom);
  int ix = std::min(pf.x + padL, pf.right());
  int iy = std::min(pf.y + padT, pf.bottom());
  int iw = std::max(0, std::min(pf.w - padL - padR, pf.right() - ix));
  int ih = std::max(0, std::min(pf.h - padT - padB, pf.bottom() - iy));
  // Children are laid out in the frame but only ever shown inside this.
  const PixelBounds visible = pb.clip(PixelBounds{ix, iy, iw, ih});

  const bool horizontal = st.direction == FlexDirection::Row;
  const int mainStart = horizontal ? ix : iy;
  const int mainSize  = horizontal ? iw : ih;
  const int crossStart = horizontal ? iy : ix;
  const int crossSize  = horizontal ? ih : iw;
  const int mainEnd = mainStart + mainSize;

  const std::size_t n = desc.children.size();
  const int gapPx = roundPx(st.gap);

  std::vector<int> basis(n, 0);
  std::vector<float> weights(n, 0.0f);
  long used = static_cast<long>(gapPx) * static_cast<long>(n - 1);
  for (std::size_t i = 0; i < n; i++) {
    basis[i] = resolveBasis(desc.children[i], horizontal, mainSize, measure);
    weights[i] = desc.children[i].style.flexGrow;
    used += basis[i];
  }
  int freeSpace = static_cast<int>(std::max(0L, static_cast<long>(mainSize) - used));
  std::vector<int> extra = distributeFlex(freeSpace, weights);

  const std::uint32_t first = static_cast<std::uint32_t>(nodes_.size());
  nodes_[idx].firstChild = first;
  nodes_[idx].childCount = static_cast<std::uint32_t>(n);

  int scroll = 0;
  if (st.scrollable) {
    long content = used + freeSpace;
    if (freeSpace > 0 && std::none_of(weights.begin(), weights.end(),
                                      [](float w) { return w > 0.0f; })) {
      content = used;
    }
    long maxScroll = std::max(0L, content - mainSize);
    scroll = static_cast<int>(std::min<long>(roundPx(st.scrollOffset), maxScroll));
    nodes_[idx].contentLength = static_cast<int>(content);
    nodes_[idx].viewportLength = mainSize;
    nodes_[idx].scrolled = scroll;
  }

  int cursor = mainStart - scroll;
  for (std::size_t i = 0; i < n; i++) {
    const PanelDesc& c = desc.children[i];
    int pos = cursor;
    int len = std::max(0, basis[i] + extra[i]);
    if (!st.scrollable) {
      pos = std::min(cursor, mainEnd);
      len = std::max(0, std::min(len, mainEnd - pos));
    }
    int cross = resolveCross(c, !horizontal, crossSize);

    LayoutNode node;
    node.frame = horizontal ? PixelBounds{pos, crossStart, len, cross}
                            : PixelBounds{crossStart, pos, cross, len};
    node.bounds = visible.clip(node.frame);
    node.style = c.style;
    node.tag = c.tag;
    node.hasText = c.hasText;
    node.text = c.text;
    node.parent = idx;
    node.depth = nodes_[idx].depth + 1;
    nodes_.push_back(std::move(node));
    pending_.push_back(&c);

    cursor = pos + len + gapPx;
  }
}

const LayoutNode* LayoutTree::find(const std::string& tag) const {
  auto it = tags_.find(tag);
  return it == tags_.end() ? nullptr : &nodes_[it->second];
}

bool LayoutTree::boundsOf(const std::string& tag, PixelBounds& out) const {
  const LayoutNode* n = find(tag);
  if (!n) return false;
  out = n->bounds;
  return true;
}

std::vector<const LayoutNode*> LayoutTree::findByPrefix(const std::string& prefix) const {
  std::vector<const LayoutNode*> out;
  for (const auto& n : nodes_) {
    if (n.tag.empty() || n.tag.compare(0, prefix.size(), prefix) != 0) continue;
    // Only the node the tag index resolved to; duplicates were dropped.
    auto it = tags_.find(n.tag);
    if (it != tags_.end() && &nodes_[it->second] == &n) out.push_back(&n);
  }
  return out;
}

std::vector<std::string> LayoutTree::focusOrder() const {
  std::vector<std::string> out;
  if (nodes_.empty()) return out;
  std::vector<std::uint32_t> stack{0};
  while (!stack.empty()) {
    const LayoutNode& n = nodes_[stack.back()];
    stack.pop_back();
    if (!n.style.focusId.empty() &&
        std::find(out.begin(), out.end(), n.style.focusId) == out.end()) {
      out.push_back(n.style.focusId);
    }
    // Reverse push so the first child is visited first.
    for (std::uint32_t c = n.childCount; c > 0; c--) stack.push_back(n.firstChild + c - 1);
  }
  return out;
}

} // namespace pd
