#pragma once
#include "pd/core/Status.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace pd {

struct GlyphInfo {
  std::uint32_t codepoint{0};
  // UV in atlas [0..1]; v0 is the top row (atlas row 0 = top).
  float u0{0}, v0{0}, u1{0}, v1{0};
  // Metrics in pixels at the atlas size
  float advance{0};
  float bearingX{0}, bearingY{0};  // bearingY = pixels above the baseline
  float w{0}, h{0};
};

// Single-size glyph atlas with raw 8-bit coverage. Built once, then
// read-only; safe to share between every text draw of a frame.
class FontAtlas {
public:
  // Printable ASCII is always included; these are added on top.
  static const std::vector<std::uint32_t>& defaultExtraGlyphs();

  // Rasterizes printable ASCII plus `extra` at `pixelHeight`.
  // Fails with FontParseError when the bytes are not a usable font.
  Status build(const std::vector<std::uint8_t>& fontBytes, float pixelHeight,
               const std::vector<std::uint32_t>& extra = defaultExtraGlyphs());
  Status buildFromFile(const std::string& path, float pixelHeight,
                       const std::vector<std::uint32_t>& extra = defaultExtraGlyphs());

  bool built() const { return built_; }

  // nullptr for glyphs the font or the atlas does not carry.
  const GlyphInfo* getGlyph(std::uint32_t codepoint) const;

  // Width = sum of advances; height = (ascent - descent), both times scale.
  // Empty or fully undrawable text measures 0 x 0.
  void measureText(const std::string& text, float scale, float& w, float& h) const;

  float pixelHeight() const { return pixelHeight_; }
  float ascent() const { return ascent_; }
  float descent() const { return descent_; }   // negative: below baseline
  float lineHeight() const { return ascent_ - descent_ + lineGap_; }

  const std::uint8_t* atlasData() const { return atlas_.data(); }
  std::uint32_t atlasSize() const { return atlasSize_; }
  std::size_t glyphCount() const { return glyphs_.size(); }

private:
  struct Shelf {
    std::uint32_t x, y, h;
  };

  bool packGlyph(std::uint32_t w, std::uint32_t h,
                 std::uint32_t& outX, std::uint32_t& outY);

  std::uint32_t atlasSize_{0};
  std::uint32_t pad_{1};
  float pixelHeight_{0};
  float ascent_{0}, descent_{0}, lineGap_{0};
  bool built_{false};

  std::vector<std::uint8_t> atlas_;   // atlasSize_ x atlasSize_, one byte per texel
  std::vector<Shelf> shelves_;
  std::unordered_map<std::uint32_t, GlyphInfo> glyphs_;
};

} // namespace pd
