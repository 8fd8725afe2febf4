#include "pd/text/FontAtlas.hpp"
#include "pd/text/Utf8.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

namespace pd {

namespace {

std::uint32_t readU32BE(const std::uint8_t* p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

std::uint16_t readU16BE(const std::uint8_t* p) {
  return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

// stb_truetype trusts its input; reject anything whose sfnt table
// directory does not fit the buffer before handing it over.
bool validateSfnt(const std::vector<std::uint8_t>& bytes) {
  if (bytes.size() < 12) return false;
  const std::uint8_t* d = bytes.data();
  std::uint32_t tag = readU32BE(d);
  if (tag != 0x00010000u && tag != 0x4F54544Fu /* OTTO */ &&
      tag != 0x74727565u /* true */) {
    return false;
  }
  std::uint32_t numTables = readU16BE(d + 4);
  if (numTables == 0) return false;
  std::size_t dirEnd = 12 + static_cast<std::size_t>(numTables) * 16;
  if (dirEnd > bytes.size()) return false;
  for (std::uint32_t i = 0; i < numTables; i++) {
    const std::uint8_t* rec = d + 12 + i * 16;
    std::size_t off = readU32BE(rec + 8);
    std::size_t len = readU32BE(rec + 12);
    if (off > bytes.size() || len > bytes.size() - off) return false;
  }
  return true;
}

struct Raster {
  GlyphInfo info;
  std::vector<std::uint8_t> bitmap;
  std::uint32_t w{0}, h{0};
};

} // namespace

const std::vector<std::uint32_t>& FontAtlas::defaultExtraGlyphs() {
  // bullet, status dots, diamond, arrows
  static const std::vector<std::uint32_t> extras = {
    0x2022, 0x25CF, 0x25D0, 0x25CB, 0x25C6, 0x25B2, 0x25BC,
    0x2190, 0x2192, 0x2191, 0x2193
  };
  return extras;
}

Status FontAtlas::buildFromFile(const std::string& path, float pixelHeight,
                                const std::vector<std::uint32_t>& extra) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) {
    std::fprintf(stderr, "FontAtlas: cannot open '%s'\n", path.c_str());
    return Status::fail(ErrorCode::FontParseError, "cannot open font file " + path);
  }
  auto sz = f.tellg();
  if (sz <= 0) {
    return Status::fail(ErrorCode::FontParseError, "empty font file " + path);
  }
  std::vector<std::uint8_t> bytes(static_cast<std::size_t>(sz));
  f.seekg(0);
  f.read(reinterpret_cast<char*>(bytes.data()), sz);
  if (!f) {
    return Status::fail(ErrorCode::FontParseError, "short read on " + path);
  }
  return build(bytes, pixelHeight, extra);
}

Status FontAtlas::build(const std::vector<std::uint8_t>& fontBytes, float pixelHeight,
                        const std::vector<std::uint32_t>& extra) {
  if (built_) {
    std::fprintf(stderr, "FontAtlas: already built\n");
    return Status::success();
  }
  if (!(pixelHeight > 0.0f)) {
    return Status::fail(ErrorCode::FontParseError, "font pixel height must be positive");
  }
  if (!validateSfnt(fontBytes)) {
    std::fprintf(stderr, "FontAtlas: not a TrueType/OpenType font (%zu bytes)\n",
                 fontBytes.size());
    return Status::fail(ErrorCode::FontParseError, "malformed font data");
  }

  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontBytes.data(), 0)) {
    std::fprintf(stderr, "FontAtlas: stbtt_InitFont failed\n");
    return Status::fail(ErrorCode::FontParseError, "stbtt_InitFont failed");
  }

  float scale = stbtt_ScaleForPixelHeight(&font, pixelHeight);
  int asc = 0, desc = 0, gap = 0;
  stbtt_GetFontVMetrics(&font, &asc, &desc, &gap);

  std::vector<std::uint32_t> codepoints;
  for (std::uint32_t c = 32; c <= 126; c++) codepoints.push_back(c);
  for (std::uint32_t c : extra) {
    if (std::find(codepoints.begin(), codepoints.end(), c) == codepoints.end())
      codepoints.push_back(c);
  }

  // Rasterize everything once; packing may be retried at larger sizes.
  std::vector<Raster> rasters;
  rasters.reserve(codepoints.size());
  for (std::uint32_t cp : codepoints) {
    int glyphIdx = stbtt_FindGlyphIndex(&font, static_cast<int>(cp));
    if (glyphIdx == 0 && cp != ' ') continue;  // not in this font

    int advW = 0, lsb = 0;
    stbtt_GetGlyphHMetrics(&font, glyphIdx, &advW, &lsb);
    int ix0 = 0, iy0 = 0, ix1 = 0, iy1 = 0;
    stbtt_GetGlyphBitmapBox(&font, glyphIdx, scale, scale, &ix0, &iy0, &ix1, &iy1);

    Raster r;
    r.info.codepoint = cp;
    r.info.advance = static_cast<float>(advW) * scale;
    r.info.bearingX = static_cast<float>(ix0);
    r.info.bearingY = static_cast<float>(-iy0);
    int gw = ix1 - ix0;
    int gh = iy1 - iy0;
    if (gw > 0 && gh > 0) {
      r.w = static_cast<std::uint32_t>(gw);
      r.h = static_cast<std::uint32_t>(gh);
      r.bitmap.assign(static_cast<std::size_t>(gw) * gh, 0);
      stbtt_MakeGlyphBitmap(&font, r.bitmap.data(), gw, gh, gw, scale, scale, glyphIdx);
    }
    rasters.push_back(std::move(r));
  }

  for (std::uint32_t size : {256u, 512u, 1024u, 2048u}) {
    atlasSize_ = size;
    atlas_.assign(static_cast<std::size_t>(size) * size, 0);
    shelves_.clear();
    shelves_.push_back({1, 1, 0});
    glyphs_.clear();

    bool fits = true;
    const float inv = 1.0f / static_cast<float>(size);
    for (const auto& r : rasters) {
      GlyphInfo info = r.info;
      if (r.w > 0) {
        std::uint32_t ax = 0, ay = 0;
        if (!packGlyph(r.w + pad_ * 2, r.h + pad_ * 2, ax, ay)) {
          fits = false;
          break;
        }
        for (std::uint32_t row = 0; row < r.h; row++) {
          std::memcpy(&atlas_[static_cast<std::size_t>(ay + pad_ + row) * size + ax + pad_],
                      &r.bitmap[static_cast<std::size_t>(row) * r.w], r.w);
        }
        info.u0 = static_cast<float>(ax + pad_) * inv;
        info.v0 = static_cast<float>(ay + pad_) * inv;
        info.u1 = static_cast<float>(ax + pad_ + r.w) * inv;
        info.v1 = static_cast<float>(ay + pad_ + r.h) * inv;
        info.w = static_cast<float>(r.w);
        info.h = static_cast<float>(r.h);
      }
      glyphs_[info.codepoint] = info;
    }
    if (fits) {
      pixelHeight_ = pixelHeight;
      ascent_ = static_cast<float>(asc) * scale;
      descent_ = static_cast<float>(desc) * scale;
      lineGap_ = static_cast<float>(gap) * scale;
      built_ = true;
      return Status::success();
    }
  }

  std::fprintf(stderr, "FontAtlas: glyphs do not fit a 2048 atlas at %.1f px\n",
               static_cast<double>(pixelHeight));
  atlas_.clear();
  glyphs_.clear();
  atlasSize_ = 0;
  return Status::fail(ErrorCode::FontParseError, "glyph set too large for atlas");
}

const GlyphInfo* FontAtlas::getGlyph(std::uint32_t codepoint) const {
  auto it = glyphs_.find(codepoint);
  return it == glyphs_.end() ? nullptr : &it->second;
}

void FontAtlas::measureText(const std::string& text, float scale, float& w, float& h) const {
  w = 0.0f;
  h = 0.0f;
  bool any = false;
  for (std::uint32_t cp : decodeUtf8(text)) {
    const GlyphInfo* g = getGlyph(cp);
    if (!g) continue;
    w += g->advance * scale;
    any = true;
  }
  if (any) h = (ascent_ - descent_) * scale;
}

bool FontAtlas::packGlyph(std::uint32_t w, std::uint32_t h,
                          std::uint32_t& outX, std::uint32_t& outY) {
  for (auto& shelf : shelves_) {
    if (shelf.x + w <= atlasSize_ - 1 && shelf.y + h <= atlasSize_ - 1) {
      if (shelf.h == 0) shelf.h = h;
      if (h <= shelf.h) {
        outX = shelf.x;
        outY = shelf.y;
        shelf.x += w;
        return true;
      }
    }
  }

  auto& last = shelves_.back();
  std::uint32_t ny = last.y + last.h;
  if (ny + h > atlasSize_ - 1) return false;

  outX = 1;
  outY = ny;
  shelves_.push_back({1 + w, ny, h});
  return true;
}

} // namespace pd
