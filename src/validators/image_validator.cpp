// src/validators/image_validator.cpp
#include "validators/validator.hpp"
#include "entropy.h"
#include "log.h"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <set>
#include <string>
#include <vector>

namespace gup {

namespace {

struct Region { size_t begin; size_t end; };

// What the container parser learned. containerEnd == 0 means the format has
// no reliable end marker and appended data is not checked.
struct ImageInfo {
  const char* format = "";
  uint64_t width = 0;
  uint64_t height = 0;
  uint64_t frames = 1;
  size_t   containerEnd = 0;
  uint64_t payloadBytes = 0;       // compressed pixel data actually present
  uint64_t maxPlausiblePayload = 0; // 0 = not computed
  bool     rawPixels = false;      // no compressed pixel stream (BMP)
  std::vector<Region> metadata;
};

inline uint32_t be16(const uint8_t* p){ return (uint32_t(p[0])<<8) | p[1]; }
inline uint32_t be32(const uint8_t* p){ return (uint32_t(p[0])<<24) | (uint32_t(p[1])<<16) | (uint32_t(p[2])<<8) | p[3]; }
inline uint32_t le16(const uint8_t* p){ return uint32_t(p[0]) | (uint32_t(p[1])<<8); }
inline uint32_t le24(const uint8_t* p){ return uint32_t(p[0]) | (uint32_t(p[1])<<8) | (uint32_t(p[2])<<16); }
inline uint32_t le32(const uint8_t* p){ return uint32_t(p[0]) | (uint32_t(p[1])<<8) | (uint32_t(p[2])<<16) | (uint32_t(p[3])<<24); }

std::string hex8(uint8_t b){
  char buf[8];
  std::snprintf(buf, sizeof(buf), "0x%02X", b);
  return buf;
}

uint64_t satMul(uint64_t a, uint64_t b){
  if (a != 0 && b > UINT64_MAX / a) return UINT64_MAX;
  return a * b;
}

// ---------------------------------------------------------------- PNG
void parsePng(const uint8_t* d, size_t n, Budget& budget, ImageInfo& info, FindingList& out){
  info.format = "png";
  size_t pos = 8;
  bool sawIhdr = false, sawIend = false;
  uint32_t bitDepth = 8, colorType = 6;
  while (pos < n) {
    if (!budget.checkpoint()) return;
    if (n - pos < 12) { out.add(finding::kMalformed, Severity::Medium, "png: truncated chunk header at offset " + std::to_string(pos)); return; }
    uint32_t len = be32(d + pos);
    char type[5] = {(char)d[pos+4], (char)d[pos+5], (char)d[pos+6], (char)d[pos+7], 0};
    if (len > 0x7FFFFFFFu || (uint64_t)len + 12 > n - pos) {
      out.add(finding::kMalformed, Severity::Medium,
              std::string("png: chunk ") + type + " at offset " + std::to_string(pos) + " runs past end of file");
      return;
    }
    const uint8_t* body = d + pos + 8;
    if (!sawIhdr) {
      if (std::strcmp(type, "IHDR") != 0 || len != 13) {
        out.add(finding::kMalformed, Severity::Medium, "png: first chunk is not a valid IHDR");
        return;
      }
      sawIhdr = true;
      info.width = be32(body);
      info.height = be32(body + 4);
      bitDepth = body[8];
      colorType = body[9];
    } else if (!std::strcmp(type, "IDAT") || !std::strcmp(type, "fdAT")) {
      info.payloadBytes += len;
    } else if (!std::strcmp(type, "acTL") && len >= 8) {
      info.frames = std::max<uint64_t>(1, be32(body));
    } else if (!std::strcmp(type, "IEND")) {
      sawIend = true;
      info.containerEnd = pos + 12 + len;
      break;
    } else if (type[0] >= 'a' && type[0] <= 'z' && len > 0) {
      // ancillary: tEXt, zTXt, iTXt, eXIf, iCCP and anything private
      info.metadata.push_back(Region{pos + 8, pos + 8 + len});
    }
    pos += 12 + (size_t)len;
  }
  if (!sawIend) {
    out.add(finding::kMalformed, Severity::Medium, "png: missing IEND chunk");
    return;
  }
  static const uint32_t channels[] = {1, 0, 3, 1, 2, 0, 4};
  uint32_t ch = colorType < 7 ? channels[colorType] : 0;
  if (ch == 0 || (bitDepth != 1 && bitDepth != 2 && bitDepth != 4 && bitDepth != 8 && bitDepth != 16)) {
    out.add(finding::kMalformed, Severity::Medium,
            "png: invalid colour type " + std::to_string(colorType) + " / bit depth " + std::to_string(bitDepth));
    return;
  }
  uint64_t rowBytes = (satMul(info.width, (uint64_t)ch * bitDepth) + 7) / 8 + 1;
  uint64_t raw = satMul(satMul(rowBytes, info.height), info.frames);
  // deflate stored blocks add 5 bytes per 64 KiB
  info.maxPlausiblePayload = raw == UINT64_MAX ? raw : raw + raw / 1000 + 4096;
}

// ---------------------------------------------------------------- JPEG
bool isSof(uint8_t m){ return m >= 0xC0 && m <= 0xCF && m != 0xC4 && m != 0xC8 && m != 0xCC; }

void parseJpeg(const uint8_t* d, size_t n, Budget& budget, ImageInfo& info, FindingList& out){
  info.format = "jpeg";
  info.frames = 0;
  size_t pos = 2;
  uint32_t components = 3;
  bool sawEoi = false;
  while (pos < n) {
    if (!budget.checkpoint()) return;
    if (d[pos] != 0xFF) {
      out.add(finding::kMalformed, Severity::Medium, "jpeg: expected marker at offset " + std::to_string(pos));
      return;
    }
    while (pos < n && d[pos] == 0xFF) ++pos;
    if (pos >= n) break;
    uint8_t m = d[pos++];
    if (m == 0xD9) { sawEoi = true; info.containerEnd = pos; break; }
    if ((m >= 0xD0 && m <= 0xD7) || m == 0x01) continue;
    if (n - pos < 2) break;
    uint32_t len = be16(d + pos);
    if (len < 2 || len > n - pos) {
      out.add(finding::kMalformed, Severity::Medium,
              "jpeg: segment " + hex8(m) + " at offset " + std::to_string(pos - 2) + " runs past end of file");
      return;
    }
    const uint8_t* seg = d + pos + 2;
    if (isSof(m)) {
      if (len < 8) { out.add(finding::kMalformed, Severity::Medium, "jpeg: short frame header"); return; }
      ++info.frames;
      if (info.frames == 1) {
        info.height = be16(seg + 1);
        info.width = be16(seg + 3);
        components = seg[5];
      }
    } else if ((m >= 0xE0 && m <= 0xEF) || m == 0xFE) {
      if (len > 2) info.metadata.push_back(Region{pos + 2, pos + len});
    }
    pos += len;
    if (m == 0xDA) {
      // entropy-coded data runs to the next marker that is not a stuffed byte or restart
      size_t scan = pos;
      while (pos + 1 < n) {
        if (d[pos] == 0xFF && d[pos+1] != 0x00 && !(d[pos+1] >= 0xD0 && d[pos+1] <= 0xD7) && d[pos+1] != 0xFF) break;
        ++pos;
        if ((pos & 0xFFFF) == 0 && !budget.checkpoint()) return;
      }
      info.payloadBytes += pos - scan;
      if (pos + 1 >= n) { pos = n; break; }
    }
  }
  if (info.frames == 0) {
    out.add(finding::kMalformed, Severity::Medium, "jpeg: no frame header (SOFn)");
    info.frames = 1;
    return;
  }
  if (!sawEoi) {
    out.add(finding::kMalformed, Severity::Medium, "jpeg: missing EOI marker");
    return;
  }
  uint64_t raw = satMul(satMul(info.width, info.height), std::max<uint32_t>(1, components));
  info.maxPlausiblePayload = raw == UINT64_MAX ? raw : raw * 2 + 65536;
}

// ---------------------------------------------------------------- GIF
// Skips a sub-block chain at `pos`; false when it runs off the end.
bool skipSubBlocks(const uint8_t* d, size_t n, size_t& pos, Budget& budget){
  while (pos < n) {
    uint8_t sz = d[pos++];
    if (sz == 0) return true;
    if (sz > n - pos) return false;
    pos += sz;
    if ((pos & 0xFFFF) < sz && !budget.checkpoint()) return false;
  }
  return false;
}

void parseGif(const uint8_t* d, size_t n, Budget& budget, ImageInfo& info, FindingList& out){
  info.format = "gif";
  info.frames = 0;
  if (n < 13) { out.add(finding::kMalformed, Severity::Medium, "gif: truncated screen descriptor"); return; }
  info.width = le16(d + 6);
  info.height = le16(d + 8);
  uint8_t flags = d[10];
  size_t pos = 13;
  if (flags & 0x80) pos += 3u * (1u << ((flags & 7) + 1));
  bool sawTrailer = false;
  while (pos < n) {
    if (!budget.checkpoint()) return;
    uint8_t b = d[pos];
    if (b == 0x3B) { sawTrailer = true; info.containerEnd = pos + 1; break; }
    if (b == 0x21) {
      if (n - pos < 2) break;
      uint8_t label = d[pos+1];
      size_t start = pos + 2;
      pos = start;
      if (!skipSubBlocks(d, n, pos, budget)) {
        if (budget.tripped()) return;
        out.add(finding::kMalformed, Severity::Medium, "gif: extension block runs past end of file");
        return;
      }
      if (label == 0xFE || label == 0xFF || label == 0x01) info.metadata.push_back(Region{start, pos});
      continue;
    }
    if (b == 0x2C) {
      if (n - pos < 11) break;
      uint8_t lf = d[pos+9];
      pos += 10;
      if (lf & 0x80) pos += 3u * (1u << ((lf & 7) + 1));
      if (pos >= n) break;
      ++pos; // LZW minimum code size
      size_t start = pos;
      if (!skipSubBlocks(d, n, pos, budget)) {
        if (budget.tripped()) return;
        out.add(finding::kMalformed, Severity::Medium, "gif: image data runs past end of file");
        return;
      }
      info.payloadBytes += pos - start;
      ++info.frames;
      continue;
    }
    out.add(finding::kMalformed, Severity::Medium,
            "gif: unexpected block " + hex8(b) + " at offset " + std::to_string(pos));
    return;
  }
  if (!sawTrailer) {
    out.add(finding::kMalformed, Severity::Medium, "gif: missing trailer");
    if (info.frames == 0) info.frames = 1;
    return;
  }
  if (info.frames == 0) {
    out.add(finding::kMalformed, Severity::Medium, "gif: no image descriptor");
    info.frames = 1;
    return;
  }
  // 12-bit LZW codes over 8-bit indices
  uint64_t raw = satMul(satMul(info.width, info.height), info.frames);
  info.maxPlausiblePayload = raw == UINT64_MAX ? raw : raw + raw / 2 + raw / 10 + 4096;
}

// ---------------------------------------------------------------- BMP
void parseBmp(const uint8_t* d, size_t n, ImageInfo& info, FindingList& out){
  info.format = "bmp";
  info.rawPixels = true;
  if (n < 26) { out.add(finding::kMalformed, Severity::Medium, "bmp: truncated header"); return; }
  uint32_t fileSize = le32(d + 2);
  uint32_t pixelOffset = le32(d + 10);
  uint32_t dib = le32(d + 14);
  int64_t w = 0, h = 0;
  uint32_t bpp = 0, compression = 0;
  if (dib == 12) {
    w = le16(d + 18); h = le16(d + 20); bpp = le16(d + 24);
  } else if (dib >= 40 && n >= 34) {
    w = (int32_t)le32(d + 18); h = (int32_t)le32(d + 22);
    bpp = le16(d + 28); compression = le32(d + 30);
  } else {
    out.add(finding::kMalformed, Severity::Medium, "bmp: unsupported DIB header size " + std::to_string(dib));
    return;
  }
  info.width = (uint64_t)(w < 0 ? -w : w);
  info.height = (uint64_t)(h < 0 ? -h : h);

  if (fileSize > n) {
    out.add(finding::kMalformed, Severity::Medium,
            "bmp: header declares " + std::to_string(fileSize) + " bytes but file has " + std::to_string(n));
  }
  if (pixelOffset >= n) {
    out.add(finding::kDimensionMismatch, Severity::Medium,
            "bmp: pixel array offset " + std::to_string(pixelOffset) + " is outside the file");
    return;
  }
  uint64_t pixelBytes = 0;
  if (compression == 0 || compression == 3) {
    uint64_t stride = (satMul(info.width, bpp) + 31) / 32 * 4;
    pixelBytes = satMul(stride, info.height);
    if (pixelBytes > n - pixelOffset) {
      out.add(finding::kDimensionMismatch, Severity::Medium,
              "bmp: " + std::to_string(info.width) + "x" + std::to_string(info.height) + "x" + std::to_string(bpp) +
              " pixel array needs " + std::to_string(pixelBytes) + " bytes, only " +
              std::to_string(n - pixelOffset) + " present");
    }
  }
  if (fileSize >= 26 && fileSize <= n) info.containerEnd = fileSize;
  else if (pixelBytes > 0 && pixelBytes <= n - pixelOffset) info.containerEnd = pixelOffset + (size_t)pixelBytes;
  if (pixelOffset > 14 + (uint64_t)dib) info.metadata.push_back(Region{14 + (size_t)dib, pixelOffset});
}

// ---------------------------------------------------------------- WebP
void parseWebp(const uint8_t* d, size_t n, Budget& budget, ImageInfo& info, FindingList& out){
  info.format = "webp";
  info.frames = 0;
  uint64_t riffEnd = 8ull + le32(d + 4);
  if (riffEnd > n) {
    out.add(finding::kMalformed, Severity::Medium,
            "webp: RIFF length " + std::to_string(riffEnd) + " exceeds file size " + std::to_string(n));
    riffEnd = n;
  } else {
    info.containerEnd = (size_t)riffEnd;
  }
  size_t pos = 12;
  while (pos + 8 <= riffEnd) {
    if (!budget.checkpoint()) return;
    const uint8_t* c = d + pos;
    uint32_t sz = le32(c + 4);
    if (sz > riffEnd - pos - 8) {
      out.add(finding::kMalformed, Severity::Medium,
              "webp: chunk at offset " + std::to_string(pos) + " runs past the RIFF container");
      break;
    }
    const uint8_t* body = c + 8;
    if (!std::memcmp(c, "VP8X", 4) && sz >= 10) {
      info.width = le24(body + 4) + 1ull;
      info.height = le24(body + 7) + 1ull;
    } else if (!std::memcmp(c, "VP8 ", 4) && sz >= 10) {
      if (info.width == 0) { info.width = le16(body + 6) & 0x3FFF; info.height = le16(body + 8) & 0x3FFF; }
      info.payloadBytes += sz;
      if (info.frames == 0) info.frames = 1;
    } else if (!std::memcmp(c, "VP8L", 4) && sz >= 5) {
      if (info.width == 0) {
        uint32_t bits = le32(body + 1);
        info.width = (bits & 0x3FFF) + 1ull;
        info.height = ((bits >> 14) & 0x3FFF) + 1ull;
      }
      info.payloadBytes += sz;
      if (info.frames == 0) info.frames = 1;
    } else if (!std::memcmp(c, "ANMF", 4)) {
      ++info.frames;
      info.payloadBytes += sz;
    } else if (!std::memcmp(c, "ANIM", 4) || !std::memcmp(c, "ALPH", 4)) {
      // pixel-related, not metadata
    } else if (sz > 0) {
      info.metadata.push_back(Region{pos + 8, pos + 8 + sz});
    }
    pos += 8 + (size_t)sz + (sz & 1);
  }
  if (info.frames == 0) {
    out.add(finding::kMalformed, Severity::Medium, "webp: no image bitstream chunk");
    info.frames = 1;
  }
}

// ---------------------------------------------------------------- TIFF
void parseTiff(const uint8_t* d, size_t n, Budget& budget, ImageInfo& info, FindingList& out){
  info.format = "tiff";
  info.frames = 0;
  const bool le = d[0] == 'I';
  auto u16 = [&](size_t o){ return le ? le16(d + o) : be16(d + o); };
  auto u32 = [&](size_t o){ return le ? le32(d + o) : be32(d + o); };
  uint64_t ifd = u32(4);
  std::set<uint64_t> seen;
  while (ifd != 0) {
    if (!budget.checkpoint()) return;
    if (!seen.insert(ifd).second) {
      out.add(finding::kMalformed, Severity::Medium, "tiff: IFD chain loops back to offset " + std::to_string(ifd));
      break;
    }
    if (ifd + 2 > n) {
      out.add(finding::kMalformed, Severity::Medium, "tiff: IFD offset " + std::to_string(ifd) + " outside the file");
      break;
    }
    uint32_t count = u16((size_t)ifd);
    if (ifd + 2 + 12ull * count + 4 > n) {
      out.add(finding::kMalformed, Severity::Medium, "tiff: IFD at offset " + std::to_string(ifd) + " truncated");
      break;
    }
    ++info.frames;
    for (uint32_t i = 0; i < count; ++i) {
      size_t e = (size_t)ifd + 2 + 12u * i;
      uint32_t tag = u16(e), type = u16(e + 2);
      uint32_t val = type == 3 ? u16(e + 8) : u32(e + 8);
      if (info.frames == 1 && tag == 256) info.width = val;
      if (info.frames == 1 && tag == 257) info.height = val;
    }
    ifd = u32((size_t)ifd + 2 + 12u * count);
    if (info.frames > 100000) break;
  }
  if (info.frames == 0) info.frames = 1;
}

// ---------------------------------------------------------------- entropy
void scanEntropy(const uint8_t* d, std::vector<Region> regions, const Limits& limits,
                 Budget& budget, FindingList& out){
  const size_t window = std::max<uint32_t>(1, limits.entropyWindow);
  const size_t step = std::max<uint32_t>(1, limits.entropyStep);
  const size_t slabWindows = 256;
  std::sort(regions.begin(), regions.end(), [](const Region& a, const Region& b){ return a.begin < b.begin; });

  uint32_t emitted = 0;
  uint64_t suppressed = 0;
  for (const auto& r : regions) {
    if (r.end <= r.begin) continue;
    bool open = false;
    size_t hotBegin = 0, hotEnd = 0;
    double hotMax = 0.0;
    auto flush = [&]{
      if (!open) return;
      open = false;
      if (emitted >= limits.maxEntropyRegions) { ++suppressed; return; }
      ++emitted;
      char buf[16];
      std::snprintf(buf, sizeof(buf), "%.2f", hotMax);
      out.add(finding::kHighEntropy, Severity::Medium,
              "bytes " + std::to_string(hotBegin) + ".." + std::to_string(hotEnd) + " entropy " + buf +
              " bits/byte");
    };

    const size_t len = r.end - r.begin;
    size_t off = 0;
    while (off < len) {
      if (!budget.checkpoint()) return;
      size_t slab = std::min(len - off, slabWindows * step + window - step);
      auto wins = entropy_profile(d + r.begin + off, slab, window, step);
      for (const auto& w : wins) {
        if (w.entropy < limits.entropyThreshold) continue;
        size_t b = r.begin + off + w.offset, e = b + w.length;
        if (open && b <= hotEnd) { hotEnd = std::max(hotEnd, e); hotMax = std::max(hotMax, w.entropy); continue; }
        flush();
        open = true; hotBegin = b; hotEnd = e; hotMax = w.entropy;
      }
      if (slab == len - off) break;
      off += slabWindows * step;
    }
    flush();
  }
  if (suppressed > 0)
    logEvent("image", "entropy_regions_suppressed", {{"count", std::to_string(suppressed)}});
}

class ImageValidator : public IValidator {
public:
  ValidatorKind kind() const override { return ValidatorKind::Image; }
  const char* name() const override { return "image"; }

  void validate(const ValidationInput& in, const Limits& limits,
                Budget& budget, FindingList& out) const override {
    if (!budget.charge(in.len)) return;
    const uint8_t* d = in.data;
    const size_t n = in.len;
    const std::string mt = in.sniff ? in.sniff->mediaType : std::string();

    ImageInfo info;
    const size_t before = out.size();
    if (mt == "image/png") parsePng(d, n, budget, info, out);
    else if (mt == "image/jpeg") parseJpeg(d, n, budget, info, out);
    else if (mt == "image/gif") parseGif(d, n, budget, info, out);
    else if (mt == "image/bmp") parseBmp(d, n, info, out);
    else if (mt == "image/webp") parseWebp(d, n, budget, info, out);
    else if (mt == "image/tiff" && n >= 8) parseTiff(d, n, budget, info, out);
    else {
      out.add(finding::kInconclusive, Severity::Medium, "image: no structural parser for " + mt);
      return;
    }
    if (budget.tripped()) return;
    const bool structureOk = out.size() == before;

    if (structureOk && (info.width == 0 || info.height == 0))
      out.add(finding::kMalformed, Severity::Medium, std::string(info.format) + ": zero image dimensions");

    const uint64_t pixels = satMul(info.width, info.height);
    if (pixels > limits.imageMaxPixels)
      out.add(finding::kExcessiveDimensions, Severity::Medium,
              std::to_string(info.width) + "x" + std::to_string(info.height) + " = " + std::to_string(pixels) +
              " pixels (max " + std::to_string(limits.imageMaxPixels) + ")");
    if (info.frames > limits.imageMaxFrames)
      out.add(finding::kExcessiveFrames, Severity::Medium,
              std::to_string(info.frames) + " frames (max " + std::to_string(limits.imageMaxFrames) + ")");

    if (structureOk && info.maxPlausiblePayload > 0 && info.payloadBytes > info.maxPlausiblePayload)
      out.add(finding::kDimensionMismatch, Severity::Medium,
              std::string(info.format) + ": " + std::to_string(info.payloadBytes) + " bytes of pixel data for " +
              std::to_string(info.width) + "x" + std::to_string(info.height) + " (plausible max " +
              std::to_string(info.maxPlausiblePayload) + ")");

    std::vector<Region> regions = info.metadata;
    if (info.containerEnd > 0 && info.containerEnd < n) {
      size_t tail = n - info.containerEnd;
      bool padding = tail <= 16 && std::all_of(d + info.containerEnd, d + n, [](uint8_t c){ return c == 0; });
      if (!padding) {
        out.add(finding::kAppendedData, Severity::Medium,
                std::to_string(tail) + " bytes after end of " + info.format + " container at offset " +
                std::to_string(info.containerEnd));
        regions.push_back(Region{info.containerEnd, n});
      }
    }
    if (info.rawPixels) regions.assign(1, Region{0, n});
    scanEntropy(d, std::move(regions), limits, budget, out);
  }
};

} // namespace

std::unique_ptr<IValidator> makeImageValidator() {
  return std::make_unique<ImageValidator>();
}

} // namespace gup
