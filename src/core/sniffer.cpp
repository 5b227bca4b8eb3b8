// src/core/sniffer.cpp
#include "core/sniffer.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <sstream>

namespace gup {

namespace {

struct Signature {
  size_t      offset;
  const char* bytes;
  size_t      len;
  const char* mediaType;
  const char* label;
  const char* exts;      // space separated
};

#define SIG(off, lit, mt, label, exts) Signature{off, lit, sizeof(lit)-1, mt, label, exts}

// Checked in order; first hit wins.
const std::vector<Signature>& binarySignatures(){
  static const std::vector<Signature> t = {
    SIG(0,   "\x89PNG\r\n\x1A\n",           "image/png",  "PNG image",  "png"),
    SIG(0,   "\xFF\xD8\xFF",                "image/jpeg", "JPEG image", "jpg jpeg jpe jfif"),
    SIG(0,   "GIF87a",                      "image/gif",  "GIF image",  "gif"),
    SIG(0,   "GIF89a",                      "image/gif",  "GIF image",  "gif"),
    SIG(0,   "II*\x00",                     "image/tiff", "TIFF image", "tif tiff"),
    SIG(0,   "MM\x00*",                     "image/tiff", "TIFF image", "tif tiff"),
    SIG(0,   "PK\x03\x04",                  "application/zip", "ZIP archive", "zip jar apk docx xlsx pptx odt ods odp epub"),
    SIG(0,   "PK\x05\x06",                  "application/zip", "ZIP archive (empty)", "zip jar apk docx xlsx pptx odt ods odp epub"),
    SIG(0,   "PK\x07\x08",                  "application/zip", "ZIP archive (spanned)", "zip jar apk docx xlsx pptx odt ods odp epub"),
    SIG(0,   "\x1F\x8B",                    "application/gzip", "gzip stream", "gz tgz"),
    SIG(0,   "\xFD" "7zXZ\x00",             "application/x-xz", "xz stream", "xz txz"),
    SIG(0,   "7z\xBC\xAF\x27\x1C",          "application/x-7z-compressed", "7-Zip archive", "7z"),
    SIG(0,   "Rar!\x1A\x07",                "application/vnd.rar", "RAR archive", "rar"),
    SIG(257, "ustar",                       "application/x-tar", "tar archive", "tar"),
    SIG(0,   "\x7F" "ELF",                  kExecutableMediaType, "ELF executable", "elf so bin out o"),
    SIG(0,   "\xFE\xED\xFA\xCE",            kExecutableMediaType, "Mach-O executable", "dylib bin"),
    SIG(0,   "\xFE\xED\xFA\xCF",            kExecutableMediaType, "Mach-O executable", "dylib bin"),
    SIG(0,   "\xCE\xFA\xED\xFE",            kExecutableMediaType, "Mach-O executable", "dylib bin"),
    SIG(0,   "\xCF\xFA\xED\xFE",            kExecutableMediaType, "Mach-O executable", "dylib bin"),
    SIG(0,   "\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1", "application/x-ole-storage", "OLE2 compound document", "doc xls ppt msi msg"),
    SIG(0,   "{\\rtf",                      "application/rtf", "RTF document", "rtf"),
  };
  return t;
}

#undef SIG

struct TextType {
  const char* mediaType;
  const char* label;
  const char* exts;
};

const TextType kXml   {"application/xml", "XML document", "xml svg xsd xsl plist"};
const TextType kHtml  {"text/html", "HTML document", "html htm xhtml"};
const TextType kShell {"text/x-shellscript", "script with shebang", "sh bash zsh ksh csh py pl rb"};
const TextType kText  {"text/plain", "plain text", "txt text log csv tsv md ini conf cfg json yaml yml"};
const TextType kPdf   {"application/pdf", "PDF document", "pdf"};
const TextType kBmp   {"image/bmp", "BMP image", "bmp dib"};
const TextType kWebp  {"image/webp", "WebP image", "webp"};
const TextType kPe    {kExecutableMediaType, "PE executable", "exe dll sys scr com cpl ocx efi"};
const TextType kBzip2 {"application/x-bzip2", "bzip2 stream", "bz2 tbz2"};

std::vector<std::string> splitExts(const char* s){
  std::vector<std::string> out;
  std::istringstream is(s);
  std::string e;
  while (is >> e) out.push_back(e);
  return out;
}

SniffResult make(const char* mt, const char* label, const char* exts,
                 const uint8_t* magic, size_t magicLen){
  SniffResult r;
  r.mediaType = mt;
  r.label = label;
  r.magic.assign(magic, magic + magicLen);
  r.extensions = splitExts(exts);
  return r;
}

bool startsWithAt(const uint8_t* d, size_t n, size_t off, const char* lit, size_t litLen){
  if (off > n || n - off < litLen) return false;
  return std::memcmp(d + off, lit, litLen) == 0;
}

bool startsWithNoCase(const uint8_t* d, size_t n, size_t off, const char* lit){
  size_t l = std::strlen(lit);
  if (off > n || n - off < l) return false;
  for (size_t i=0;i<l;++i)
    if (std::tolower(d[off+i]) != std::tolower((unsigned char)lit[i])) return false;
  return true;
}

// Printable ASCII, common control chars and well-formed UTF-8 sequences.
// A sequence cut by the end of the prefix still counts as text.
bool looksLikeText(const uint8_t* d, size_t n){
  if (n == 0) return false;
  size_t good = 0;
  size_t i = 0;
  while (i < n) {
    uint8_t c = d[i];
    if (c == 0) return false;
    if (c >= 0x20 && c < 0x7F) { ++good; ++i; continue; }
    if (c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\b' || c == 0x1B) { ++good; ++i; continue; }
    size_t need = 0;
    if (c >= 0xC2 && c <= 0xDF) need = 1;
    else if (c >= 0xE0 && c <= 0xEF) need = 2;
    else if (c >= 0xF0 && c <= 0xF4) need = 3;
    if (need == 0) { ++i; continue; }
    size_t j = 1;
    while (j <= need && i + j < n && (d[i+j] & 0xC0) == 0x80) ++j;
    if (j == need + 1 || i + j == n) { good += j; i += j; }
    else ++i;
  }
  return good * 100 >= n * 95;
}

size_t skipWhitespace(const uint8_t* d, size_t n, size_t off){
  while (off < n && (d[off]==' ' || d[off]=='\t' || d[off]=='\r' || d[off]=='\n')) ++off;
  return off;
}

SniffResult sniffText(const uint8_t* d, size_t n, size_t bomLen){
  size_t off = skipWhitespace(d, n, bomLen);
  if (startsWithAt(d, n, 0, "#!", 2))
    return make(kShell.mediaType, kShell.label, kShell.exts, d, 2);
  if (startsWithNoCase(d, n, off, "<?xml"))
    return make(kXml.mediaType, kXml.label, kXml.exts, d + off, 5);
  if (startsWithNoCase(d, n, off, "<!doctype html"))
    return make(kHtml.mediaType, kHtml.label, kHtml.exts, d + off, 14);
  if (startsWithNoCase(d, n, off, "<html"))
    return make(kHtml.mediaType, kHtml.label, kHtml.exts, d + off, 5);
  return make(kText.mediaType, kText.label, kText.exts, d, std::min<size_t>(n, 8));
}

std::string lower(std::string s){
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  return s;
}

} // namespace

SniffResult sniffBytes(const uint8_t* data, size_t len){
  SniffResult unknown;
  unknown.mediaType = kUnknownMediaType;
  unknown.label = "unrecognised data";
  if (!data || len == 0) return unknown;

  const size_t n = std::min(len, kSniffPrefixBytes);
  unknown.magic.assign(data, data + std::min<size_t>(n, 8));

  // PDF readers accept the header anywhere in the first KiB.
  for (size_t off = 0; off + 5 <= std::min<size_t>(n, 1024); ++off) {
    if (data[off] == '%' && std::memcmp(data + off, "%PDF-", 5) == 0)
      return make(kPdf.mediaType, kPdf.label, kPdf.exts, data + off, 5);
  }

  if (n >= 12 && startsWithAt(data, n, 0, "RIFF", 4) && startsWithAt(data, n, 8, "WEBP", 4)) {
    return make(kWebp.mediaType, kWebp.label, kWebp.exts, data, 12);
  }

  // "BM" alone is too weak; the two reserved words must be zero.
  if (n >= 14 && data[0]=='B' && data[1]=='M' &&
      data[6]==0 && data[7]==0 && data[8]==0 && data[9]==0)
    return make(kBmp.mediaType, kBmp.label, kBmp.exts, data, 2);

  // "MZ" and "BZh" start ordinary words; both need their second-level marker.
  if (n >= 0x40 && data[0]=='M' && data[1]=='Z') {
    uint32_t peOff = uint32_t(data[0x3C]) | (uint32_t(data[0x3D])<<8) |
                     (uint32_t(data[0x3E])<<16) | (uint32_t(data[0x3F])<<24);
    if (peOff >= 0x40 && startsWithAt(data, n, peOff, "PE\0\0", 4))
      return make(kPe.mediaType, kPe.label, kPe.exts, data, 2);
  }
  if (n >= 4 && startsWithAt(data, n, 0, "BZh", 3) && data[3] >= '1' && data[3] <= '9')
    return make(kBzip2.mediaType, kBzip2.label, kBzip2.exts, data, 4);

  for (auto& s : binarySignatures()) {
    if (startsWithAt(data, n, s.offset, s.bytes, s.len))
      return make(s.mediaType, s.label, s.exts, data + s.offset, s.len);
  }

  size_t bom = 0;
  if (startsWithAt(data, n, 0, "\xEF\xBB\xBF", 3)) bom = 3;
  else if (startsWithAt(data, n, 0, "\xFF\xFE", 2) || startsWithAt(data, n, 0, "\xFE\xFF", 2))
    return make(kText.mediaType, "plain text (UTF-16)", kText.exts, data, 2);

  if (looksLikeText(data + bom, n - bom)) return sniffText(data, n, bom);

  return unknown;
}

namespace {

const std::vector<std::string>& knownExtensions(){
  static const std::vector<std::string> all = []{
    std::vector<std::string> v;
    for (auto& s : binarySignatures()) for (auto& e : splitExts(s.exts)) v.push_back(e);
    for (const TextType* t : {&kXml, &kHtml, &kShell, &kText, &kPdf, &kBmp, &kWebp, &kPe, &kBzip2})
      for (auto& e : splitExts(t->exts)) v.push_back(e);
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
    return v;
  }();
  return all;
}

} // namespace

bool isKnownExtension(const std::string& extLower){
  auto& v = knownExtensions();
  return std::binary_search(v.begin(), v.end(), extLower);
}

bool isExecutableExtension(const std::string& extLower){
  static const std::vector<std::string> execs = {
    "exe","dll","sys","scr","com","cpl","ocx","efi","elf","so","bin","out","o","dylib","msi"};
  return std::find(execs.begin(), execs.end(), extLower) != execs.end();
}

std::string claimedExtension(const std::string& identifier){
  size_t slash = identifier.find_last_of("/\\");
  std::string base = slash == std::string::npos ? identifier : identifier.substr(slash + 1);
  size_t dot = base.find_last_of('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == base.size()) return "";
  return lower(base.substr(dot + 1));
}

bool isArchiveMediaType(const std::string& mt){
  return mt == "application/zip" || mt == "application/gzip" ||
         mt == "application/x-bzip2" || mt == "application/x-xz" ||
         mt == "application/x-7z-compressed" || mt == "application/vnd.rar" ||
         mt == "application/x-tar";
}

} // namespace gup
