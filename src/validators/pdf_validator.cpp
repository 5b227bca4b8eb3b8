// src/validators/pdf_validator.cpp
#include "validators/validator.hpp"

#include <algorithm>
#include <cstring>
#include <set>
#include <string>
#include <vector>

namespace gup {

namespace {

constexpr size_t npos = std::string::npos;

bool isWs(uint8_t c){ return c==' '||c=='\t'||c=='\r'||c=='\n'||c=='\f'||c==0; }
bool isDelim(uint8_t c){
  return isWs(c)||c=='/'||c=='<'||c=='>'||c=='['||c==']'||c=='('||c==')'||c=='{'||c=='}'||c=='%';
}
bool isDigit(uint8_t c){ return c>='0' && c<='9'; }
int  hexVal(uint8_t c){
  if (c>='0'&&c<='9') return c-'0';
  if (c>='a'&&c<='f') return c-'a'+10;
  if (c>='A'&&c<='F') return c-'A'+10;
  return -1;
}

struct Range { size_t begin; size_t end; };

// Byte-level view over the document. Nothing is decoded or executed.
class PdfScan {
public:
  PdfScan(const uint8_t* d, size_t n) : d_(d), n_(n) {}

  size_t size() const { return n_; }
  const uint8_t* data() const { return d_; }
  uint8_t at(size_t i) const { return d_[i]; }

  size_t find(const char* needle, size_t from, size_t to = npos) const {
    const size_t m = std::strlen(needle);
    if (to == npos || to > n_) to = n_;
    if (from >= to || to - from < m) return npos;
    const uint8_t* b = d_ + from;
    const uint8_t* e = d_ + to;
    const uint8_t* hit = std::search(b, e, needle, needle + m,
                                     [](uint8_t a, char c){ return a == (uint8_t)c; });
    return hit == e ? npos : (size_t)(hit - d_);
  }

  // Last occurrence starting at or after `lo`.
  size_t rfind(const char* needle, size_t lo) const {
    const size_t m = std::strlen(needle);
    if (n_ < m) return npos;
    for (size_t i = n_ - m + 1; i-- > lo;) {
      if (std::memcmp(d_ + i, needle, m) == 0) return i;
      if (i == 0) break;
    }
    return npos;
  }

  bool startsWith(size_t pos, const char* s) const {
    const size_t m = std::strlen(s);
    return pos <= n_ && n_ - pos >= m && std::memcmp(d_ + pos, s, m) == 0;
  }

  void skipWs(size_t& p) const {
    while (p < n_) {
      if (isWs(d_[p])) { ++p; continue; }
      if (d_[p] == '%') { while (p < n_ && d_[p] != '\n' && d_[p] != '\r') ++p; continue; }
      break;
    }
  }

  bool readUInt(size_t& p, uint64_t& v) const {
    skipWs(p);
    size_t q = p; v = 0; int digits = 0;
    while (q < n_ && isDigit(d_[q]) && digits < 19) { v = v*10 + (d_[q]-'0'); ++q; ++digits; }
    if (digits == 0 || (q < n_ && isDigit(d_[q]))) return false;
    p = q;
    return true;
  }

  // Reads the name token at `p` ('/'), decoding #xx escapes.
  void readName(size_t& p, std::string& name, bool& escaped) const {
    name.clear(); escaped = false;
    ++p;
    while (p < n_ && !isDelim(d_[p]) && name.size() < 127) {
      if (d_[p] == '#' && p + 2 < n_ && hexVal(d_[p+1]) >= 0 && hexVal(d_[p+2]) >= 0) {
        name += (char)(hexVal(d_[p+1])*16 + hexVal(d_[p+2]));
        escaped = true;
        p += 3;
      } else {
        name += (char)d_[p++];
      }
    }
  }

  // "N G obj" ending right before `pos` (the 'o' of obj).
  bool isObjHeader(size_t pos) const {
    if (pos + 3 < n_ && !isDelim(d_[pos+3])) return false;
    size_t i = pos;
    if (i == 0 || !isWs(d_[i-1])) return false;
    while (i > 0 && isWs(d_[i-1])) --i;
    size_t digitsEnd = i;
    while (i > 0 && isDigit(d_[i-1])) --i;
    if (i == digitsEnd || i == 0 || !isWs(d_[i-1])) return false;
    while (i > 0 && isWs(d_[i-1])) --i;
    digitsEnd = i;
    while (i > 0 && isDigit(d_[i-1])) --i;
    if (i == digitsEnd) return false;
    return i == 0 || isDelim(d_[i-1]);
  }

private:
  const uint8_t* d_;
  size_t n_;
};

bool isStandardFilter(const std::string& f){
  static const std::set<std::string> known = {
    "ASCIIHexDecode","ASCII85Decode","LZWDecode","FlateDecode","RunLengthDecode",
    "CCITTFaxDecode","JBIG2Decode","DCTDecode","JPXDecode","Crypt",
    "AHx","A85","LZW","Fl","RL","CCF","DCT"};
  return known.count(f) != 0;
}

bool isFlate(const std::string& f){ return f == "FlateDecode" || f == "Fl"; }

struct FilterStats {
  uint64_t longChains = 0;     size_t longestChain = 0;  size_t firstLong = npos;
  uint64_t repeatedFlate = 0;  size_t firstRepeated = npos;
  uint64_t ratioHits = 0;      double worstRatio = 0.0;  size_t firstRatio = npos;
  std::set<std::string> unknown;
};

class PdfValidator : public IValidator {
public:
  ValidatorKind kind() const override { return ValidatorKind::Pdf; }
  const char* name() const override { return "pdf"; }

  void validate(const ValidationInput& in, const Limits& limits,
                Budget& budget, FindingList& out) const override {
    if (!budget.charge(in.len)) return;
    PdfScan s(in.data, in.len);
    const size_t n = s.size();

    // ---- header ----
    size_t hdr = s.find("%PDF-", 0, std::min<size_t>(n, 1024));
    if (hdr == npos) {
      out.add(finding::kMalformed, Severity::Medium, "missing %PDF- header");
      out.add(finding::kInconclusive, Severity::Medium, "pdf: no header, structure not examined");
      return;
    }
    if (hdr > 0)
      out.add(finding::kMalformed, Severity::Low, std::to_string(hdr) + " bytes before %PDF- header");
    if (!(hdr + 7 < n && isDigit(s.at(hdr+5)) && s.at(hdr+6) == '.' && isDigit(s.at(hdr+7))))
      out.add(finding::kMalformed, Severity::Low, "unrecognised PDF version in header");

    // ---- trailer ----
    const size_t tail = n > 2048 ? n - 2048 : 0;
    const size_t eof = s.rfind("%%EOF", tail);
    if (eof == npos) {
      out.add(finding::kMalformed, Severity::Medium, "missing %%EOF marker (truncated file?)");
    }

    if (!budget.checkpoint()) return;
    checkXref(s, hdr, limits, budget, out);
    if (budget.tripped()) return;

    // ---- objects and streams ----
    std::vector<size_t> objects;
    size_t pos = 0;
    while ((pos = s.find("obj", pos)) != npos) {
      if (!budget.checkpoint()) return;
      if (s.isObjHeader(pos)) objects.push_back(pos);
      pos += 3;
    }
    if (objects.size() > limits.pdfMaxObjects)
      out.add(finding::kExcessiveObjects, Severity::Medium,
              std::to_string(objects.size()) + " indirect objects (max " + std::to_string(limits.pdfMaxObjects) + ")");

    std::vector<Range> streams;
    pos = 0;
    while ((pos = s.find("stream", pos)) != npos) {
      if (!budget.checkpoint()) return;
      size_t p = pos + 6;
      bool eol = p < n && (s.at(p) == '\n' || s.at(p) == '\r');
      bool opener = pos > 0 && isDelim(s.at(pos-1)) && eol;
      if (!opener) { pos = p; continue; }
      if (s.at(p) == '\r') ++p;
      if (p < n && s.at(p) == '\n') ++p;
      size_t end = s.find("endstream", p);
      if (end == npos) {
        out.add(finding::kMalformed, Severity::Medium, "stream at offset " + std::to_string(pos) + " has no endstream");
        streams.push_back(Range{p, n});
        break;
      }
      streams.push_back(Range{p, end});
      pos = end + 9;
    }

    scanNames(s, objects, streams, limits, budget, out);
    if (budget.tripped()) return;

    if (objects.empty())
      out.add(finding::kInconclusive, Severity::Medium, "pdf: no indirect objects found");
  }

private:
  void checkXref(const PdfScan& s, size_t hdr, const Limits& limits, Budget& budget, FindingList& out) const {
    const size_t n = s.size();
    const size_t sx = s.rfind("startxref", n > 4096 ? n - 4096 : 0);
    if (sx == npos) {
      out.add(finding::kMalformed, Severity::Medium, "missing startxref");
      return;
    }
    size_t p = sx + 9;
    uint64_t off = 0;
    if (!s.readUInt(p, off)) {
      out.add(finding::kMalformed, Severity::Medium, "startxref without a numeric offset");
      return;
    }
    if (off >= n) {
      out.add(finding::kMalformed, Severity::High,
              "startxref offset " + std::to_string(off) + " beyond end of file (" + std::to_string(n) + " bytes)");
      return;
    }
    // Offsets are normally absolute; files with leading junk sometimes count from the header.
    size_t at = (size_t)off;
    if (!pointsAtXref(s, at) && hdr > 0 && off + hdr < n && pointsAtXref(s, (size_t)off + hdr)) at = (size_t)off + hdr;

    size_t q = at; s.skipWs(q);
    if (s.startsWith(q, "xref")) {
      parseXrefTable(s, q + 4, limits, budget, out);
      return;
    }
    uint64_t num = 0, gen = 0;
    size_t r = q;
    if (s.readUInt(r, num) && s.readUInt(r, gen)) {
      s.skipWs(r);
      if (s.startsWith(r, "obj")) {
        size_t dictEnd = s.find("stream", r, std::min(n, r + 4096));
        if (dictEnd == npos) dictEnd = std::min(n, r + 4096);
        if (s.find("/XRef", r, dictEnd) == npos)
          out.add(finding::kMalformed, Severity::Medium,
                  "object " + std::to_string(num) + " at startxref is not a cross-reference stream");
        return;
      }
    }
    out.add(finding::kMalformed, Severity::Medium,
            "startxref offset " + std::to_string(off) + " does not point at a cross-reference section");
  }

  static bool pointsAtXref(const PdfScan& s, size_t at){
    s.skipWs(at);
    if (s.startsWith(at, "xref")) return true;
    uint64_t a = 0, b = 0;
    if (!s.readUInt(at, a) || !s.readUInt(at, b)) return false;
    s.skipWs(at);
    return s.startsWith(at, "obj");
  }

  void parseXrefTable(const PdfScan& s, size_t p, const Limits& limits, Budget& budget, FindingList& out) const {
    const size_t n = s.size();
    uint64_t total = 0;
    bool reportedOutside = false;
    for (;;) {
      if (!budget.checkpoint()) return;
      s.skipWs(p);
      if (p >= n) {
        out.add(finding::kMalformed, Severity::Medium, "cross-reference table runs past end of file");
        return;
      }
      if (s.startsWith(p, "trailer")) break;

      uint64_t first = 0, count = 0;
      size_t sub = p;
      if (!s.readUInt(p, first) || !s.readUInt(p, count)) {
        out.add(finding::kMalformed, Severity::Medium,
                "malformed cross-reference subsection header at offset " + std::to_string(sub));
        return;
      }
      // Every entry takes at least 18 bytes ("0 0 n" padded to fixed width in practice).
      if (count > (n - p) / 18 + 1) {
        out.add(finding::kMalformed, Severity::High,
                "cross-reference subsection declares " + std::to_string(count) + " entries, more than the file can hold");
        return;
      }
      for (uint64_t i = 0; i < count; ++i) {
        if ((i & 0xFFF) == 0 && !budget.checkpoint()) return;
        uint64_t eoff = 0, egen = 0;
        size_t e = p;
        if (!s.readUInt(p, eoff) || !s.readUInt(p, egen)) {
          out.add(finding::kMalformed, Severity::Medium,
                  "malformed cross-reference entry at offset " + std::to_string(e));
          return;
        }
        s.skipWs(p);
        if (p >= n || (s.at(p) != 'n' && s.at(p) != 'f')) {
          out.add(finding::kMalformed, Severity::Medium,
                  "cross-reference entry at offset " + std::to_string(e) + " is neither in-use nor free");
          return;
        }
        if (s.at(p) == 'n' && eoff >= n && !reportedOutside) {
          out.add(finding::kMalformed, Severity::Medium,
                  "cross-reference entry for object " + std::to_string(first + i) + " points outside the file");
          reportedOutside = true;
        }
        ++p;
      }
      total += count;
    }
    if (total > limits.pdfMaxObjects)
      out.add(finding::kExcessiveObjects, Severity::Medium,
              "cross-reference table lists " + std::to_string(total) + " objects (max " +
              std::to_string(limits.pdfMaxObjects) + ")");
  }

  // Walks every name token outside stream data.
  void scanNames(const PdfScan& s, const std::vector<size_t>& objects, const std::vector<Range>& streams,
                 const Limits& limits, Budget& budget, FindingList& out) const {
    const size_t n = s.size();
    uint64_t pages = 0, scripts = 0, launches = 0, autoActions = 0, embedded = 0, obfuscated = 0;
    FilterStats fs;
    size_t si = 0;
    size_t p = 0;
    uint64_t tokens = 0;
    std::string nm;
    while (p < n) {
      while (si < streams.size() && streams[si].end <= p) ++si;
      if (si < streams.size() && p >= streams[si].begin) { p = streams[si].end; continue; }

      size_t stop = si < streams.size() ? streams[si].begin : n;
      const void* hit = std::memchr(s.data() + p, '/', stop - p);
      if (!hit) { p = stop; continue; }
      p = (size_t)((const uint8_t*)hit - s.data());
      if ((++tokens & 0x3FF) == 0 && !budget.checkpoint()) return;

      bool escaped = false;
      size_t q = p;
      s.readName(q, nm, escaped);
      if (nm == "Type") {
        size_t r = q; s.skipWs(r);
        if (r < n && s.at(r) == '/') {
          std::string v; bool e2 = false;
          s.readName(r, v, e2);
          if (v == "Page") ++pages;
        }
      } else if (nm == "JavaScript" || nm == "JS") {
        ++scripts; if (escaped) ++obfuscated;
      } else if (nm == "Launch") {
        ++launches; if (escaped) ++obfuscated;
      } else if (nm == "OpenAction" || nm == "AA") {
        ++autoActions;
      } else if (nm == "EmbeddedFiles" || nm == "EmbeddedFile") {
        ++embedded; if (escaped) ++obfuscated;
      } else if (nm == "Filter") {
        inspectFilter(s, p, q, objects, streams, limits, fs);
      }
      p = q > p ? q : p + 1;
    }

    if (pages > limits.pdfMaxPages)
      out.add(finding::kExcessivePages, Severity::Medium,
              std::to_string(pages) + " pages (max " + std::to_string(limits.pdfMaxPages) + ")");
    if (scripts > 0)
      out.add(finding::kActiveContent, Severity::High,
              std::to_string(scripts) + " JavaScript action(s)" +
              (autoActions > 0 ? ", triggered by /OpenAction or /AA" : ""));
    if (launches > 0)
      out.add(finding::kActiveContent, Severity::High, std::to_string(launches) + " /Launch action(s)");
    if (obfuscated > 0)
      out.add(finding::kActiveContent, Severity::High,
              std::to_string(obfuscated) + " hex-escaped sensitive name(s)");
    if (embedded > 0)
      out.add(finding::kEmbeddedFiles, Severity::Medium, std::to_string(embedded) + " embedded file reference(s)");

    if (fs.longChains > 0)
      out.add(finding::kSuspiciousFilters, Severity::High,
              std::to_string(fs.longChains) + " stream(s) with filter chains longer than " +
              std::to_string(limits.pdfMaxFilterChain) + " (longest " + std::to_string(fs.longestChain) +
              ", first at offset " + std::to_string(fs.firstLong) + ")");
    if (fs.repeatedFlate > 0)
      out.add(finding::kSuspiciousFilters, Severity::High,
              std::to_string(fs.repeatedFlate) + " stream(s) with nested FlateDecode (first at offset " +
              std::to_string(fs.firstRepeated) + ")");
    if (fs.ratioHits > 0)
      out.add(finding::kSuspiciousFilters, Severity::High,
              std::to_string(fs.ratioHits) + " stream(s) declare a decode ratio above " +
              std::to_string((int)limits.pdfMaxDecodeRatio) + "x (worst " + std::to_string((long long)fs.worstRatio) +
              "x, first at offset " + std::to_string(fs.firstRatio) + ")");
    if (!fs.unknown.empty()) {
      std::string names;
      for (auto& u : fs.unknown) { if (!names.empty()) names += ","; names += u; }
      out.add(finding::kSuspiciousFilters, Severity::Medium, "non-standard filter(s): " + names);
    }
  }

  void inspectFilter(const PdfScan& s, size_t at, size_t p,
                     const std::vector<size_t>& objects, const std::vector<Range>& streams,
                     const Limits& limits, FilterStats& fs) const {
    const size_t n = s.size();
    std::vector<std::string> chain;
    std::string nm; bool esc = false;
    s.skipWs(p);
    if (p < n && s.at(p) == '/') {
      s.readName(p, nm, esc);
      chain.push_back(nm);
    } else if (p < n && s.at(p) == '[') {
      ++p;
      for (int guard = 0; guard < 64; ++guard) {
        s.skipWs(p);
        if (p >= n || s.at(p) != '/') break;
        s.readName(p, nm, esc);
        chain.push_back(nm);
      }
    } else {
      return; // indirect reference; nothing to inspect
    }

    for (auto& f : chain) if (!isStandardFilter(f) && fs.unknown.size() < 8) fs.unknown.insert(f);
    if (chain.size() > limits.pdfMaxFilterChain) {
      if (fs.longChains++ == 0) fs.firstLong = at;
      fs.longestChain = std::max(fs.longestChain, chain.size());
    }
    if (std::count_if(chain.begin(), chain.end(), isFlate) > 1) {
      if (fs.repeatedFlate++ == 0) fs.firstRepeated = at;
    }

    // Dictionary that holds this /Filter: from its object header to its stream data.
    auto obj = std::upper_bound(objects.begin(), objects.end(), at);
    size_t lo = obj == objects.begin() ? 0 : *(obj - 1);
    size_t hi = obj == objects.end() ? n : *obj;
    auto st = std::upper_bound(streams.begin(), streams.end(), at,
                               [](size_t v, const Range& r){ return v < r.begin; });
    uint64_t streamLen = 0;
    if (st != streams.end() && st->begin < hi) { streamLen = st->end - st->begin; hi = st->begin; }

    uint64_t declaredDecoded = 0, declaredLen = 0;
    if (!dictInt(s, lo, hi, "/DL", declaredDecoded)) return;
    if (!dictInt(s, lo, hi, "/Length", declaredLen)) declaredLen = streamLen;
    if (declaredLen == 0) declaredLen = 1;
    double ratio = (double)declaredDecoded / (double)declaredLen;
    if (ratio > limits.pdfMaxDecodeRatio) {
      if (fs.ratioHits++ == 0) fs.firstRatio = at;
      fs.worstRatio = std::max(fs.worstRatio, ratio);
    }
  }

  // Direct integer value of `key` inside [lo, hi); indirect references do not count.
  static bool dictInt(const PdfScan& s, size_t lo, size_t hi, const char* key, uint64_t& v){
    const size_t klen = std::strlen(key);
    size_t p = lo;
    while ((p = s.find(key, p, hi)) != npos) {
      size_t q = p + klen;
      if (q < s.size() && !isDelim(s.at(q))) { p = q; continue; }
      if (!s.readUInt(q, v)) { p = q; continue; }
      size_t r = q;
      uint64_t gen = 0;
      if (s.readUInt(r, gen)) {
        s.skipWs(r);
        if (r < s.size() && s.at(r) == 'R') return false;
      }
      return true;
    }
    return false;
  }
};

} // namespace

std::unique_ptr<IValidator> makePdfValidator() {
  return std::make_unique<PdfValidator>();
}

} // namespace gup
