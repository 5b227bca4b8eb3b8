#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gup {

enum class Severity { Low=0, Medium=1, High=2, Critical=3 };
enum class Decision { Allow=0, Warn=1, Deny=2 };
enum class FailOn   { Warn, Deny, Error };

const char* toString(Severity s);
const char* toString(Decision d);   // "ALLOW" | "WARN" | "DENY"
const char* toString(FailOn f);
bool parseSeverity(const std::string& s, Severity& out);
bool parseDecision(const std::string& s, Decision& out);  // case-insensitive
bool parseFailOn(const std::string& s, FailOn& out);

// Finding kinds emitted by the validators and the resource guard.
namespace finding {
constexpr const char* kOversized            = "oversized";
constexpr const char* kMalformed            = "malformed-structure";
constexpr const char* kNestedDepth          = "nested-archive-depth-exceeded";
constexpr const char* kHighEntropy          = "high-entropy-region";
constexpr const char* kResourceLimit        = "resource-limit-exceeded";
constexpr const char* kInconclusive         = "validator-inconclusive";
constexpr const char* kExtensionMismatch    = "extension-mismatch";
constexpr const char* kPathTraversal        = "path-traversal";
constexpr const char* kSymlinkEntry         = "symlink-entry";
constexpr const char* kEncryptedEntry       = "encrypted-entry";
constexpr const char* kExcessiveEntries     = "excessive-entry-count";
constexpr const char* kExcessiveObjects     = "excessive-object-count";
constexpr const char* kExcessivePages       = "excessive-page-count";
constexpr const char* kSuspiciousFilters    = "suspicious-filter-chain";
constexpr const char* kActiveContent        = "active-content";
constexpr const char* kEmbeddedFiles        = "embedded-files";
constexpr const char* kAppendedData         = "appended-data";
constexpr const char* kDimensionMismatch    = "dimension-size-mismatch";
constexpr const char* kExcessiveDimensions  = "excessive-dimensions";
constexpr const char* kExcessiveFrames      = "excessive-frame-count";
} // namespace finding

// Sub-kind of a resource-limit-exceeded finding.
namespace limit {
constexpr const char* kTimeout   = "timeout";
constexpr const char* kMemory    = "memory";
constexpr const char* kExpansion = "expansion";
} // namespace limit

struct Finding {
  std::string kind;
  Severity    severity = Severity::Low;
  std::string detail;
  std::string limit;   // only for resource-limit-exceeded
};

// Append-only collection handed to validators.
class FindingList {
public:
  void add(const char* kind, Severity sev, std::string detail = {}, std::string limit = {}) {
    items_.push_back(Finding{kind, sev, std::move(detail), std::move(limit)});
  }
  void add(Finding f) { items_.push_back(std::move(f)); }
  void addAll(const std::vector<Finding>& fs) { items_.insert(items_.end(), fs.begin(), fs.end()); }

  bool has(const std::string& kind) const {
    for (auto& f : items_) if (f.kind == kind) return true;
    return false;
  }
  size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  const std::vector<Finding>& items() const { return items_; }
  std::vector<Finding> release() { return std::move(items_); }

private:
  std::vector<Finding> items_;
};

struct SniffResult {
  std::string mediaType;              // "application/pdf", "unknown/octet-stream", ...
  std::string label;                  // "PDF document"
  std::vector<uint8_t> magic;         // signature bytes that matched
  std::vector<std::string> extensions; // canonical, lower-case, no dot
};

struct Limits {
  uint32_t maxDepth = 4;
  uint32_t maxEntries = 20000;
  uint64_t maxFileBytes = 256ull<<20;         // retained input per file
  uint64_t maxBytesProcessed = 1ull<<30;      // read + inflated, per file
  uint64_t maxEntryBytes = 512ull<<20;
  double   maxExpansionRatio = 100.0;
  uint32_t timeoutFileMs = 5000;
  uint32_t timeoutArchiveMs = 20000;
  double   entropyThreshold = 7.20;
  uint32_t entropyWindow = 1024;
  uint32_t entropyStep = 512;
  uint32_t maxEntropyRegions = 8;
  uint32_t pdfMaxObjects = 10000;
  uint32_t pdfMaxPages = 200;
  uint32_t pdfMaxFilterChain = 3;
  double   pdfMaxDecodeRatio = 100.0;
  uint64_t imageMaxPixels = 100000000ull;
  uint32_t imageMaxFrames = 1000;
  bool     preventPathTraversal = true;
  bool     allowSymlink = false;
  bool     isolateArchives = false;
  uint64_t isolationMemoryBytes = 512ull<<20;
};

// One input after the pipeline ran. Immutable once handed to the report builder.
struct InspectedFile {
  std::string identifier;
  std::string claimedExt;     // lower-case, no dot; empty if none
  uint64_t    sizeBytes = 0;
  std::string sha256;         // lower-case hex
  SniffResult sniff;
  std::string validator;      // "pdf" | "image" | "archive" | "generic"
  std::vector<Finding> findings;
  std::optional<Severity> severity;  // max over findings
};

std::optional<Severity> maxSeverity(const std::vector<Finding>& findings);

} // namespace gup
