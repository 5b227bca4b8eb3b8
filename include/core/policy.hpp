#pragma once
#include "core/types.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gup {

// Conjunction of optional conditions. An empty predicate is rejected at load time.
struct RulePredicate {
  std::vector<std::string> mediaTypes;        // globs, any of
  std::optional<uint64_t>  sizeOver;          // size >  N
  std::optional<uint64_t>  sizeUnder;         // size <  N
  std::vector<std::string> findingKinds;      // globs against "kind" and "kind:limit"
  std::optional<Severity>  minFindingSeverity;
  std::vector<std::string> sha256;            // lower-case hex

  bool empty() const {
    return mediaTypes.empty() && !sizeOver && !sizeUnder && findingKinds.empty() &&
           !minFindingSeverity && sha256.empty();
  }
};

struct PolicyRule {
  std::string   id;
  std::string   description;
  RulePredicate when;
  Decision      decision = Decision::Allow;
};

struct PolicyDefaults {
  uint64_t maxSizeBytes = 10ull << 20;
  Decision defaultDecision = Decision::Allow;
  Decision onInconclusive = Decision::Warn;
  FailOn   failOn = FailOn::Deny;
  std::vector<std::string> allowTypes;   // empty = every type allowed
  std::vector<std::string> denyTypes;
};

// Read-only after construction; shared by every worker.
struct EffectivePolicy {
  PolicyDefaults defaults;
  Limits limits;
  std::map<std::string, PolicyRule> rules;   // keyed and ordered by id
  std::vector<std::string> sources;          // documents it was built from
};
using PolicyPtr = std::shared_ptr<const EffectivePolicy>;

// ---- one parsed document: unset fields fall through to the layer below ----
struct DefaultsLayer {
  std::optional<uint64_t> maxSizeBytes;
  std::optional<Decision> defaultDecision;
  std::optional<Decision> onInconclusive;
  std::optional<FailOn>   failOn;
  std::optional<std::vector<std::string>> allowTypes;
  std::optional<std::vector<std::string>> denyTypes;
};

struct LimitsLayer {
  std::optional<uint32_t> maxDepth, maxEntries;
  std::optional<uint64_t> maxFileBytes, maxBytesProcessed, maxEntryBytes;
  std::optional<double>   maxExpansionRatio;
  std::optional<uint32_t> timeoutFileMs, timeoutArchiveMs;
  std::optional<double>   entropyThreshold;
  std::optional<uint32_t> entropyWindow, entropyStep, maxEntropyRegions;
  std::optional<uint32_t> pdfMaxObjects, pdfMaxPages, pdfMaxFilterChain;
  std::optional<double>   pdfMaxDecodeRatio;
  std::optional<uint64_t> imageMaxPixels;
  std::optional<uint32_t> imageMaxFrames;
  std::optional<bool>     preventPathTraversal, allowSymlink;
  std::optional<bool>     isolateArchives;
  std::optional<uint64_t> isolationMemoryBytes;
};

struct PolicyLayer {
  DefaultsLayer defaults;
  LimitsLayer limits;
  std::map<std::string, PolicyRule> rules;
  std::vector<std::string> sources;
};

// Override wins per field of defaults/limits; a rule with the same id
// replaces the base rule as a whole.
PolicyLayer mergeLayers(const PolicyLayer& base, const PolicyLayer& override);

// Fills every unset field from the built-in defaults.
PolicyPtr resolvePolicy(const PolicyLayer& layer);

// max 10 MiB, default allow, inconclusive -> warn, fail on deny, no rules.
PolicyPtr defaultPolicy();

// Case-insensitive glob with `*` and `?`.
bool globMatch(const std::string& pattern, const std::string& value);

// Ids of the rules derived from `defaults`. User rules may not use the prefix.
namespace rule_id {
constexpr const char* kReservedPrefix  = "defaults:";
constexpr const char* kMaxSize         = "defaults:max-size";
constexpr const char* kDenyType        = "defaults:deny-type";
constexpr const char* kNotAllowedType  = "defaults:not-allowed-type";
constexpr const char* kInconclusive    = "defaults:inconclusive";
} // namespace rule_id

} // namespace gup
