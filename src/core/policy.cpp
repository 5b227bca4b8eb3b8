// src/core/policy.cpp
#include "core/policy.hpp"
#include <cctype>

namespace gup {

namespace {

template <typename T>
void pick(std::optional<T>& dst, const std::optional<T>& base, const std::optional<T>& over){
  dst = over ? over : base;
}

template <typename T>
void apply(T& dst, const std::optional<T>& v){
  if (v) dst = *v;
}

bool globAt(const std::string& p, size_t pi, const std::string& v, size_t vi){
  while (pi < p.size()) {
    char pc = p[pi];
    if (pc == '*') {
      while (pi < p.size() && p[pi] == '*') ++pi;
      if (pi == p.size()) return true;
      for (size_t k = vi; k <= v.size(); ++k)
        if (globAt(p, pi, v, k)) return true;
      return false;
    }
    if (vi >= v.size()) return false;
    if (pc != '?' && std::tolower((unsigned char)pc) != std::tolower((unsigned char)v[vi])) return false;
    ++pi; ++vi;
  }
  return vi == v.size();
}

} // namespace

bool globMatch(const std::string& pattern, const std::string& value){
  return globAt(pattern, 0, value, 0);
}

PolicyLayer mergeLayers(const PolicyLayer& base, const PolicyLayer& over){
  PolicyLayer m;
  const DefaultsLayer& bd = base.defaults;
  const DefaultsLayer& od = over.defaults;
  pick(m.defaults.maxSizeBytes,    bd.maxSizeBytes,    od.maxSizeBytes);
  pick(m.defaults.defaultDecision, bd.defaultDecision, od.defaultDecision);
  pick(m.defaults.onInconclusive,  bd.onInconclusive,  od.onInconclusive);
  pick(m.defaults.failOn,          bd.failOn,          od.failOn);
  pick(m.defaults.allowTypes,      bd.allowTypes,      od.allowTypes);
  pick(m.defaults.denyTypes,       bd.denyTypes,       od.denyTypes);

  const LimitsLayer& bl = base.limits;
  const LimitsLayer& ol = over.limits;
  LimitsLayer& l = m.limits;
  pick(l.maxDepth, bl.maxDepth, ol.maxDepth);
  pick(l.maxEntries, bl.maxEntries, ol.maxEntries);
  pick(l.maxFileBytes, bl.maxFileBytes, ol.maxFileBytes);
  pick(l.maxBytesProcessed, bl.maxBytesProcessed, ol.maxBytesProcessed);
  pick(l.maxEntryBytes, bl.maxEntryBytes, ol.maxEntryBytes);
  pick(l.maxExpansionRatio, bl.maxExpansionRatio, ol.maxExpansionRatio);
  pick(l.timeoutFileMs, bl.timeoutFileMs, ol.timeoutFileMs);
  pick(l.timeoutArchiveMs, bl.timeoutArchiveMs, ol.timeoutArchiveMs);
  pick(l.entropyThreshold, bl.entropyThreshold, ol.entropyThreshold);
  pick(l.entropyWindow, bl.entropyWindow, ol.entropyWindow);
  pick(l.entropyStep, bl.entropyStep, ol.entropyStep);
  pick(l.maxEntropyRegions, bl.maxEntropyRegions, ol.maxEntropyRegions);
  pick(l.pdfMaxObjects, bl.pdfMaxObjects, ol.pdfMaxObjects);
  pick(l.pdfMaxPages, bl.pdfMaxPages, ol.pdfMaxPages);
  pick(l.pdfMaxFilterChain, bl.pdfMaxFilterChain, ol.pdfMaxFilterChain);
  pick(l.pdfMaxDecodeRatio, bl.pdfMaxDecodeRatio, ol.pdfMaxDecodeRatio);
  pick(l.imageMaxPixels, bl.imageMaxPixels, ol.imageMaxPixels);
  pick(l.imageMaxFrames, bl.imageMaxFrames, ol.imageMaxFrames);
  pick(l.preventPathTraversal, bl.preventPathTraversal, ol.preventPathTraversal);
  pick(l.allowSymlink, bl.allowSymlink, ol.allowSymlink);
  pick(l.isolateArchives, bl.isolateArchives, ol.isolateArchives);
  pick(l.isolationMemoryBytes, bl.isolationMemoryBytes, ol.isolationMemoryBytes);

  m.rules = base.rules;
  for (const auto& [id, rule] : over.rules) m.rules[id] = rule;

  m.sources = base.sources;
  m.sources.insert(m.sources.end(), over.sources.begin(), over.sources.end());
  return m;
}

PolicyPtr resolvePolicy(const PolicyLayer& layer){
  auto p = std::make_shared<EffectivePolicy>();
  PolicyDefaults& d = p->defaults;
  apply(d.maxSizeBytes, layer.defaults.maxSizeBytes);
  apply(d.defaultDecision, layer.defaults.defaultDecision);
  apply(d.onInconclusive, layer.defaults.onInconclusive);
  apply(d.failOn, layer.defaults.failOn);
  apply(d.allowTypes, layer.defaults.allowTypes);
  apply(d.denyTypes, layer.defaults.denyTypes);

  Limits& l = p->limits;
  const LimitsLayer& s = layer.limits;
  apply(l.maxDepth, s.maxDepth);
  apply(l.maxEntries, s.maxEntries);
  apply(l.maxFileBytes, s.maxFileBytes);
  apply(l.maxBytesProcessed, s.maxBytesProcessed);
  apply(l.maxEntryBytes, s.maxEntryBytes);
  apply(l.maxExpansionRatio, s.maxExpansionRatio);
  apply(l.timeoutFileMs, s.timeoutFileMs);
  apply(l.timeoutArchiveMs, s.timeoutArchiveMs);
  apply(l.entropyThreshold, s.entropyThreshold);
  apply(l.entropyWindow, s.entropyWindow);
  apply(l.entropyStep, s.entropyStep);
  apply(l.maxEntropyRegions, s.maxEntropyRegions);
  apply(l.pdfMaxObjects, s.pdfMaxObjects);
  apply(l.pdfMaxPages, s.pdfMaxPages);
  apply(l.pdfMaxFilterChain, s.pdfMaxFilterChain);
  apply(l.pdfMaxDecodeRatio, s.pdfMaxDecodeRatio);
  apply(l.imageMaxPixels, s.imageMaxPixels);
  apply(l.imageMaxFrames, s.imageMaxFrames);
  apply(l.preventPathTraversal, s.preventPathTraversal);
  apply(l.allowSymlink, s.allowSymlink);
  apply(l.isolateArchives, s.isolateArchives);
  apply(l.isolationMemoryBytes, s.isolationMemoryBytes);

  p->rules = layer.rules;
  p->sources = layer.sources;
  return p;
}

PolicyPtr defaultPolicy(){
  static const PolicyPtr builtin = resolvePolicy(PolicyLayer{});
  return builtin;
}

} // namespace gup
