// src/core/policy_engine.cpp
#include "core/policy_engine.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace gup {

namespace {

bool anyGlob(const std::vector<std::string>& patterns, const std::string& value){
  for (const auto& p : patterns) if (globMatch(p, value)) return true;
  return false;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b){
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(),
                    [](char x, char y){ return std::tolower((unsigned char)x) == std::tolower((unsigned char)y); });
}

// One finding has to satisfy both the kind and the severity condition.
bool findingMatches(const RulePredicate& w, const Finding& f){
  if (!w.findingKinds.empty()) {
    bool kindOk = anyGlob(w.findingKinds, f.kind) ||
                  (!f.limit.empty() && anyGlob(w.findingKinds, f.kind + ":" + f.limit));
    if (!kindOk) return false;
  }
  if (w.minFindingSeverity && f.severity < *w.minFindingSeverity) return false;
  return true;
}

} // namespace

bool ruleMatches(const RulePredicate& w, const InspectedFile& file){
  if (w.empty()) return false;
  if (!w.mediaTypes.empty() && !anyGlob(w.mediaTypes, file.sniff.mediaType)) return false;
  if (w.sizeOver && !(file.sizeBytes > *w.sizeOver)) return false;
  if (w.sizeUnder && !(file.sizeBytes < *w.sizeUnder)) return false;
  if (!w.sha256.empty()) {
    bool hit = false;
    for (const auto& h : w.sha256) if (equalsIgnoreCase(h, file.sha256)) { hit = true; break; }
    if (!hit) return false;
  }
  if (!w.findingKinds.empty() || w.minFindingSeverity) {
    bool hit = false;
    for (const auto& f : file.findings) if (findingMatches(w, f)) { hit = true; break; }
    if (!hit) return false;
  }
  return true;
}

DecisionResult decide(const InspectedFile& file, const EffectivePolicy& policy){
  std::vector<std::pair<std::string, Decision>> matched;
  const PolicyDefaults& d = policy.defaults;

  if (file.sizeBytes > d.maxSizeBytes)
    matched.emplace_back(rule_id::kMaxSize, Decision::Deny);
  if (anyGlob(d.denyTypes, file.sniff.mediaType))
    matched.emplace_back(rule_id::kDenyType, Decision::Deny);
  if (!d.allowTypes.empty() && !anyGlob(d.allowTypes, file.sniff.mediaType))
    matched.emplace_back(rule_id::kNotAllowedType, Decision::Deny);
  for (const auto& f : file.findings) {
    if (f.kind == finding::kInconclusive) {
      matched.emplace_back(rule_id::kInconclusive, d.onInconclusive);
      break;
    }
  }
  for (const auto& [id, rule] : policy.rules)
    if (ruleMatches(rule.when, file)) matched.emplace_back(id, rule.decision);

  DecisionResult res;
  if (matched.empty()) {
    res.outcome = d.defaultDecision;
    return res;
  }

  std::sort(matched.begin(), matched.end());
  const std::pair<std::string, Decision>* best = nullptr;
  for (const auto& m : matched) {
    res.triggered.push_back(m.first);
    // sorted by id, so the first rule seen at a severity is the smallest id
    if (!best || m.second > best->second) best = &m;
  }
  res.outcome = best->second;
  res.decidingRule = best->first;
  return res;
}

} // namespace gup
