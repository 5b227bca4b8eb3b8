#include "core/policy.hpp"
#include "core/policy_engine.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace gup;

namespace {

InspectedFile file(const std::string& mediaType, uint64_t size) {
  InspectedFile f;
  f.identifier = "upload.bin";
  f.sizeBytes = size;
  f.sha256 = std::string(64, 'a');
  f.sniff.mediaType = mediaType;
  return f;
}

PolicyRule rule(const std::string& id, Decision d, RulePredicate when) {
  PolicyRule r;
  r.id = id;
  r.decision = d;
  r.when = std::move(when);
  return r;
}

RulePredicate byType(const std::string& glob) {
  RulePredicate p;
  p.mediaTypes.push_back(glob);
  return p;
}

void TestDefaultDecisionWhenNothingMatches() {
  auto policy = defaultPolicy();
  auto res = decide(file("text/plain", 10), *policy);
  assert(res.outcome == Decision::Allow);
  assert(res.triggered.empty());
  assert(!res.decidingRule && "no rule decided");

  EffectivePolicy p = *policy;
  p.defaults.defaultDecision = Decision::Warn;
  assert(decide(file("text/plain", 10), p).outcome == Decision::Warn);
}

void TestSeverityThenSmallestIdTieBreak() {
  EffectivePolicy p = *defaultPolicy();
  p.rules["zz-deny"]   = rule("zz-deny",   Decision::Deny,  byType("image/*"));
  p.rules["aa-warn"]   = rule("aa-warn",   Decision::Warn,  byType("image/png"));
  p.rules["mm-deny"]   = rule("mm-deny",   Decision::Deny,  byType("IMAGE/PNG"));
  p.rules["bb-allow"]  = rule("bb-allow",  Decision::Allow, byType("*"));
  p.rules["no-match"]  = rule("no-match",  Decision::Deny,  byType("application/pdf"));

  auto res = decide(file("image/png", 100), p);
  assert(res.outcome == Decision::Deny);
  assert(res.decidingRule && *res.decidingRule == "mm-deny");
  std::vector<std::string> want = {"aa-warn", "bb-allow", "mm-deny", "zz-deny"};
  assert(res.triggered == want && "triggered ids are sorted");

  // equal severities: smallest id wins
  p.rules.erase("mm-deny");
  p.rules.erase("zz-deny");
  p.rules["ab-warn"] = rule("ab-warn", Decision::Warn, byType("image/png"));
  res = decide(file("image/png", 100), p);
  assert(res.outcome == Decision::Warn && *res.decidingRule == "aa-warn");
}

void TestDecideIsPure() {
  EffectivePolicy p = *defaultPolicy();
  p.rules["r1"] = rule("r1", Decision::Warn, byType("text/*"));
  p.rules["r2"] = rule("r2", Decision::Warn, byType("*/plain"));
  auto f = file("text/plain", 5);
  auto a = decide(f, p);
  auto b = decide(f, p);
  assert(a.outcome == b.outcome && a.triggered == b.triggered && a.decidingRule == b.decidingRule);
}

void TestPredicates() {
  auto f = file("application/pdf", 5000);
  f.findings.push_back(Finding{finding::kResourceLimit, Severity::High, "x", limit::kExpansion});
  f.findings.push_back(Finding{finding::kActiveContent, Severity::Medium, "js", ""});

  RulePredicate size;
  size.sizeOver = 4999;
  assert(ruleMatches(size, f));
  size.sizeUnder = 5000;
  assert(!ruleMatches(size, f) && "size_under is strict");

  RulePredicate kind;
  kind.findingKinds = {"resource-limit-exceeded:expansion"};
  assert(ruleMatches(kind, f));
  kind.findingKinds = {"resource-limit-exceeded:timeout"};
  assert(!ruleMatches(kind, f));
  kind.findingKinds = {"active-*"};
  kind.minFindingSeverity = Severity::High;
  assert(!ruleMatches(kind, f) && "kind and severity must hold for the same finding");
  kind.minFindingSeverity = Severity::Medium;
  assert(ruleMatches(kind, f));

  RulePredicate hash;
  hash.sha256 = {std::string(64, 'A')};
  assert(ruleMatches(hash, f));

  assert(!ruleMatches(RulePredicate{}, f) && "empty predicate never matches");
  assert(globMatch("image/?ng", "image/PNG"));
  assert(!globMatch("image/?ng", "image/jpeg"));
  assert(globMatch("*", ""));
}

void TestBuiltInDefaultRules() {
  EffectivePolicy p = *defaultPolicy();
  p.defaults.maxSizeBytes = 100;
  auto res = decide(file("text/plain", 101), p);
  assert(res.outcome == Decision::Deny && *res.decidingRule == rule_id::kMaxSize);

  p = *defaultPolicy();
  p.defaults.denyTypes = {"application/x-executable"};
  res = decide(file("application/x-executable", 10), p);
  assert(*res.decidingRule == rule_id::kDenyType);

  p = *defaultPolicy();
  p.defaults.allowTypes = {"image/*"};
  res = decide(file("text/plain", 10), p);
  assert(res.outcome == Decision::Deny && *res.decidingRule == rule_id::kNotAllowedType);
  assert(decide(file("image/gif", 10), p).outcome == Decision::Allow);

  p = *defaultPolicy();
  auto f = file("application/x-7z-compressed", 10);
  f.findings.push_back(Finding{finding::kInconclusive, Severity::Medium, "", ""});
  res = decide(f, p);
  assert(res.outcome == Decision::Warn && *res.decidingRule == rule_id::kInconclusive);

  // a configured deny beats the warn from on_inconclusive
  p.rules["block-7z"] = rule("block-7z", Decision::Deny, byType("application/x-7z-compressed"));
  res = decide(f, p);
  assert(res.outcome == Decision::Deny && *res.decidingRule == "block-7z");
  assert(res.triggered.size() == 2);
}

void TestLayeringReplacesRulesWhole() {
  PolicyLayer base, over;
  RulePredicate pdfBig = byType("application/pdf");
  pdfBig.sizeOver = 10;
  base.rules["pdf"] = rule("pdf", Decision::Deny, pdfBig);
  base.rules["keep"] = rule("keep", Decision::Warn, byType("text/*"));
  base.defaults.maxSizeBytes = 111;
  base.defaults.defaultDecision = Decision::Warn;
  base.limits.maxDepth = 2;

  over.rules["pdf"] = rule("pdf", Decision::Allow, byType("application/pdf"));
  over.defaults.maxSizeBytes = 222;
  over.limits.maxExpansionRatio = 50.0;

  auto eff = resolvePolicy(mergeLayers(base, over));
  assert(eff->rules.size() == 2);
  const PolicyRule& r = eff->rules.at("pdf");
  assert(r.decision == Decision::Allow);
  assert(!r.when.sizeOver && "no field of the base rule survives");
  assert(eff->defaults.maxSizeBytes == 222);
  assert(eff->defaults.defaultDecision == Decision::Warn && "unset override fields fall through");
  assert(eff->defaults.onInconclusive == Decision::Warn);
  assert(eff->limits.maxDepth == 2);
  assert(eff->limits.maxExpansionRatio == 50.0);
  assert(eff->limits.timeoutFileMs == Limits{}.timeoutFileMs);
}

} // namespace

int main() {
  TestDefaultDecisionWhenNothingMatches();
  TestSeverityThenSmallestIdTieBreak();
  TestDecideIsPure();
  TestPredicates();
  TestBuiltInDefaultRules();
  TestLayeringReplacesRulesWhole();
  std::cout << "policy engine tests ok\n";
  return 0;
}
