#include "core/report.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace gup;

namespace {

FileReport decided(const std::string& id, const std::string& mt, Decision d) {
  FileReport r;
  r.generatedAt = "2026-01-01T00:00:00Z";
  r.file.identifier = id;
  r.file.sizeBytes = 10;
  r.file.sha256 = std::string(64, '0');
  r.file.sniff.mediaType = mt;
  r.file.sniff.label = "label";
  r.file.sniff.magic = {0x25, 0x50, 0x44, 0x46};
  r.file.validator = "generic";
  r.decision.outcome = d;
  return r;
}

FileReport failedRead(const std::string& id) {
  FileReport r;
  r.file.identifier = id;
  r.error = "read failed";
  return r;
}

bool contains(const std::string& s, const std::string& needle) { return s.find(needle) != std::string::npos; }

void TestFileRecord() {
  FileReport r = decided("dir/a \"quoted\".pdf", "application/pdf", Decision::Deny);
  r.file.claimedExt = "pdf";
  r.file.findings.push_back(Finding{finding::kResourceLimit, Severity::High, "zip: ratio", limit::kExpansion});
  r.file.severity = Severity::High;
  r.decision.triggered = {"a", "b"};
  r.decision.decidingRule = "b";

  std::string j = toJson(r);
  assert(j.find('\n') == std::string::npos && "one record per line");
  assert(contains(j, "\"file\":\"dir/a \\\"quoted\\\".pdf\""));
  assert(contains(j, "\"magic\":\"25 50 44 46\""));
  assert(contains(j, "\"ext\":\"pdf\""));
  assert(contains(j, "\"limit\":\"expansion\""));
  assert(contains(j, "\"severity\":\"high\""));
  assert(contains(j, "\"decision\":\"DENY\""));
  assert(contains(j, "\"rules_triggered\":[\"a\",\"b\"]"));
  assert(contains(j, "\"deciding_rule\":\"b\""));

  FileReport clean = decided("x.txt", "text/plain", Decision::Allow);
  std::string c = toJson(clean);
  assert(contains(c, "\"deciding_rule\":null"));
  assert(contains(c, "\"ext\":null"));
  assert(contains(c, "\"findings\":[]"));

  std::string e = toJson(failedRead("gone.bin"));
  assert(contains(e, "\"status\":\"error\"") && contains(e, "\"error\":\"read failed\""));
  assert(!contains(e, "\"policy\""));
}

void TestSummaryCounts() {
  SummaryAccumulator acc;
  acc.add(decided("a", "text/plain", Decision::Allow));
  acc.add(decided("b", "text/plain", Decision::Warn));
  acc.add(failedRead("c"));
  const SummaryReport& s = acc.finalize(FailOn::Deny);
  assert(acc.finalized());
  assert(s.totalFiles == 3 && s.decided == 2 && s.operationalErrors == 1);
  assert(s.byMediaType.at("text/plain") == 2);
  assert(s.highestDecision && *s.highestDecision == Decision::Warn);
  assert(s.exitStatus == 2);

  acc.add(decided("late", "text/plain", Decision::Deny));
  assert(acc.current().totalFiles == 3 && "finalized summary is read-only");

  std::string j = toJson(s);
  assert(contains(j, "\"operational_errors\":1"));
  assert(contains(j, "\"warn\":1"));
  assert(contains(j, "\"exit_status\":2"));
}

void TestExitStatusPrecedence() {
  SummaryReport s;
  assert(exitStatusFor(s, FailOn::Warn) == 0);

  s.byDecision[Decision::Warn] = 1;
  assert(exitStatusFor(s, FailOn::Deny) == 0 && "warn is success unless fail-on=warn");
  assert(exitStatusFor(s, FailOn::Warn) == 3);
  assert(exitStatusFor(s, FailOn::Error) == 0);

  s.byDecision[Decision::Deny] = 1;
  assert(exitStatusFor(s, FailOn::Warn) == 1 && "deny outranks warn");
  assert(exitStatusFor(s, FailOn::Deny) == 1);
  assert(exitStatusFor(s, FailOn::Error) == 0);

  s.operationalErrors = 1;
  assert(exitStatusFor(s, FailOn::Warn) == 2);
  assert(exitStatusFor(s, FailOn::Error) == 2);
}

} // namespace

int main() {
  TestFileRecord();
  TestSummaryCounts();
  TestExitStatusPrecedence();
  std::cout << "report tests ok\n";
  return 0;
}
