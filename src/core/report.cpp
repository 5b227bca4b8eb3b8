// src/core/report.cpp
#include "core/report.hpp"
#include "json_min.h"
#include "log.h"

#include <cstdio>
#include <ctime>
#include <sstream>

#ifndef GUP_VERSION
#define GUP_VERSION "0.0.0"
#endif

namespace gup {

namespace {

std::string ms(double v){
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", v);
  return buf;
}

std::string lowerDecision(Decision d){
  std::string s = toString(d);
  for (auto& c : s) c = (char)(c - 'A' + 'a');
  return s;
}

} // namespace

const char* toolVersion(){ return GUP_VERSION; }

std::string rfc3339Now(){
  std::time_t now = std::time(nullptr);
  std::tm tmv{};
  gmtime_r(&now, &tmv);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmv);
  return buf;
}

std::string toJson(const FileReport& r){
  const InspectedFile& f = r.file;
  std::ostringstream o;
  o << "{\"version\":" << jsonString(toolVersion())
    << ",\"generated_at\":" << jsonString(r.generatedAt)
    << ",\"file\":" << jsonString(f.identifier);
  if (!r.ok()) {
    o << ",\"status\":\"error\",\"error\":" << jsonString(r.error) << "}";
    return o.str();
  }
  o << ",\"status\":\"decided\""
    << ",\"size_bytes\":" << f.sizeBytes
    << ",\"sha256\":" << jsonString(f.sha256);

  o << ",\"sniff\":{\"mime_real\":" << jsonString(f.sniff.mediaType)
    << ",\"label\":" << jsonString(f.sniff.label)
    << ",\"magic\":" << jsonString(hexSpacedUpper(f.sniff.magic.data(), f.sniff.magic.size()))
    << ",\"ext\":";
  if (f.claimedExt.empty()) o << "null"; else o << jsonString(f.claimedExt);
  o << "}";

  o << ",\"validator\":" << jsonString(f.validator) << ",\"findings\":[";
  for (size_t i = 0; i < f.findings.size(); ++i) {
    const Finding& x = f.findings[i];
    if (i) o << ",";
    o << "{\"kind\":" << jsonString(x.kind)
      << ",\"severity\":" << jsonString(toString(x.severity));
    if (!x.limit.empty()) o << ",\"limit\":" << jsonString(x.limit);
    o << ",\"detail\":" << jsonString(x.detail) << "}";
  }
  o << "],\"severity\":";
  if (f.severity) o << jsonString(toString(*f.severity)); else o << "null";

  o << ",\"policy\":{\"decision\":" << jsonString(toString(r.decision.outcome)) << ",\"rules_triggered\":[";
  for (size_t i = 0; i < r.decision.triggered.size(); ++i) {
    if (i) o << ",";
    o << jsonString(r.decision.triggered[i]);
  }
  o << "],\"deciding_rule\":";
  if (r.decision.decidingRule) o << jsonString(*r.decision.decidingRule); else o << "null";
  o << "}";

  o << ",\"timings_ms\":{\"total\":" << ms(r.timings.total)
    << ",\"sniff\":" << ms(r.timings.sniff)
    << ",\"validate\":" << ms(r.timings.validate)
    << ",\"decide\":" << ms(r.timings.decide) << "}}";
  return o.str();
}

std::string toJson(const SummaryReport& s, bool pretty){
  const char* nl = pretty ? "\n" : "";
  const char* in = pretty ? "  " : "";
  const char* sp = pretty ? " " : "";
  std::ostringstream o;
  o << "{" << nl
    << in << "\"version\":" << sp << jsonString(toolVersion()) << "," << nl
    << in << "\"total_files\":" << sp << s.totalFiles << "," << nl
    << in << "\"decided\":" << sp << s.decided << "," << nl
    << in << "\"operational_errors\":" << sp << s.operationalErrors << "," << nl;

  o << in << "\"decisions\":" << sp << "{";
  const Decision all[] = {Decision::Allow, Decision::Warn, Decision::Deny};
  for (size_t i = 0; i < 3; ++i) {
    auto it = s.byDecision.find(all[i]);
    o << (i ? "," : "") << sp << jsonString(lowerDecision(all[i])) << ":" << sp
      << (it == s.byDecision.end() ? 0 : it->second);
  }
  o << sp << "}," << nl;

  o << in << "\"media_types\":" << sp << "{";
  bool first = true;
  for (const auto& [mt, n] : s.byMediaType) {
    o << (first ? "" : ",") << sp << jsonString(mt) << ":" << sp << n;
    first = false;
  }
  o << sp << "}," << nl;

  o << in << "\"highest_decision\":" << sp;
  if (s.highestDecision) o << jsonString(toString(*s.highestDecision)); else o << "null";
  o << "," << nl << in << "\"highest_finding_severity\":" << sp;
  if (s.highestFindingSeverity) o << jsonString(toString(*s.highestFindingSeverity)); else o << "null";
  o << "," << nl << in << "\"exit_status\":" << sp << s.exitStatus << nl << "}";
  return o.str();
}

int exitStatusFor(const SummaryReport& s, FailOn failOn){
  auto count = [&](Decision d){
    auto it = s.byDecision.find(d);
    return it == s.byDecision.end() ? uint64_t(0) : it->second;
  };
  if (s.operationalErrors > 0) return 2;
  if (count(Decision::Deny) > 0 && failOn != FailOn::Error) return 1;
  if (count(Decision::Warn) > 0 && failOn == FailOn::Warn) return 3;
  return 0;
}

void SummaryAccumulator::add(const FileReport& r){
  if (finalized_) {
    LOGW("summary: result for " + r.file.identifier + " arrived after finalize; ignored");
    return;
  }
  ++s_.totalFiles;
  if (!r.ok()) { ++s_.operationalErrors; return; }

  ++s_.decided;
  ++s_.byDecision[r.decision.outcome];
  ++s_.byMediaType[r.file.sniff.mediaType];
  if (!s_.highestDecision || r.decision.outcome > *s_.highestDecision)
    s_.highestDecision = r.decision.outcome;
  if (r.file.severity && (!s_.highestFindingSeverity || *r.file.severity > *s_.highestFindingSeverity))
    s_.highestFindingSeverity = r.file.severity;
}

const SummaryReport& SummaryAccumulator::finalize(FailOn failOn){
  if (!finalized_) {
    s_.exitStatus = exitStatusFor(s_, failOn);
    finalized_ = true;
  }
  return s_;
}

} // namespace gup
