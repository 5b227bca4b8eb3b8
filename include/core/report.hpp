#pragma once
#include "core/policy_engine.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace gup {

const char* toolVersion();
std::string rfc3339Now();   // UTC, second precision

struct Timings {
  double total = 0.0;
  double sniff = 0.0;
  double validate = 0.0;
  double decide = 0.0;
};

// Result for one input. A non-empty `error` marks an operational failure:
// the file was not decided and only identifier/error are meaningful.
struct FileReport {
  InspectedFile  file;
  DecisionResult decision;
  Timings        timings;
  std::string    generatedAt;
  std::string    error;

  bool ok() const { return error.empty(); }
};

// One NDJSON record, without the trailing newline.
std::string toJson(const FileReport& r);

struct SummaryReport {
  uint64_t totalFiles = 0;
  uint64_t decided = 0;
  uint64_t operationalErrors = 0;
  std::map<Decision, uint64_t> byDecision;
  std::map<std::string, uint64_t> byMediaType;
  std::optional<Decision> highestDecision;
  std::optional<Severity> highestFindingSeverity;
  int exitStatus = 0;
};

std::string toJson(const SummaryReport& s, bool pretty = false);

// 2 operational error > 1 any Deny (fail-on warn|deny) > 3 any Warn (fail-on warn) > 0.
int exitStatusFor(const SummaryReport& s, FailOn failOn);

// Run-lifetime aggregate. Owned by the orchestrating thread, which is its
// only writer; add() is called once per completed file.
class SummaryAccumulator {
public:
  void add(const FileReport& r);
  // Computes the exit status; add() must not be called afterwards.
  const SummaryReport& finalize(FailOn failOn);
  const SummaryReport& current() const { return s_; }
  bool finalized() const { return finalized_; }

private:
  SummaryReport s_;
  bool finalized_ = false;
};

} // namespace gup
