#pragma once
#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace gup {

enum class BreachKind { None, Timeout, Memory, Expansion };
const char* toString(BreachKind b);   // "none" | limit::kTimeout | ...

// Cooperative budget for one validator invocation. Validators charge every
// byte they read or inflate and call checkpoint() inside every loop; once the
// budget trips, both return false and the validator is expected to return.
class Budget {
public:
  Budget(uint64_t maxBytes, std::chrono::milliseconds timeout);

  bool charge(uint64_t bytes);
  bool checkpoint();
  // First trip wins; later calls are ignored.
  void trip(BreachKind kind, std::string detail);

  bool tripped() const { return breach_ != BreachKind::None; }
  BreachKind breach() const { return breach_; }
  const std::string& breachDetail() const { return detail_; }
  uint64_t consumed() const { return used_; }
  uint64_t ceiling() const { return maxBytes_; }
  std::chrono::milliseconds timeout() const { return timeout_; }
  std::chrono::milliseconds elapsed() const;

private:
  uint64_t maxBytes_;
  uint64_t used_ = 0;
  std::chrono::milliseconds timeout_;
  std::chrono::steady_clock::time_point start_;
  std::chrono::steady_clock::time_point deadline_;
  BreachKind breach_ = BreachKind::None;
  std::string detail_;
};

struct GuardOptions {
  uint64_t maxBytes = 1ull<<30;
  uint32_t timeoutMs = 5000;
  bool     isolate = false;              // run in a forked child
  uint64_t isolationMemoryBytes = 512ull<<20;
  uint32_t isolationGraceMs = 250;       // extra wait for the child's own report
};

struct GuardResult {
  std::vector<Finding> findings;
  BreachKind breach = BreachKind::None;
  bool   isolated = false;
  double elapsedMs = 0.0;
  uint64_t bytesProcessed = 0;
};

using GuardedFn = std::function<void(Budget&, FindingList&)>;

// Runs `fn` under the budget. Findings the validator emitted before a breach
// are kept and a resource-limit-exceeded finding is appended. Exceptions never
// escape: std::bad_alloc becomes a memory breach, other std::exception a
// validator-inconclusive finding.
GuardResult runGuarded(const std::string& validatorName, const GuardOptions& opt, const GuardedFn& fn);

} // namespace gup
