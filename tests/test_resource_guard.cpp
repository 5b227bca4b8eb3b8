#include "core/resource_guard.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <new>
#include <stdexcept>
#include <thread>
#include <vector>
#include <atomic>

using namespace gup;

namespace {

const Finding* findKind(const std::vector<Finding>& fs, const std::string& kind) {
  for (auto& f : fs) if (f.kind == kind) return &f;
  return nullptr;
}

void TestCleanRunPassesFindingsThrough() {
  GuardOptions opt;
  auto res = runGuarded("clean", opt, [](Budget& b, FindingList& out) {
    assert(b.charge(100));
    out.add(finding::kAppendedData, Severity::Low, "x");
  });
  assert(res.breach == BreachKind::None);
  assert(res.findings.size() == 1 && res.findings[0].kind == finding::kAppendedData);
  assert(res.bytesProcessed == 100);
}

void TestCooperativeHangStopsAtDeadline() {
  GuardOptions opt;
  opt.timeoutMs = 150;
  auto t0 = std::chrono::steady_clock::now();
  auto res = runGuarded("spinner", opt, [](Budget& b, FindingList& out) {
    out.add(finding::kMalformed, Severity::Low, "seen before the hang");
    while (b.checkpoint()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
  });
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
  assert(ms < 2000 && "guard returns shortly after the deadline");
  assert(res.breach == BreachKind::Timeout);
  assert(res.findings.size() == 2 && "earlier findings are kept");
  assert(res.findings[0].kind == finding::kMalformed);
  const Finding* f = findKind(res.findings, finding::kResourceLimit);
  assert(f && f->limit == limit::kTimeout);
}

void TestByteCeiling() {
  GuardOptions opt;
  opt.maxBytes = 1000;
  auto res = runGuarded("inflater", opt, [](Budget& b, FindingList&) {
    while (b.charge(64)) {}
  });
  assert(res.breach == BreachKind::Memory);
  const Finding* f = findKind(res.findings, finding::kResourceLimit);
  assert(f && f->limit == limit::kMemory && f->severity == Severity::High);
}

void TestExpansionTripIsFirstWins() {
  GuardOptions opt;
  auto res = runGuarded("zip", opt, [](Budget& b, FindingList&) {
    b.trip(BreachKind::Expansion, "ratio");
    b.trip(BreachKind::Timeout, "ignored");
    assert(!b.charge(1) && !b.checkpoint());
  });
  assert(res.breach == BreachKind::Expansion);
  const Finding* f = findKind(res.findings, finding::kResourceLimit);
  assert(f && f->limit == limit::kExpansion);
  assert(f->detail.find("ignored") == std::string::npos);
}

void TestExceptionsAreContained() {
  GuardOptions opt;
  auto oom = runGuarded("alloc", opt, [](Budget&, FindingList&) { throw std::bad_alloc(); });
  assert(oom.breach == BreachKind::Memory);

  auto bad = runGuarded("parser", opt, [](Budget&, FindingList&) { throw std::runtime_error("boom"); });
  assert(bad.breach == BreachKind::None);
  const Finding* f = findKind(bad.findings, finding::kInconclusive);
  assert(f && f->detail.find("boom") != std::string::npos);
}

void TestIsolatedHangIsKilled() {
  GuardOptions opt;
  opt.isolate = true;
  opt.timeoutMs = 200;
  opt.isolationGraceMs = 100;
  auto t0 = std::chrono::steady_clock::now();
  auto res = runGuarded("stuck", opt, [](Budget&, FindingList&) {
    // never reaches a checkpoint
    for (;;) std::this_thread::sleep_for(std::chrono::milliseconds(10));
  });
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
  assert(ms < 3000);
  assert(res.isolated);
  assert(res.breach == BreachKind::Timeout);
  const Finding* f = findKind(res.findings, finding::kResourceLimit);
  assert(f && f->limit == limit::kTimeout);
}

void TestIsolatedFindingsRoundTrip() {
  GuardOptions opt;
  opt.isolate = true;
  auto res = runGuarded("child", opt, [](Budget& b, FindingList& out) {
    assert(b.charge(10));
    out.add(finding::kPathTraversal, Severity::High, "../etc/passwd\twith tab");
  });
  assert(res.isolated && res.breach == BreachKind::None);
  assert(res.findings.size() == 1);
  assert(res.findings[0].detail == "../etc/passwd\twith tab");
  assert(res.findings[0].severity == Severity::High);
  assert(res.bytesProcessed == 10);
}

// Quick isolated runs on some threads must not be held up by slow isolated
// runs forked from other threads at the same time.
void TestConcurrentIsolatedRunsKeepTheirResults() {
  std::atomic<int> fastRuns{0}, fastTimeouts{0}, fastMissing{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 6; ++t) {
    workers.emplace_back([&, t] {
      for (int i = 0; i < 4; ++i) {
        GuardOptions opt;
        opt.isolate = true;
        if (t % 2 == 0) {
          opt.timeoutMs = 5000;
          auto res = runGuarded("slow", opt, [](Budget&, FindingList&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1200));
          });
          assert(res.breach == BreachKind::None);
        } else {
          opt.timeoutMs = 300;
          opt.isolationGraceMs = 100;
          auto res = runGuarded("fast", opt, [](Budget&, FindingList& out) {
            out.add(finding::kAppendedData, Severity::Low, "tail");
          });
          ++fastRuns;
          if (res.breach == BreachKind::Timeout) ++fastTimeouts;
          if (!findKind(res.findings, finding::kAppendedData)) ++fastMissing;
        }
      }
    });
  }
  for (auto& w : workers) w.join();
  assert(fastRuns == 12);
  assert(fastTimeouts == 0 && "a finished child is never reported as a timeout");
  assert(fastMissing == 0);
}

} // namespace

int main() {
  TestCleanRunPassesFindingsThrough();
  TestCooperativeHangStopsAtDeadline();
  TestByteCeiling();
  TestExpansionTripIsFirstWins();
  TestExceptionsAreContained();
  TestIsolatedHangIsKilled();
  TestIsolatedFindingsRoundTrip();
  TestConcurrentIsolatedRunsKeepTheirResults();
  std::cout << "resource guard tests ok\n";
  return 0;
}
