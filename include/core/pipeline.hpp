#pragma once
#include "core/byte_source.hpp"
#include "core/policy.hpp"
#include "core/report.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace gup {

constexpr size_t kReadChunkBytes = 64 * 1024;

// sniff -> hash -> validate (guarded) -> decide for one input. Read errors
// produce a report with `error` set; nothing else fails.
FileReport inspectFile(ScanInput& input, const EffectivePolicy& policy);

// Persistence collaborator for per-file records.
class ReportSink {
public:
  virtual ~ReportSink() = default;
  virtual bool write(const FileReport& r, std::string& err) = 0;
};

class NdjsonSink : public ReportSink {
public:
  explicit NdjsonSink(std::ostream& out) : out_(out) {}
  bool write(const FileReport& r, std::string& err) override;

private:
  std::ostream& out_;
};

// Keeps reports in memory (tests, library callers).
class CollectingSink : public ReportSink {
public:
  bool write(const FileReport& r, std::string&) override { reports.push_back(r); return true; }
  std::vector<FileReport> reports;
};

// Fixed-size worker pool. Workers only inspect; the thread calling run() is
// the single writer of the summary and emits reports in input order.
class ScanRunner {
public:
  ScanRunner(PolicyPtr policy, unsigned jobs);
  ~ScanRunner();
  ScanRunner(const ScanRunner&) = delete;
  ScanRunner& operator=(const ScanRunner&) = delete;

  // Returns false only when the sink fails; the summary is finalized either way.
  bool run(std::vector<ScanInput> inputs, ReportSink& sink, FailOn failOn,
           SummaryReport& summary, std::string& err);

private:
  struct Job {
    size_t index = 0;
    ScanInput input;
  };

  void start();
  void stop();
  void loop_();

  PolicyPtr policy_;
  unsigned jobs_;

  std::deque<Job> q_;
  std::mutex mu_;
  std::condition_variable cv_;
  std::vector<std::thread> threads_;
  std::atomic<bool> stop_{false};

  std::map<size_t, FileReport> done_;
  std::mutex doneMu_;
  std::condition_variable doneCv_;
};

// Discovery collaborator: files as given, directories walked recursively and
// sorted. A path that cannot be listed still yields an input, whose read fails.
std::vector<ScanInput> collectInputs(const std::vector<std::string>& paths);

} // namespace gup
