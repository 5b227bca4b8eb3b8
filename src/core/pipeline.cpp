// src/core/pipeline.cpp
#include "core/pipeline.hpp"
#include "core/hasher.hpp"
#include "core/policy_engine.hpp"
#include "core/sniffer.hpp"
#include "routing/router.hpp"
#include "validators/validator.hpp"
#include "log.h"

#include <algorithm>
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

namespace gup {

namespace {

using Clock = std::chrono::steady_clock;

double msSince(Clock::time_point t0){
  return std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
}

FileReport failed(FileReport r, const std::string& err){
  r.error = err;
  logEvent(r.file.identifier, "error", {{"error", err}}, LogLevel::Warn);
  return r;
}

} // namespace

FileReport inspectFile(ScanInput& input, const EffectivePolicy& policy){
  const Limits& limits = policy.limits;
  const auto t0 = Clock::now();

  FileReport r;
  r.generatedAt = rfc3339Now();
  InspectedFile& f = r.file;
  f.identifier = input.identifier;
  f.claimedExt = claimedExtension(input.identifier);

  if (!input.source) return failed(std::move(r), "no byte source");

  // Hash every byte; retain at most max_file_bytes for the validators.
  Sha256Hasher hasher;
  if (!hasher.ok()) return failed(std::move(r), hasher.error());
  std::vector<uint8_t> retained;
  std::vector<uint8_t> chunk(kReadChunkBytes);
  bool truncated = false;
  for (;;) {
    size_t got = 0;
    std::string err;
    if (!input.source->read(chunk.data(), chunk.size(), got, err)) return failed(std::move(r), err);
    if (got == 0) break;
    if (!hasher.update(chunk.data(), got)) return failed(std::move(r), hasher.error());
    f.sizeBytes += got;
    if (retained.size() < limits.maxFileBytes) {
      size_t keep = (size_t)std::min<uint64_t>(got, limits.maxFileBytes - retained.size());
      retained.insert(retained.end(), chunk.data(), chunk.data() + keep);
      if (keep < got) truncated = true;
    } else {
      truncated = true;
    }
  }
  std::string herr;
  if (!hasher.finish(f.sha256, herr)) return failed(std::move(r), herr);

  const auto tSniff = Clock::now();
  f.sniff = sniffBytes(retained.data(), std::min(retained.size(), kSniffPrefixBytes));
  FindingList pre;
  checkExtension(f.claimedExt, f.sniff, pre);
  r.timings.sniff = msSince(tSniff);
  logEvent(f.identifier, "sniffed", {{"mime", f.sniff.mediaType}, {"size", std::to_string(f.sizeBytes)},
                                     {"sha256", f.sha256}});

  const auto tValidate = Clock::now();
  RoutingDecision route = routeToValidator(f.sniff, !truncated);
  f.validator = route.handler;
  auto validator = makeValidator(route.kind);

  GuardOptions opt;
  opt.maxBytes = limits.maxBytesProcessed;
  const bool archive = route.kind == ValidatorKind::Archive;
  opt.timeoutMs = archive ? limits.timeoutArchiveMs : limits.timeoutFileMs;
  opt.isolate = archive && limits.isolateArchives;
  opt.isolationMemoryBytes = limits.isolationMemoryBytes;

  ValidationInput vin;
  vin.data = retained.data();
  vin.len = retained.size();
  vin.totalSize = f.sizeBytes;
  vin.sniff = &f.sniff;
  vin.identifier = f.identifier;

  GuardResult g = runGuarded(validator->name(), opt, [&](Budget& budget, FindingList& out){
    validator->validate(vin, limits, budget, out);
  });
  r.timings.validate = msSince(tValidate);

  f.findings = pre.release();
  f.findings.insert(f.findings.end(), g.findings.begin(), g.findings.end());
  f.severity = maxSeverity(f.findings);
  if (g.breach != BreachKind::None)
    logEvent(f.identifier, "breach", {{"limit", toString(g.breach)}, {"validator", f.validator},
                                      {"bytes", std::to_string(g.bytesProcessed)}}, LogLevel::Info);

  const auto tDecide = Clock::now();
  r.decision = decide(f, policy);
  r.timings.decide = msSince(tDecide);
  r.timings.total = msSince(t0);

  logEvent(f.identifier, "decided", {{"decision", toString(r.decision.outcome)},
                                     {"rule", r.decision.decidingRule ? *r.decision.decidingRule : "-"},
                                     {"findings", std::to_string(f.findings.size())}});
  return r;
}

bool NdjsonSink::write(const FileReport& r, std::string& err){
  out_ << toJson(r) << '\n';
  out_.flush();
  if (!out_) { err = "report write failed"; return false; }
  return true;
}

ScanRunner::ScanRunner(PolicyPtr policy, unsigned jobs)
  : policy_(std::move(policy)), jobs_(jobs == 0 ? 1 : jobs) {}

ScanRunner::~ScanRunner(){ stop(); }

void ScanRunner::start(){
  if (!threads_.empty()) return;
  stop_ = false;
  for (unsigned i = 0; i < jobs_; ++i) threads_.emplace_back(&ScanRunner::loop_, this);
}

void ScanRunner::stop(){
  stop_ = true;
  cv_.notify_all();
  for (auto& t : threads_) if (t.joinable()) t.join();
  threads_.clear();
}

void ScanRunner::loop_(){
  while (!stop_) {
    Job cur;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [&]{ return stop_ || !q_.empty(); });
      if (stop_) break;
      cur = std::move(q_.front()); q_.pop_front();
    }

    FileReport rep;
    try {
      rep = inspectFile(cur.input, *policy_);
    } catch (const std::exception& ex) {
      rep = FileReport{};
      rep.file.identifier = cur.input.identifier;
      rep.generatedAt = rfc3339Now();
      rep.error = std::string("inspection failed: ") + ex.what();
      LOGE(cur.input.identifier + ": " + rep.error);
    }
    {
      std::lock_guard<std::mutex> lk(doneMu_);
      done_.emplace(cur.index, std::move(rep));
    }
    doneCv_.notify_one();
  }
}

bool ScanRunner::run(std::vector<ScanInput> inputs, ReportSink& sink, FailOn failOn,
                     SummaryReport& summary, std::string& err){
  const size_t total = inputs.size();
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (size_t i = 0; i < total; ++i) q_.push_back(Job{i, std::move(inputs[i])});
  }
  LOGI("scan: " + std::to_string(total) + " input(s), " + std::to_string(jobs_) + " worker(s)");
  start();
  cv_.notify_all();

  SummaryAccumulator acc;
  bool sinkOk = true;
  for (size_t next = 0; next < total; ++next) {
    FileReport rep;
    {
      std::unique_lock<std::mutex> lk(doneMu_);
      doneCv_.wait(lk, [&]{ return done_.count(next) != 0; });
      auto it = done_.find(next);
      rep = std::move(it->second);
      done_.erase(it);
    }
    acc.add(rep);
    if (sinkOk && !sink.write(rep, err)) {
      LOGE("scan: " + err);
      sinkOk = false;
    }
  }
  stop();

  summary = acc.finalize(failOn);
  LOGI("scan: decided=" + std::to_string(summary.decided) +
       " errors=" + std::to_string(summary.operationalErrors) +
       " exit=" + std::to_string(summary.exitStatus));
  return sinkOk;
}

std::vector<ScanInput> collectInputs(const std::vector<std::string>& paths){
  std::vector<ScanInput> out;
  for (const auto& p : paths) {
    std::error_code ec;
    if (!fs::is_directory(p, ec)) {
      out.push_back(ScanInput{p, std::make_unique<FileByteSource>(p)});
      continue;
    }
    std::vector<std::string> found;
    fs::recursive_directory_iterator it(p, fs::directory_options::skip_permission_denied, ec), end;
    if (ec) {
      LOGW("discovery: cannot list " + p + ": " + ec.message());
      out.push_back(ScanInput{p, std::make_unique<FileByteSource>(p)});
      continue;
    }
    for (; it != end; it.increment(ec)) {
      if (ec) {
        LOGW("discovery: " + p + ": " + ec.message());
        break;
      }
      std::error_code fec;
      if (it->is_regular_file(fec)) found.push_back(it->path().string());
    }
    std::sort(found.begin(), found.end());
    for (auto& f : found) out.push_back(ScanInput{f, std::make_unique<FileByteSource>(f)});
  }
  return out;
}

} // namespace gup
