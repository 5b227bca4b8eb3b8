#include "core/config.hpp"
#include "core/pipeline.hpp"
#include "core/report.hpp"

#include <zip.h>

#include <cassert>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

using namespace gup;
namespace fs = std::filesystem;

namespace {

using Bytes = std::vector<uint8_t>;

// Simulated I/O failure after the first chunk.
class FailingByteSource : public ByteSource {
public:
  bool read(uint8_t* buffer, size_t maxLen, size_t& got, std::string& err) override {
    got = 0;
    if (calls_++ == 0 && maxLen >= 4) {
      std::memcpy(buffer, "%PDF", 4);
      got = 4;
      return true;
    }
    err = "simulated read error";
    return false;
  }

private:
  int calls_ = 0;
};

ScanInput memoryInput(const std::string& id, Bytes data) {
  return ScanInput{id, std::make_unique<MemoryByteSource>(std::move(data))};
}

ScanInput textInput(const std::string& id, const std::string& text) {
  return ScanInput{id, std::make_unique<MemoryByteSource>(text)};
}

PolicyPtr policyFrom(const std::string& yaml) {
  PolicyLayer layer;
  std::string err;
  bool ok = parsePolicyYaml(yaml, "test-policy", layer, err);
  if (!ok) std::cerr << err << "\n";
  assert(ok);
  return resolvePolicy(layer);
}

Bytes zerosZip(size_t n) {
  fs::path path = fs::temp_directory_path() / "gup_pipeline_bomb.zip";
  Bytes payload(n, 0);
  int errp = 0;
  zip_t* za = zip_open(path.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE, &errp);
  assert(za);
  zip_source_t* src = zip_source_buffer(za, payload.data(), payload.size(), 0);
  assert(src);
  assert(zip_file_add(za, "zeros.bin", src, ZIP_FL_ENC_UTF_8) >= 0);
  assert(zip_close(za) == 0);
  std::ifstream f(path, std::ios::binary);
  Bytes out((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  fs::remove(path);
  return out;
}

Bytes elfBytes() {
  Bytes b = {0x7F, 'E', 'L', 'F', 2, 1, 1, 0};
  b.resize(512, 0);
  return b;
}

const char* kPolicy = R"(
defaults:
  max_size_mb: 10
  default_decision: allow
limits:
  zip_bomb: { max_expansion_ratio: 50 }
rules:
  deny-executables:
    when: { media_type: "application/x-executable" }
    decision: deny
  warn-bombs:
    when: { finding_kind: "resource-limit-exceeded" }
    decision: warn
)";

void TestPlainTextIsAllowed() {
  ScanInput in = textInput("notes.txt", "hello, 10b");
  FileReport r = inspectFile(in, *defaultPolicy());
  assert(r.ok());
  assert(r.file.sizeBytes == 10);
  assert(r.file.sniff.mediaType == "text/plain");
  assert(r.file.findings.empty());
  assert(!r.file.severity);
  assert(r.decision.outcome == Decision::Allow);
  assert(r.decision.triggered.empty() && !r.decision.decidingRule);
  assert(r.file.sha256.size() == 64);
}

void TestExecutableIsDenied() {
  auto policy = policyFrom(kPolicy);
  ScanInput in = memoryInput("tool.bin", elfBytes());
  FileReport r = inspectFile(in, *policy);
  assert(r.file.sniff.mediaType == "application/x-executable");
  assert(r.decision.outcome == Decision::Deny);
  assert(r.decision.triggered == std::vector<std::string>{"deny-executables"});
  assert(*r.decision.decidingRule == "deny-executables");

  // the claimed name does not matter
  ScanInput disguised = memoryInput("holiday.jpg", elfBytes());
  FileReport d = inspectFile(disguised, *policy);
  assert(d.decision.outcome == Decision::Deny);
  bool mismatch = false;
  for (auto& f : d.file.findings) if (f.kind == finding::kExtensionMismatch) mismatch = true;
  assert(mismatch);
}

void TestZipBombIsWarned(bool isolate) {
  auto base = policyFrom(kPolicy);
  EffectivePolicy p = *base;
  p.limits.isolateArchives = isolate;
  ScanInput in = memoryInput("bomb.zip", zerosZip(256 * 1024));
  FileReport r = inspectFile(in, p);
  assert(r.ok());
  assert(r.file.validator == "archive");
  const Finding* hit = nullptr;
  for (auto& f : r.file.findings) if (f.kind == finding::kResourceLimit) hit = &f;
  assert(hit && hit->limit == limit::kExpansion);
  assert(r.decision.outcome == Decision::Warn);
  assert(*r.decision.decidingRule == "warn-bombs");
}

void TestTruncatedInputOnlyGetsSizeCheck() {
  EffectivePolicy p = *defaultPolicy();
  p.limits.maxFileBytes = 100;
  std::string doc = "%PDF-1.4\n" + std::string(1000, 'x');
  ScanInput in = textInput("big.pdf", doc);
  FileReport r = inspectFile(in, p);
  assert(r.file.sizeBytes == doc.size() && "size covers every byte read");
  assert(r.file.validator == "generic");
  assert(r.file.findings.size() == 1 && r.file.findings[0].kind == finding::kOversized);
}

void TestRunWithOneUnreadableFile() {
  auto policy = policyFrom(kPolicy);
  std::vector<ScanInput> inputs;
  inputs.push_back(textInput("a.txt", "first file"));
  inputs.push_back(ScanInput{"broken.pdf", std::make_unique<FailingByteSource>()});
  inputs.push_back(textInput("c.txt", "third file"));

  ScanRunner runner(policy, 2);
  CollectingSink sink;
  SummaryReport s;
  std::string err;
  assert(runner.run(std::move(inputs), sink, FailOn::Deny, s, err));
  assert(s.totalFiles == 3);
  assert(s.decided == 2);
  assert(s.operationalErrors == 1);
  assert(s.exitStatus == 2);

  assert(sink.reports.size() == 3);
  assert(sink.reports[1].file.identifier == "broken.pdf" && !sink.reports[1].ok());
  assert(sink.reports[1].error.find("simulated read error") != std::string::npos);
}

void TestOutputKeepsInputOrder() {
  auto policy = policyFrom(kPolicy);
  std::vector<ScanInput> inputs;
  for (int i = 0; i < 40; ++i) {
    if (i % 7 == 3) inputs.push_back(memoryInput("exe" + std::to_string(i), elfBytes()));
    else inputs.push_back(textInput("t" + std::to_string(i) + ".txt", std::string(100 + i * 50, 'a')));
  }
  ScanRunner runner(policy, 4);
  std::ostringstream out;
  NdjsonSink sink(out);
  SummaryReport s;
  std::string err;
  assert(runner.run(std::move(inputs), sink, FailOn::Warn, s, err));

  std::istringstream lines(out.str());
  std::string line;
  int i = 0;
  while (std::getline(lines, line)) {
    std::string want = (i % 7 == 3) ? "\"file\":\"exe" + std::to_string(i) + "\""
                                    : "\"file\":\"t" + std::to_string(i) + ".txt\"";
    assert(line.find(want) != std::string::npos);
    ++i;
  }
  assert(i == 40);
  assert(s.byDecision[Decision::Deny] == 6);
  assert(s.exitStatus == 1);
}

void TestDiscovery() {
  fs::path dir = fs::temp_directory_path() / "gup_discovery_test";
  fs::remove_all(dir);
  fs::create_directories(dir / "sub");
  { std::ofstream f(dir / "b.txt"); f << "b"; }
  { std::ofstream f(dir / "sub" / "a.txt"); f << "a"; }
  { std::ofstream f(dir / "a.txt"); f << "a"; }

  auto inputs = collectInputs({dir.string(), (dir / "missing.bin").string()});
  assert(inputs.size() == 4);
  assert(inputs[0].identifier == (dir / "a.txt").string());
  assert(inputs[1].identifier == (dir / "b.txt").string());
  assert(inputs[2].identifier == (dir / "sub" / "a.txt").string());

  FileReport missing = inspectFile(inputs[3], *defaultPolicy());
  assert(!missing.ok() && "unreadable path is an operational error");
  FileReport present = inspectFile(inputs[0], *defaultPolicy());
  assert(present.ok() && present.file.sizeBytes == 1);
  fs::remove_all(dir);
}

} // namespace

int main() {
  TestPlainTextIsAllowed();
  TestExecutableIsDenied();
  TestZipBombIsWarned(false);
  TestZipBombIsWarned(true);
  TestTruncatedInputOnlyGetsSizeCheck();
  TestRunWithOneUnreadableFile();
  TestOutputKeepsInputOrder();
  TestDiscovery();
  std::cout << "pipeline tests ok\n";
  return 0;
}
