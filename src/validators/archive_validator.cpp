// src/validators/archive_validator.cpp
#include "validators/validator.hpp"
#include "readers/IArchiveReader.hpp"
#include "log.h"

#include <cctype>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace gup {

namespace {

// Ratios are only meaningful once a few blocks have been inflated; tiny
// highly compressible entries would otherwise trip the ceiling.
constexpr uint64_t kRatioFloorBytes = 64 * 1024;
constexpr size_t   kNamesPerFinding = 5;

bool zipMagic(const uint8_t* p, size_t n){
  return n >= 4 && p[0] == 'P' && p[1] == 'K' &&
         ((p[2] == 3 && p[3] == 4) || (p[2] == 5 && p[3] == 6));
}

// Entry names that would escape the extraction root.
bool isTraversalName(const std::string& name){
  if (name.empty()) return false;
  if (name[0] == '/' || name[0] == '\\') return true;
  if (name.size() >= 2 && std::isalpha((unsigned char)name[0]) && name[1] == ':') return true;
  if (name.find('\\') != std::string::npos) return true;
  size_t start = 0;
  while (start <= name.size()) {
    size_t end = name.find('/', start);
    if (end == std::string::npos) end = name.size();
    if (name.compare(start, end - start, "..") == 0 && end - start == 2) return true;
    start = end + 1;
  }
  return false;
}

double ratioOf(uint64_t inflated, uint64_t packed){
  return (double)inflated / (double)(packed == 0 ? 1 : packed);
}

std::string fmtRatio(double r){
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", r);
  return buf;
}

struct NameTally {
  uint64_t count = 0;
  std::vector<std::string> names;
  void add(const std::string& n){ ++count; if (names.size() < kNamesPerFinding) names.push_back(n); }
  std::string describe() const {
    std::string s;
    for (auto& n : names) { if (!s.empty()) s += ", "; s += n; }
    if (count > names.size()) s += " (+" + std::to_string(count - names.size()) + " more)";
    return s;
  }
};

class ArchiveWalk {
public:
  ArchiveWalk(const Limits& limits, Budget& budget, FindingList& out)
    : limits_(limits), budget_(budget), out_(out) {}

  void inspect(const uint8_t* data, size_t len, const std::string& prefix, uint32_t level){
    std::string err;
    auto reader = makeZipReader();
    if (!reader || !reader->open(data, len, err)) {
      out_.add(finding::kMalformed, Severity::Medium, label(prefix) + err);
      return;
    }

    // Central directory sizes first: a lying header can still be caught later.
    const uint64_t declared = reader->declaredTotal();
    if (declared > kRatioFloorBytes && ratioOf(declared, len) > limits_.maxExpansionRatio) {
      budget_.trip(BreachKind::Expansion,
                   label(prefix) + "declared expansion " + fmtRatio(ratioOf(declared, len)) + "x exceeds " +
                   fmtRatio(limits_.maxExpansionRatio) + "x (" + std::to_string(declared) + " from " +
                   std::to_string(len) + " bytes)");
      reader->close();
      return;
    }

    uint64_t archInflated = 0;
    while (!budget_.tripped()) {
      if (!budget_.checkpoint()) break;
      EntryInfo ei{};
      if (!reader->nextEntry(ei, err)) {
        if (!err.empty()) out_.add(finding::kMalformed, Severity::Medium, label(prefix) + err);
        break;
      }
      if (++entries_ > limits_.maxEntries) {
        out_.add(finding::kExcessiveEntries, Severity::Medium,
                 "more than " + std::to_string(limits_.maxEntries) + " entries; remaining entries not inspected");
        break;
      }
      const std::string shown = prefix + ei.name;

      if (limits_.preventPathTraversal && isTraversalName(ei.name)) {
        traversal_.add(shown);
        reader->skipEntry();
        continue;
      }
      if (ei.isSymlink && !limits_.allowSymlink) {
        symlinks_.add(shown);
        reader->skipEntry();
        continue;
      }
      if (ei.isEncrypted) {
        encrypted_.add(shown);
        reader->skipEntry();
        continue;
      }
      if (ei.isDir) { reader->skipEntry(); continue; }

      if (ei.size > limits_.maxEntryBytes) {
        budget_.trip(BreachKind::Expansion,
                     "entry " + shown + " declares " + std::to_string(ei.size) + " bytes (max " +
                     std::to_string(limits_.maxEntryBytes) + ")");
        break;
      }
      if (ei.size > kRatioFloorBytes && ratioOf(ei.size, ei.compressedSize) > limits_.maxExpansionRatio) {
        budget_.trip(BreachKind::Expansion,
                     "entry " + shown + " declares expansion " + fmtRatio(ratioOf(ei.size, ei.compressedSize)) +
                     "x (max " + fmtRatio(limits_.maxExpansionRatio) + "x)");
        break;
      }

      uint64_t got = 0;
      bool decided = false, nested = false, cutShort = false;
      std::vector<uint8_t> inner;
      auto sink = [&](const uint8_t* p, size_t k) -> bool {
        if (!budget_.charge(k) || !budget_.checkpoint()) return false;
        got += k;
        archInflated += k;
        if (got > limits_.maxEntryBytes) {
          budget_.trip(BreachKind::Expansion,
                       "entry " + shown + " inflated past " + std::to_string(limits_.maxEntryBytes) + " bytes");
          return false;
        }
        if (got > kRatioFloorBytes && ratioOf(got, ei.compressedSize) > limits_.maxExpansionRatio) {
          budget_.trip(BreachKind::Expansion,
                       "entry " + shown + " expanded " + fmtRatio(ratioOf(got, ei.compressedSize)) +
                       "x (max " + fmtRatio(limits_.maxExpansionRatio) + "x), stopped after " +
                       std::to_string(got) + " bytes");
          return false;
        }
        if (archInflated > kRatioFloorBytes && ratioOf(archInflated, len) > limits_.maxExpansionRatio) {
          budget_.trip(BreachKind::Expansion,
                       label(prefix) + "archive expanded " + fmtRatio(ratioOf(archInflated, len)) +
                       "x (max " + fmtRatio(limits_.maxExpansionRatio) + "x), stopped after " +
                       std::to_string(archInflated) + " bytes");
          return false;
        }
        if (!decided) {
          decided = true;
          nested = zipMagic(p, k);
          if (nested && level + 1 > limits_.maxDepth) {
            out_.add(finding::kNestedDepth, Severity::High,
                     "archive " + shown + " nested at depth " + std::to_string(level + 1) +
                     " (max " + std::to_string(limits_.maxDepth) + ")");
            nested = false;
            cutShort = true;
            return false;
          }
        }
        if (nested) inner.insert(inner.end(), p, p + k);
        return true;
      };

      if (!reader->readEntry(sink, err)) {
        out_.add(finding::kMalformed, Severity::Medium, "entry " + shown + ": " + err);
        err.clear();
        continue;
      }
      if (budget_.tripped()) break;
      if (!cutShort && got != ei.size)
        out_.add(finding::kMalformed, Severity::Low,
                 "entry " + shown + " declares " + std::to_string(ei.size) + " bytes but holds " + std::to_string(got));

      if (nested && !inner.empty()) {
        logEvent("archive", "nested", {{"entry", shown}, {"level", std::to_string(level + 1)},
                                       {"bytes", std::to_string(inner.size())}});
        inspect(inner.data(), inner.size(), shown + ">", level + 1);
      }
    }
    reader->close();
  }

  // Aggregated per-name findings, emitted once after the walk.
  void flush(){
    if (traversal_.count)
      out_.add(finding::kPathTraversal, Severity::High,
               std::to_string(traversal_.count) + " entry name(s) escape the extraction root: " + traversal_.describe());
    if (symlinks_.count)
      out_.add(finding::kSymlinkEntry, Severity::High,
               std::to_string(symlinks_.count) + " symlink entry(ies): " + symlinks_.describe());
    if (encrypted_.count)
      out_.add(finding::kEncryptedEntry, Severity::Medium,
               std::to_string(encrypted_.count) + " encrypted entry(ies) not inspected: " + encrypted_.describe());
  }

private:
  static std::string label(const std::string& prefix){
    return prefix.empty() ? std::string() : prefix.substr(0, prefix.size() - 1) + ": ";
  }

  const Limits& limits_;
  Budget& budget_;
  FindingList& out_;
  uint64_t entries_ = 0;
  NameTally traversal_, symlinks_, encrypted_;
};

class ArchiveValidator : public IValidator {
public:
  ValidatorKind kind() const override { return ValidatorKind::Archive; }
  const char* name() const override { return "archive"; }

  void validate(const ValidationInput& in, const Limits& limits,
                Budget& budget, FindingList& out) const override {
    const std::string mt = in.sniff ? in.sniff->mediaType : std::string();
    if (mt != "application/zip") {
      out.add(finding::kInconclusive, Severity::Medium,
              "archive: " + (in.sniff ? in.sniff->label : mt) + " containers are not expanded");
      return;
    }
    if (!budget.charge(in.len)) return;
    ArchiveWalk walk(limits, budget, out);
    walk.inspect(in.data, in.len, "", 0);
    walk.flush();
  }
};

} // namespace

std::unique_ptr<IValidator> makeArchiveValidator() {
  return std::make_unique<ArchiveValidator>();
}

} // namespace gup
