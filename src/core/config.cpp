#include "core/config.hpp"
#include "log.h"
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <fstream>
#include <initializer_list>
#include <set>
#include <sstream>

namespace gup {

namespace {

std::string lower(std::string s){
  for (auto& c : s) c = (char)std::tolower((unsigned char)c);
  return s;
}

bool onlyKeys(const YAML::Node& m, std::initializer_list<const char*> keys, const std::string& where, std::string& err){
  for (auto it = m.begin(); it != m.end(); ++it) {
    const std::string k = it->first.as<std::string>();
    bool known = false;
    for (const char* ok : keys) if (k == ok) { known = true; break; }
    if (!known) { err = where + ": unknown key '" + k + "'"; return false; }
  }
  return true;
}

bool requireMap(const YAML::Node& n, const std::string& where, std::string& err){
  if (n.IsMap()) return true;
  err = where + ": expected a mapping";
  return false;
}

bool readU64(const YAML::Node& m, const char* key, const std::string& where,
             std::optional<uint64_t>& out, std::string& err){
  const YAML::Node v = m[key];
  if (!v) return true;
  const std::string s = v.IsScalar() ? v.Scalar() : std::string();
  if (s.empty() || s.size() > 19 || s.find_first_not_of("0123456789") != std::string::npos) {
    err = where + "." + key + ": expected a non-negative integer";
    return false;
  }
  out = std::stoull(s);
  return true;
}

bool readU32(const YAML::Node& m, const char* key, const std::string& where,
             std::optional<uint32_t>& out, std::string& err, bool positive = false){
  std::optional<uint64_t> v;
  if (!readU64(m, key, where, v, err)) return false;
  if (!v) return true;
  if (*v > UINT_MAX) { err = where + "." + key + ": value too large"; return false; }
  if (positive && *v == 0) { err = where + "." + key + ": must be positive"; return false; }
  out = (uint32_t)*v;
  return true;
}

bool readPositive(const YAML::Node& m, const char* key, const std::string& where,
                  std::optional<double>& out, std::string& err){
  const YAML::Node v = m[key];
  if (!v) return true;
  double d = v.as<double>();
  if (!(d > 0.0)) { err = where + "." + key + ": must be positive"; return false; }
  out = d;
  return true;
}

void readBool(const YAML::Node& m, const char* key, std::optional<bool>& out){
  const YAML::Node v = m[key];
  if (v) out = v.as<bool>();
}

bool readDecision(const YAML::Node& v, const std::string& where, Decision& out, std::string& err){
  const std::string s = v.IsScalar() ? v.Scalar() : std::string();
  if (!parseDecision(s, out)) { err = where + ": unknown decision '" + s + "' (allow|warn|deny)"; return false; }
  return true;
}

// A scalar or a sequence of scalars.
bool readStringList(const YAML::Node& v, const std::string& where, std::vector<std::string>& out, std::string& err){
  out.clear();
  if (v.IsScalar()) { out.push_back(v.Scalar()); return true; }
  if (v.IsSequence()) {
    for (const auto& item : v) {
      if (!item.IsScalar()) { err = where + ": expected a list of strings"; return false; }
      out.push_back(item.Scalar());
    }
    return true;
  }
  err = where + ": expected a string or a list of strings";
  return false;
}

bool parseDefaults(const YAML::Node& n, DefaultsLayer& d, std::string& err){
  const std::string w = "defaults";
  if (!requireMap(n, w, err)) return false;
  if (!onlyKeys(n, {"max_size_mb","max_size_bytes","default_decision","on_inconclusive","fail_on",
                    "allow_types","deny_types"}, w, err)) return false;

  std::optional<uint64_t> mb, bytes;
  if (!readU64(n, "max_size_mb", w, mb, err) || !readU64(n, "max_size_bytes", w, bytes, err)) return false;
  if (mb && bytes) { err = w + ": use either max_size_mb or max_size_bytes"; return false; }
  if (mb) {
    if (*mb == 0 || *mb > (UINT64_MAX >> 20)) { err = w + ".max_size_mb: out of range"; return false; }
    d.maxSizeBytes = *mb << 20;
  }
  if (bytes) {
    if (*bytes == 0) { err = w + ".max_size_bytes: must be positive"; return false; }
    d.maxSizeBytes = bytes;
  }
  if (auto v = n["default_decision"]) {
    Decision dec;
    if (!readDecision(v, w + ".default_decision", dec, err)) return false;
    d.defaultDecision = dec;
  }
  if (auto v = n["on_inconclusive"]) {
    Decision dec;
    if (!readDecision(v, w + ".on_inconclusive", dec, err)) return false;
    d.onInconclusive = dec;
  }
  if (auto v = n["fail_on"]) {
    FailOn f;
    const std::string s = v.IsScalar() ? v.Scalar() : std::string();
    if (!parseFailOn(s, f)) { err = w + ".fail_on: unknown threshold '" + s + "' (warn|deny|error)"; return false; }
    d.failOn = f;
  }
  std::vector<std::string> list;
  if (auto v = n["allow_types"]) {
    if (!readStringList(v, w + ".allow_types", list, err)) return false;
    d.allowTypes = list;
  }
  if (auto v = n["deny_types"]) {
    if (!readStringList(v, w + ".deny_types", list, err)) return false;
    d.denyTypes = list;
  }
  return true;
}

bool parseLimits(const YAML::Node& n, LimitsLayer& l, std::string& err){
  if (!requireMap(n, "limits", err)) return false;
  if (!onlyKeys(n, {"recursion","size","zip_bomb","timeouts","entropy","pdf","image","fs_safety","isolation"},
                "limits", err)) return false;

  if (auto r = n["recursion"]) {
    const std::string w = "limits.recursion";
    if (!requireMap(r, w, err) || !onlyKeys(r, {"max_depth","max_entries"}, w, err)) return false;
    if (!readU32(r, "max_depth", w, l.maxDepth, err)) return false;
    if (!readU32(r, "max_entries", w, l.maxEntries, err, true)) return false;
  }
  if (auto s = n["size"]) {
    const std::string w = "limits.size";
    if (!requireMap(s, w, err) ||
        !onlyKeys(s, {"max_file_bytes","max_bytes_processed","max_entry_bytes"}, w, err)) return false;
    if (!readU64(s, "max_file_bytes", w, l.maxFileBytes, err)) return false;
    if (!readU64(s, "max_bytes_processed", w, l.maxBytesProcessed, err)) return false;
    if (!readU64(s, "max_entry_bytes", w, l.maxEntryBytes, err)) return false;
    if ((l.maxFileBytes && *l.maxFileBytes == 0) || (l.maxBytesProcessed && *l.maxBytesProcessed == 0) ||
        (l.maxEntryBytes && *l.maxEntryBytes == 0)) {
      err = w + ": byte limits must be positive";
      return false;
    }
  }
  if (auto z = n["zip_bomb"]) {
    const std::string w = "limits.zip_bomb";
    if (!requireMap(z, w, err) || !onlyKeys(z, {"max_expansion_ratio"}, w, err)) return false;
    if (!readPositive(z, "max_expansion_ratio", w, l.maxExpansionRatio, err)) return false;
  }
  if (auto t = n["timeouts"]) {
    const std::string w = "limits.timeouts";
    if (!requireMap(t, w, err) || !onlyKeys(t, {"per_file_ms","per_archive_ms"}, w, err)) return false;
    if (!readU32(t, "per_file_ms", w, l.timeoutFileMs, err, true)) return false;
    if (!readU32(t, "per_archive_ms", w, l.timeoutArchiveMs, err, true)) return false;
  }
  if (auto e = n["entropy"]) {
    const std::string w = "limits.entropy";
    if (!requireMap(e, w, err) || !onlyKeys(e, {"threshold","window","step","max_regions"}, w, err)) return false;
    if (!readPositive(e, "threshold", w, l.entropyThreshold, err)) return false;
    if (l.entropyThreshold && *l.entropyThreshold > 8.0) { err = w + ".threshold: must not exceed 8 bits/byte"; return false; }
    if (!readU32(e, "window", w, l.entropyWindow, err, true)) return false;
    if (!readU32(e, "step", w, l.entropyStep, err, true)) return false;
    if (!readU32(e, "max_regions", w, l.maxEntropyRegions, err)) return false;
  }
  if (auto p = n["pdf"]) {
    const std::string w = "limits.pdf";
    if (!requireMap(p, w, err) ||
        !onlyKeys(p, {"max_objects","max_pages","max_filter_chain","max_decode_ratio"}, w, err)) return false;
    if (!readU32(p, "max_objects", w, l.pdfMaxObjects, err)) return false;
    if (!readU32(p, "max_pages", w, l.pdfMaxPages, err)) return false;
    if (!readU32(p, "max_filter_chain", w, l.pdfMaxFilterChain, err)) return false;
    if (!readPositive(p, "max_decode_ratio", w, l.pdfMaxDecodeRatio, err)) return false;
  }
  if (auto i = n["image"]) {
    const std::string w = "limits.image";
    if (!requireMap(i, w, err) || !onlyKeys(i, {"max_pixels","max_frames"}, w, err)) return false;
    if (!readU64(i, "max_pixels", w, l.imageMaxPixels, err)) return false;
    if (!readU32(i, "max_frames", w, l.imageMaxFrames, err)) return false;
  }
  if (auto f = n["fs_safety"]) {
    const std::string w = "limits.fs_safety";
    if (!requireMap(f, w, err) || !onlyKeys(f, {"prevent_path_traversal","allow_symlink"}, w, err)) return false;
    readBool(f, "prevent_path_traversal", l.preventPathTraversal);
    readBool(f, "allow_symlink", l.allowSymlink);
  }
  if (auto iso = n["isolation"]) {
    const std::string w = "limits.isolation";
    if (!requireMap(iso, w, err) || !onlyKeys(iso, {"archives","memory_mb"}, w, err)) return false;
    readBool(iso, "archives", l.isolateArchives);
    std::optional<uint64_t> mb;
    if (!readU64(iso, "memory_mb", w, mb, err)) return false;
    if (mb) {
      if (*mb == 0 || *mb > (UINT64_MAX >> 20)) { err = w + ".memory_mb: out of range"; return false; }
      l.isolationMemoryBytes = *mb << 20;
    }
  }
  return true;
}

bool parseRule(const std::string& id, const YAML::Node& n, PolicyRule& r, std::string& err){
  const std::string w = "rules." + id;
  if (id.empty()) { err = "rules: empty rule id"; return false; }
  if (id.rfind(rule_id::kReservedPrefix, 0) == 0) {
    err = w + ": ids starting with '" + std::string(rule_id::kReservedPrefix) + "' are reserved";
    return false;
  }
  if (!requireMap(n, w, err) || !onlyKeys(n, {"id","description","when","decision"}, w, err)) return false;
  r.id = id;
  if (auto d = n["description"]) r.description = d.as<std::string>();
  const YAML::Node dec = n["decision"];
  if (!dec) { err = w + ": missing decision"; return false; }
  if (!readDecision(dec, w + ".decision", r.decision, err)) return false;

  const YAML::Node when = n["when"];
  if (!when || when.IsNull() || (when.IsMap() && when.size() == 0)) { err = w + ": empty 'when'"; return false; }
  const std::string ww = w + ".when";
  if (!requireMap(when, ww, err) ||
      !onlyKeys(when, {"media_type","size_over","size_under","finding_kind","min_finding_severity","sha256"}, ww, err))
    return false;

  RulePredicate& p = r.when;
  if (auto v = when["media_type"]) { if (!readStringList(v, ww + ".media_type", p.mediaTypes, err)) return false; }
  if (!readU64(when, "size_over", ww, p.sizeOver, err)) return false;
  if (!readU64(when, "size_under", ww, p.sizeUnder, err)) return false;
  if (auto v = when["finding_kind"]) { if (!readStringList(v, ww + ".finding_kind", p.findingKinds, err)) return false; }
  if (auto v = when["min_finding_severity"]) {
    Severity s;
    const std::string t = v.IsScalar() ? v.Scalar() : std::string();
    if (!parseSeverity(t, s)) { err = ww + ".min_finding_severity: unknown severity '" + t + "'"; return false; }
    p.minFindingSeverity = s;
  }
  if (auto v = when["sha256"]) {
    if (!readStringList(v, ww + ".sha256", p.sha256, err)) return false;
    for (auto& h : p.sha256) {
      h = lower(h);
      if (h.size() != 64 || h.find_first_not_of("0123456789abcdef") != std::string::npos) {
        err = ww + ".sha256: '" + h + "' is not a hex SHA-256 digest";
        return false;
      }
    }
  }
  if (p.empty()) { err = w + ": empty 'when'"; return false; }
  return true;
}

bool parseRules(const YAML::Node& n, std::map<std::string, PolicyRule>& rules, std::string& err){
  std::set<std::string> seen;
  auto add = [&](const std::string& id, const YAML::Node& body) -> bool {
    if (!seen.insert(id).second) { err = "rules: duplicate rule id '" + id + "'"; return false; }
    PolicyRule r;
    if (!parseRule(id, body, r, err)) return false;
    rules[id] = r;
    return true;
  };

  if (n.IsMap()) {
    for (auto it = n.begin(); it != n.end(); ++it)
      if (!add(it->first.as<std::string>(), it->second)) return false;
    return true;
  }
  if (n.IsSequence()) {
    for (const auto& item : n) {
      if (!item.IsMap() || !item["id"]) { err = "rules: list items need an 'id'"; return false; }
      if (!add(item["id"].as<std::string>(), item)) return false;
    }
    return true;
  }
  if (n.IsNull()) return true;
  err = "rules: expected a mapping of rule id to rule";
  return false;
}

bool parseRoot(const YAML::Node& root, PolicyLayer& out, std::string& err){
  if (root.IsNull()) return true;
  if (!root.IsMap()) { err = "policy root must be a mapping"; return false; }
  if (!onlyKeys(root, {"version","defaults","limits","rules"}, "policy", err)) return false;
  if (auto d = root["defaults"]) { if (!parseDefaults(d, out.defaults, err)) return false; }
  if (auto l = root["limits"]) { if (!parseLimits(l, out.limits, err)) return false; }
  if (auto r = root["rules"]) { if (!parseRules(r, out.rules, err)) return false; }
  return true;
}

void emitList(YAML::Emitter& e, const char* key, const std::vector<std::string>& v){
  e << YAML::Key << key << YAML::Value << YAML::Flow << YAML::BeginSeq;
  for (auto& s : v) e << s;
  e << YAML::EndSeq;
}

} // namespace

bool parsePolicyYaml(const std::string& text, const std::string& source, PolicyLayer& out, std::string& err){
  try {
    PolicyLayer layer;
    if (!parseRoot(YAML::Load(text), layer, err)) { err = source + ": " + err; return false; }
    layer.sources.push_back(source);
    out = layer;
    return true;
  } catch (const YAML::Exception& ex) {
    err = source + ": " + ex.what();
    return false;
  }
}

bool loadPolicyYaml(const std::string& path, PolicyLayer& out, std::string& err){
  std::ifstream in(path, std::ios::binary);
  if (!in) { err = path + ": cannot open policy file"; return false; }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) { err = path + ": read error"; return false; }
  return parsePolicyYaml(ss.str(), path, out, err);
}

bool loadEffectivePolicy(const std::string& basePath, const std::string& overridePath,
                         PolicyPtr& out, std::string& err){
  PolicyLayer base, over;
  if (!basePath.empty() && !loadPolicyYaml(basePath, base, err)) return false;
  if (!overridePath.empty() && !loadPolicyYaml(overridePath, over, err)) return false;
  out = resolvePolicy(mergeLayers(base, over));
  LOGD("policy: " + std::to_string(out->rules.size()) + " rule(s) from " +
       (out->sources.empty() ? std::string("built-in defaults") : std::to_string(out->sources.size()) + " document(s)"));
  return true;
}

std::string dumpPolicyYaml(const EffectivePolicy& p){
  const PolicyDefaults& d = p.defaults;
  const Limits& l = p.limits;
  YAML::Emitter e;
  e << YAML::BeginMap;

  e << YAML::Key << "defaults" << YAML::Value << YAML::BeginMap;
  e << YAML::Key << "max_size_bytes" << YAML::Value << d.maxSizeBytes;
  e << YAML::Key << "default_decision" << YAML::Value << lower(toString(d.defaultDecision));
  e << YAML::Key << "on_inconclusive" << YAML::Value << lower(toString(d.onInconclusive));
  e << YAML::Key << "fail_on" << YAML::Value << toString(d.failOn);
  emitList(e, "allow_types", d.allowTypes);
  emitList(e, "deny_types", d.denyTypes);
  e << YAML::EndMap;

  e << YAML::Key << "limits" << YAML::Value << YAML::BeginMap;
  e << YAML::Key << "recursion" << YAML::Value << YAML::Flow << YAML::BeginMap
    << YAML::Key << "max_depth" << YAML::Value << l.maxDepth
    << YAML::Key << "max_entries" << YAML::Value << l.maxEntries << YAML::EndMap;
  e << YAML::Key << "size" << YAML::Value << YAML::Flow << YAML::BeginMap
    << YAML::Key << "max_file_bytes" << YAML::Value << l.maxFileBytes
    << YAML::Key << "max_bytes_processed" << YAML::Value << l.maxBytesProcessed
    << YAML::Key << "max_entry_bytes" << YAML::Value << l.maxEntryBytes << YAML::EndMap;
  e << YAML::Key << "zip_bomb" << YAML::Value << YAML::Flow << YAML::BeginMap
    << YAML::Key << "max_expansion_ratio" << YAML::Value << l.maxExpansionRatio << YAML::EndMap;
  e << YAML::Key << "timeouts" << YAML::Value << YAML::Flow << YAML::BeginMap
    << YAML::Key << "per_file_ms" << YAML::Value << l.timeoutFileMs
    << YAML::Key << "per_archive_ms" << YAML::Value << l.timeoutArchiveMs << YAML::EndMap;
  e << YAML::Key << "entropy" << YAML::Value << YAML::Flow << YAML::BeginMap
    << YAML::Key << "threshold" << YAML::Value << l.entropyThreshold
    << YAML::Key << "window" << YAML::Value << l.entropyWindow
    << YAML::Key << "step" << YAML::Value << l.entropyStep
    << YAML::Key << "max_regions" << YAML::Value << l.maxEntropyRegions << YAML::EndMap;
  e << YAML::Key << "pdf" << YAML::Value << YAML::Flow << YAML::BeginMap
    << YAML::Key << "max_objects" << YAML::Value << l.pdfMaxObjects
    << YAML::Key << "max_pages" << YAML::Value << l.pdfMaxPages
    << YAML::Key << "max_filter_chain" << YAML::Value << l.pdfMaxFilterChain
    << YAML::Key << "max_decode_ratio" << YAML::Value << l.pdfMaxDecodeRatio << YAML::EndMap;
  e << YAML::Key << "image" << YAML::Value << YAML::Flow << YAML::BeginMap
    << YAML::Key << "max_pixels" << YAML::Value << l.imageMaxPixels
    << YAML::Key << "max_frames" << YAML::Value << l.imageMaxFrames << YAML::EndMap;
  e << YAML::Key << "fs_safety" << YAML::Value << YAML::Flow << YAML::BeginMap
    << YAML::Key << "prevent_path_traversal" << YAML::Value << l.preventPathTraversal
    << YAML::Key << "allow_symlink" << YAML::Value << l.allowSymlink << YAML::EndMap;
  e << YAML::Key << "isolation" << YAML::Value << YAML::Flow << YAML::BeginMap
    << YAML::Key << "archives" << YAML::Value << l.isolateArchives
    << YAML::Key << "memory_mb" << YAML::Value << (l.isolationMemoryBytes >> 20) << YAML::EndMap;
  e << YAML::EndMap;

  e << YAML::Key << "rules" << YAML::Value << YAML::BeginMap;
  for (const auto& [id, r] : p.rules) {
    e << YAML::Key << id << YAML::Value << YAML::BeginMap;
    if (!r.description.empty()) e << YAML::Key << "description" << YAML::Value << r.description;
    e << YAML::Key << "when" << YAML::Value << YAML::BeginMap;
    const RulePredicate& w = r.when;
    if (!w.mediaTypes.empty()) emitList(e, "media_type", w.mediaTypes);
    if (w.sizeOver) e << YAML::Key << "size_over" << YAML::Value << *w.sizeOver;
    if (w.sizeUnder) e << YAML::Key << "size_under" << YAML::Value << *w.sizeUnder;
    if (!w.findingKinds.empty()) emitList(e, "finding_kind", w.findingKinds);
    if (w.minFindingSeverity) e << YAML::Key << "min_finding_severity" << YAML::Value << toString(*w.minFindingSeverity);
    if (!w.sha256.empty()) emitList(e, "sha256", w.sha256);
    e << YAML::EndMap;
    e << YAML::Key << "decision" << YAML::Value << lower(toString(r.decision));
    e << YAML::EndMap;
  }
  e << YAML::EndMap;

  e << YAML::EndMap;
  return std::string(e.c_str()) + "\n";
}

} // namespace gup
