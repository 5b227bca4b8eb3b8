#include "core/types.hpp"
#include <algorithm>
#include <cctype>

namespace gup {

static std::string lowerAscii(std::string s){
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  return s;
}

const char* toString(Severity s){
  switch (s) { case Severity::Low: return "low";
               case Severity::Medium: return "medium";
               case Severity::High: return "high";
               case Severity::Critical: return "critical"; }
  return "low";
}

const char* toString(Decision d){
  switch (d) { case Decision::Allow: return "ALLOW";
               case Decision::Warn: return "WARN";
               case Decision::Deny: return "DENY"; }
  return "ALLOW";
}

const char* toString(FailOn f){
  switch (f) { case FailOn::Warn: return "warn";
               case FailOn::Deny: return "deny";
               case FailOn::Error: return "error"; }
  return "deny";
}

bool parseSeverity(const std::string& raw, Severity& out){
  std::string s = lowerAscii(raw);
  if (s=="low")      { out = Severity::Low; return true; }
  if (s=="medium")   { out = Severity::Medium; return true; }
  if (s=="high")     { out = Severity::High; return true; }
  if (s=="critical") { out = Severity::Critical; return true; }
  return false;
}

bool parseDecision(const std::string& raw, Decision& out){
  std::string s = lowerAscii(raw);
  if (s=="allow") { out = Decision::Allow; return true; }
  if (s=="warn")  { out = Decision::Warn; return true; }
  if (s=="deny")  { out = Decision::Deny; return true; }
  return false;
}

bool parseFailOn(const std::string& raw, FailOn& out){
  std::string s = lowerAscii(raw);
  if (s=="warn")  { out = FailOn::Warn; return true; }
  if (s=="deny")  { out = FailOn::Deny; return true; }
  if (s=="error" || s=="none") { out = FailOn::Error; return true; }
  return false;
}

std::optional<Severity> maxSeverity(const std::vector<Finding>& findings){
  std::optional<Severity> worst;
  for (auto& f : findings)
    if (!worst || f.severity > *worst) worst = f.severity;
  return worst;
}

} // namespace gup
