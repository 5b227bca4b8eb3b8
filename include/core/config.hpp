#pragma once
#include "core/policy.hpp"
#include <string>

namespace gup {

// Parses one policy document. Every failure (YAML syntax, unknown key or
// token, duplicate rule id, rule without decision or with an empty `when`,
// non-positive ratio/window/timeout) returns false with a message.
bool parsePolicyYaml(const std::string& text, const std::string& source, PolicyLayer& out, std::string& err);
bool loadPolicyYaml(const std::string& path, PolicyLayer& out, std::string& err);

// base and/or override may be empty; with neither the built-in default policy applies.
bool loadEffectivePolicy(const std::string& basePath, const std::string& overridePath,
                         PolicyPtr& out, std::string& err);

// Effective policy rendered back as YAML (check-policy).
std::string dumpPolicyYaml(const EffectivePolicy& p);

} // namespace gup
