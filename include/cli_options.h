#pragma once
#include "core/policy.hpp"
#include "core/types.hpp"
#include "log.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gup {

struct CliOptions {
  std::string command;                 // scan | check-policy
  std::vector<std::string> paths;

  std::string policyPath;
  std::string overridePath;
  std::string jsonPath;                // empty = stdout
  std::string summaryPath;             // empty = one line on stderr

  std::optional<FailOn>   failOn;      // overrides defaults.fail_on
  std::optional<uint32_t> timeoutMs;   // overrides per_file_ms and per_archive_ms
  unsigned jobs = 0;                   // 0 = hardware concurrency
  LogLevel logLevel = LogLevel::Info;

  bool help = false;
  bool version = false;
};

// GUARDUPLOAD_POLICY, GUARDUPLOAD_POLICY_OVERRIDE, GUARDUPLOAD_JOBS and
// GUARDUPLOAD_LOG_LEVEL seed the options; flags given on the command line win.
CliOptions loadOptionsFromEnv();
bool parseArgs(int argc, char** argv, CliOptions& opt, std::string& err);

// Command-line limits as one more layer on top of the loaded policy.
PolicyPtr applyCliOverrides(const EffectivePolicy& loaded, const CliOptions& opt);

const char* usageText();

} // namespace gup
