// src/core/resource_guard.cpp
#include "core/resource_guard.hpp"
#include "log.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <new>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gup {

const char* toString(BreachKind b){
  switch (b) { case BreachKind::None: return "none";
               case BreachKind::Timeout: return limit::kTimeout;
               case BreachKind::Memory: return limit::kMemory;
               case BreachKind::Expansion: return limit::kExpansion; }
  return "none";
}

Budget::Budget(uint64_t maxBytes, std::chrono::milliseconds timeout)
  : maxBytes_(maxBytes), timeout_(timeout),
    start_(std::chrono::steady_clock::now()), deadline_(start_ + timeout) {}

bool Budget::charge(uint64_t bytes){
  if (tripped()) return false;
  if (bytes > maxBytes_ || used_ > maxBytes_ - bytes) {
    used_ = maxBytes_;
    trip(BreachKind::Memory, "byte budget of " + std::to_string(maxBytes_) + " exhausted");
    return false;
  }
  used_ += bytes;
  return true;
}

bool Budget::checkpoint(){
  if (tripped()) return false;
  if (std::chrono::steady_clock::now() > deadline_) {
    trip(BreachKind::Timeout, "deadline of " + std::to_string(timeout_.count()) + "ms reached");
    return false;
  }
  return true;
}

void Budget::trip(BreachKind kind, std::string detail){
  if (tripped() || kind == BreachKind::None) return;
  breach_ = kind;
  detail_ = std::move(detail);
}

std::chrono::milliseconds Budget::elapsed() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_);
}

namespace {

Severity breachSeverity(BreachKind b){
  return b == BreachKind::Timeout ? Severity::Medium : Severity::High;
}

void appendBreach(const std::string& validatorName, BreachKind b, const std::string& detail, FindingList& out){
  out.add(finding::kResourceLimit, breachSeverity(b), validatorName + ": " + detail, toString(b));
}

// Shared by the in-process and the isolated path.
void invoke(const std::string& name, const GuardedFn& fn, Budget& budget, FindingList& out){
  try {
    fn(budget, out);
  } catch (const std::bad_alloc&) {
    budget.trip(BreachKind::Memory, "allocation failed");
  } catch (const std::exception& ex) {
    out.add(finding::kInconclusive, Severity::Medium, name + " aborted: " + ex.what());
  }
  // A validator that never reached a checkpoint past the deadline still breached it.
  if (!budget.tripped() && budget.elapsed() > budget.timeout())
    budget.trip(BreachKind::Timeout, "deadline of " + std::to_string(budget.timeout().count()) + "ms exceeded");
}

// ---- child -> parent wire format: one record per line, tab separated ----
std::string escapeField(const std::string& s){
  std::string o; o.reserve(s.size());
  for (char c : s) {
    if (c=='\\') o += "\\\\";
    else if (c=='\t') o += "\\t";
    else if (c=='\n') o += "\\n";
    else o += c;
  }
  return o;
}

std::string unescapeField(const std::string& s){
  std::string o; o.reserve(s.size());
  for (size_t i=0;i<s.size();++i) {
    if (s[i]=='\\' && i+1<s.size()) {
      char n = s[++i];
      o += (n=='t') ? '\t' : (n=='n') ? '\n' : n;
    } else o += s[i];
  }
  return o;
}

std::vector<std::string> splitTabs(const std::string& line){
  std::vector<std::string> f;
  std::string cur;
  for (char c : line) { if (c=='\t') { f.push_back(cur); cur.clear(); } else cur += c; }
  f.push_back(cur);
  return f;
}

bool writeAll(int fd, const std::string& data){
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n < 0) { if (errno == EINTR) continue; return false; }
    off += (size_t)n;
  }
  return true;
}

std::string encodeResult(const FindingList& fl, const Budget& b, const std::vector<std::string>& warnings){
  std::ostringstream os;
  for (auto& w : warnings) os << "W\t" << escapeField(w) << '\n';
  for (auto& f : fl.items())
    os << "F\t" << escapeField(f.kind) << '\t' << (int)f.severity << '\t'
       << escapeField(f.limit) << '\t' << escapeField(f.detail) << '\n';
  os << "B\t" << (int)b.breach() << '\t' << escapeField(b.breachDetail()) << '\t' << b.consumed() << '\n';
  return os.str();
}

bool decodeResult(const std::string& wire, std::vector<Finding>& out, BreachKind& breach,
                  std::string& breachDetail, uint64_t& consumed, std::vector<std::string>& warnings){
  bool sawTail = false;
  std::istringstream is(wire);
  std::string line;
  while (std::getline(is, line)) {
    auto f = splitTabs(line);
    if (f.size() == 5 && f[0] == "F") {
      int sev = std::atoi(f[2].c_str());
      if (sev < 0 || sev > 3) return false;
      out.push_back(Finding{unescapeField(f[1]), (Severity)sev, unescapeField(f[4]), unescapeField(f[3])});
    } else if (f.size() == 4 && f[0] == "B") {
      int b = std::atoi(f[1].c_str());
      if (b < 0 || b > 3) return false;
      breach = (BreachKind)b;
      breachDetail = unescapeField(f[2]);
      consumed = std::strtoull(f[3].c_str(), nullptr, 10);
      sawTail = true;
    } else if (f.size() == 2 && f[0] == "W") {
      warnings.push_back(unescapeField(f[1]));
    } else {
      return false;
    }
  }
  return sawTail;
}

// The "B" record is always last; once it is complete the child has nothing more to say.
bool hasTail(const std::string& wire){
  if (wire.empty() || wire.back() != '\n') return false;
  size_t start = wire.rfind('\n', wire.size() - 2);
  start = (start == std::string::npos) ? 0 : start + 1;
  return wire.compare(start, 2, "B\t") == 0;
}

// Serializes pipe creation and fork so that no child inherits the write end
// of another worker's pipe.
std::mutex& forkMutex(){
  static std::mutex mu;
  return mu;
}

GuardResult runIsolated(const std::string& name, const GuardOptions& opt, const GuardedFn& fn){
  GuardResult res;
  res.isolated = true;
  FindingList out;
  const auto start = std::chrono::steady_clock::now();

  GuardOptions inproc = opt;
  inproc.isolate = false;

  int fds[2];
  pid_t pid = -1;
  std::string spawnErr;
  {
    std::lock_guard<std::mutex> lk(forkMutex());
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      spawnErr = std::string("pipe failed: ") + std::strerror(errno);
    } else {
      pid = ::fork();
      if (pid < 0) {
        spawnErr = std::string("fork failed: ") + std::strerror(errno);
        ::close(fds[0]); ::close(fds[1]);
      }
    }

    if (pid == 0) {
      // Another thread may have held the log mutex at fork time; the child never logs.
      _log_threshold().store(static_cast<int>(LogLevel::Error) + 1);
      ::close(fds[0]);
      std::vector<std::string> warnings;
      struct rlimit rl;
      rl.rlim_cur = rl.rlim_max = (rlim_t)opt.isolationMemoryBytes;
      if (::setrlimit(RLIMIT_AS, &rl) != 0)
        warnings.push_back(std::string("RLIMIT_AS not applied: ") + std::strerror(errno));
      rl.rlim_cur = rl.rlim_max = (rlim_t)(opt.timeoutMs / 1000 + 2);
      if (::setrlimit(RLIMIT_CPU, &rl) != 0)
        warnings.push_back(std::string("RLIMIT_CPU not applied: ") + std::strerror(errno));
      Budget budget(opt.maxBytes, std::chrono::milliseconds(opt.timeoutMs));
      FindingList childOut;
      invoke(name, fn, budget, childOut);
      bool ok = writeAll(fds[1], encodeResult(childOut, budget, warnings));
      ::close(fds[1]);
      ::_exit(ok ? 0 : 3);
    }

    if (pid > 0) ::close(fds[1]);
  }
  if (pid < 0) {
    LOGW("guard: " + spawnErr + " for " + name + ", running in-process");
    return runGuarded(name, inproc, fn);
  }

  std::string wire;
  bool timedOut = false;
  const auto deadline = start + std::chrono::milliseconds(opt.timeoutMs + opt.isolationGraceMs);
  char buf[4096];
  for (;;) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) { timedOut = true; break; }
    struct pollfd p{fds[0], POLLIN, 0};
    int pr = ::poll(&p, 1, (int)left);
    if (pr < 0) { if (errno == EINTR) continue; break; }
    if (pr == 0) { timedOut = true; break; }
    ssize_t n = ::read(fds[0], buf, sizeof(buf));
    if (n < 0) { if (errno == EINTR) continue; break; }
    if (n == 0) break;
    wire.append(buf, (size_t)n);
    if (hasTail(wire)) break;
  }
  ::close(fds[0]);

  if (timedOut) ::kill(pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

  res.elapsedMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

  if (timedOut) {
    logEvent(name, "guard_kill", {{"pid", std::to_string(pid)}, {"ms", std::to_string(opt.timeoutMs)}}, LogLevel::Info);
    appendBreach(name, BreachKind::Timeout,
                 "isolated validator killed at deadline of " + std::to_string(opt.timeoutMs) + "ms", out);
    res.breach = BreachKind::Timeout;
    res.findings = out.release();
    return res;
  }

  std::vector<Finding> childFindings;
  BreachKind breach = BreachKind::None;
  std::string breachDetail;
  uint64_t consumed = 0;
  std::vector<std::string> warnings;
  const bool exitedClean = WIFEXITED(status) && WEXITSTATUS(status) == 0;
  if (exitedClean && decodeResult(wire, childFindings, breach, breachDetail, consumed, warnings)) {
    for (auto& w : warnings) LOGW("guard: " + name + ": " + w);
    out.addAll(childFindings);
    if (breach != BreachKind::None) appendBreach(name, breach, breachDetail, out);
    res.breach = breach;
    res.bytesProcessed = consumed;
  } else if (WIFSIGNALED(status)) {
    // SIGKILL from RLIMIT_CPU/OOM or SIGSEGV once the address space ran out.
    int sig = WTERMSIG(status);
    if (sig == SIGXCPU) {
      appendBreach(name, BreachKind::Timeout, "isolated validator exceeded its CPU limit", out);
      res.breach = BreachKind::Timeout;
    } else {
      appendBreach(name, BreachKind::Memory,
                   "isolated validator terminated by signal " + std::to_string(sig), out);
      res.breach = BreachKind::Memory;
    }
  } else {
    out.add(finding::kInconclusive, Severity::Medium,
            name + ": isolated validator returned no usable result");
  }
  res.findings = out.release();
  return res;
}

} // namespace

GuardResult runGuarded(const std::string& validatorName, const GuardOptions& opt, const GuardedFn& fn){
  if (opt.isolate) return runIsolated(validatorName, opt, fn);

  GuardResult res;
  FindingList out;
  Budget budget(opt.maxBytes, std::chrono::milliseconds(opt.timeoutMs));
  invoke(validatorName, fn, budget, out);
  if (budget.tripped()) {
    logEvent(validatorName, "resource_limit",
             {{"limit", toString(budget.breach())}, {"detail", budget.breachDetail()}}, LogLevel::Debug);
    appendBreach(validatorName, budget.breach(), budget.breachDetail(), out);
  }
  res.breach = budget.breach();
  res.bytesProcessed = budget.consumed();
  res.elapsedMs = (double)budget.elapsed().count();
  res.findings = out.release();
  return res;
}

} // namespace gup
