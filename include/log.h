#pragma once
#include <atomic>
#include <cstdio>
#include <ctime>
#include <map>
#include <mutex>
#include <string>

enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4 };

inline std::atomic<int>& _log_threshold(){
  static std::atomic<int> lvl{static_cast<int>(LogLevel::Info)};
  return lvl;
}
inline std::mutex& _log_mutex(){
  static std::mutex mu;
  return mu;
}

inline void setLogLevel(LogLevel l){ _log_threshold().store(static_cast<int>(l)); }
inline bool logEnabled(LogLevel l){ return static_cast<int>(l) >= _log_threshold().load(); }

// "trace" | "debug" | "info" | "warn" | "error"
inline bool parseLogLevel(const std::string& s, LogLevel& out){
  if (s=="trace") { out = LogLevel::Trace; return true; }
  if (s=="debug") { out = LogLevel::Debug; return true; }
  if (s=="info")  { out = LogLevel::Info;  return true; }
  if (s=="warn")  { out = LogLevel::Warn;  return true; }
  if (s=="error") { out = LogLevel::Error; return true; }
  return false;
}

inline void _log_emit(LogLevel l, const char* lvl, const std::string& msg){
  if (!logEnabled(l)) return;
  std::time_t now = std::time(nullptr);
  std::tm tmv{};
  localtime_r(&now, &tmv);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tmv);
  std::lock_guard<std::mutex> lk(_log_mutex());
  std::fprintf(stderr, "[%s] %s | %s\n", lvl, ts, msg.c_str());
}

#define LOGT(m) _log_emit(LogLevel::Trace, "TRACE", (m))
#define LOGD(m) _log_emit(LogLevel::Debug, "DEBUG", (m))
#define LOGI(m) _log_emit(LogLevel::Info,  "INFO ", (m))
#define LOGW(m) _log_emit(LogLevel::Warn,  "WARN ", (m))
#define LOGE(m) _log_emit(LogLevel::Error, "ERROR", (m))

// Structured audit line: [EVENT][type] id=<scanId> k=v ...
inline void logEvent(const std::string& scanId,
                     const std::string& eventType,
                     const std::map<std::string,std::string>& kv,
                     LogLevel l = LogLevel::Debug)
{
  if (!logEnabled(l)) return;
  std::string line = "[EVENT][" + eventType + "] id=" + scanId;
  for (auto& [k,v] : kv) line += " " + k + "=" + v;
  std::lock_guard<std::mutex> lk(_log_mutex());
  std::fprintf(stderr, "%s\n", line.c_str());
}
