#include "livestore/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace livestore::util {

static thread_local std::map<std::string, std::string> t_ctx;

const char* levelName(LogLevel l) {
  switch (l) { case LogLevel::Trace: return "TRACE";
               case LogLevel::Debug: return "DEBUG";
               case LogLevel::Info:  return "INFO";
               case LogLevel::Warn:  return "WARN";
               case LogLevel::Error: return "ERROR"; }
  return "INFO";
}

LogLevel parseLevel(const std::string& s) {
  std::string x = s;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (x=="trace") return LogLevel::Trace;
  if (x=="debug") return LogLevel::Debug;
  if (x=="info")  return LogLevel::Info;
  if (x=="warn" || x=="warning") return LogLevel::Warn;
  if (x=="error") return LogLevel::Error;
  return LogLevel::Info;
}

Logger& logger() {
  static Logger L;
  return L;
}

Logger::Logger() : file_(stdout) {}

Logger::~Logger() {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
  file_ = nullptr;
}

void Logger::setLevel(LogLevel lvl) { lvl_.store(static_cast<int>(lvl), std::memory_order_relaxed); }
void Logger::setFormatJson(bool json) { json_.store(json, std::memory_order_relaxed); }

bool Logger::setFile(const std::string& path) {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
  file_ = stdout;
  if (path.empty()) return true;
  FILE* f = std::fopen(path.c_str(), "a");
  if (!f) return false;
  file_ = f;
  return true;
}

LogLevel Logger::level() const { return static_cast<LogLevel>(lvl_.load(std::memory_order_relaxed)); }

void Logger::log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  if (!enabled(lvl)) return;
  writeLine(lvl, msg, fields);
}

static std::string nowIso() {
  using namespace std::chrono;
  auto tp = system_clock::now();
  auto t = system_clock::to_time_t(tp);
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
  std::tm tm;
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

static void jsonEscape(std::ostringstream& oss, const std::string& s) {
  for (char c : s) {
    switch (c) {
      case '"':  oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\n': oss << "\\n";  break;
      case '\r': oss << "\\r";  break;
      case '\t': oss << "\\t";  break;
      default:   oss << c;
    }
  }
}

void Logger::writeLine(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  std::ostringstream oss;
  if (json_.load(std::memory_order_relaxed)) {
    oss << "{\"ts\":\"" << nowIso() << "\",\"lvl\":\"" << levelName(lvl) << "\",\"msg\":\"";
    jsonEscape(oss, msg);
    oss << "\"";
    for (auto& kv : t_ctx) {
      oss << ",\"";
      jsonEscape(oss, kv.first);
      oss << "\":\"";
      jsonEscape(oss, kv.second);
      oss << "\"";
    }
    for (auto& f : fields) {
      oss << ",\"";
      jsonEscape(oss, f.k);
      oss << "\":\"";
      jsonEscape(oss, f.v);
      oss << "\"";
    }
    oss << "}\n";
  } else {
    oss << '[' << nowIso() << "] " << std::left << std::setw(5) << levelName(lvl) << ' ' << msg;
    for (auto& kv : t_ctx) oss << ' ' << kv.first << '=' << kv.second;
    for (auto& f : fields) oss << ' ' << f.k << '=' << f.v;
    oss << '\n';
  }

  const std::string line = oss.str();
  std::lock_guard<std::mutex> lk(mx_);
  FILE* f = static_cast<FILE*>(file_ ? file_ : stdout);
  std::fwrite(line.data(), 1, line.size(), f);
  std::fflush(f);
}

Logger::Scoped::Scoped(const std::vector<Field>& add) {
  for (auto& kv : add) {
    auto it = t_ctx.find(kv.k);
    if (it != t_ctx.end()) {
      saved_.push_back({it->first, it->second});
      it->second = kv.v;
    } else {
      added_.push_back(kv.k);
      t_ctx.emplace(kv.k, kv.v);
    }
  }
}

Logger::Scoped::~Scoped() {
  for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) t_ctx[it->k] = it->v;
  for (auto& k : added_) t_ctx.erase(k);
}

} // namespace livestore::util
