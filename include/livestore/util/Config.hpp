#pragma once

#include <string>

namespace livestore {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if the file was read (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Push logLevel / logJson / logFile into util::logger().
  void applyLogging() const;

  // Runtime
  unsigned    threadPoolSize     = 4;
  int         callTimeoutMs      = 5000;   // bound on synchronous get/take
  unsigned    metricsIntervalSec = 0;      // 0 = reporter off

  // Logging
  std::string logLevel = "info";
  bool        logJson  = false;
  std::string logFile;                     // empty -> stdout

  // Demo
  int clicks          = 3;
  int clickIntervalMs = 10;

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static bool parseBool(const std::string& v);
  static std::string trim(const std::string& s);
};

} // namespace util
} // namespace livestore
