#pragma once

#include <chrono>
#include <string>

namespace livestore {

namespace util { class Config; }

struct StoreOptions {
  std::string name;                                  // label used in logs
  std::chrono::milliseconds callTimeout{5000};       // bound on get/take

  static StoreOptions fromConfig(const util::Config& cfg, std::string name = {});
};

} // namespace livestore
