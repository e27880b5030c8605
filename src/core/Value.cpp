#include "livestore/Value.hpp"

#include <sstream>

namespace livestore {

Assigns toAssigns(const AssignList& pairs) {
  Assigns out;
  for (const auto& [key, value] : pairs) {
    out[key] = value;
  }
  return out;
}

namespace {

template <typename Seq>
void writeSeq(std::ostringstream& oss, const Seq& xs) {
  oss << '[';
  bool first = true;
  for (const auto& x : xs) {
    if (!first) oss << ", ";
    first = false;
    if constexpr (std::is_same_v<std::decay_t<decltype(x)>, Value>) {
      oss << toString(x);
    } else {
      oss << x;
    }
  }
  oss << ']';
}

} // namespace

std::string toString(const Value& v) {
  std::ostringstream oss;
  std::visit([&oss](const auto& x) {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, std::monostate>) {
      oss << "nil";
    } else if constexpr (std::is_same_v<T, bool>) {
      oss << (x ? "true" : "false");
    } else if constexpr (std::is_same_v<T, std::string>) {
      oss << '"' << x << '"';
    } else if constexpr (std::is_same_v<T, int> || std::is_same_v<T, double>) {
      oss << x;
    } else {
      writeSeq(oss, x);
    }
  }, v.data);
  return oss.str();
}

} // namespace livestore
