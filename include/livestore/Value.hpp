#pragma once

#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace livestore {

// Forward declare the wrapper so lists can nest values
struct Value;

using Key = std::string;

using ValueType = std::variant<
  std::monostate,          // nil / "missing"
  bool,
  int,
  double,
  std::string,
  std::vector<int>,
  std::vector<double>,
  std::vector<Value>
>;

// Opaque payload stored at a key. The store only compares and forwards it.
struct Value {
  ValueType data;

  Value() = default;
  Value(const ValueType& v) : data(v) {}
  Value(ValueType&& v) : data(std::move(v)) {}
  Value(const char* s) : data(std::string(s)) {}

  // Implicit conversion from any ValueType alternative
  template <typename T,
            typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Value> &&
                                        !std::is_same_v<std::decay_t<T>, ValueType> &&
                                        std::is_constructible_v<ValueType, T&&>>>
  Value(T&& v) : data(std::forward<T>(v)) {}

  bool isNil() const noexcept { return std::holds_alternative<std::monostate>(data); }

  template <typename T>
  bool is() const noexcept { return std::holds_alternative<T>(data); }

  // Throws std::bad_variant_access on a type mismatch.
  template <typename T>
  const T& as() const { return std::get<T>(data); }

  template <typename T>
  const T* getIf() const noexcept { return std::get_if<T>(&data); }
};

inline bool operator==(const Value& a, const Value& b) { return a.data == b.data; }
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// Key-ordered mapping; iteration order is the order assignMany applies it in.
using Assigns = std::map<Key, Value>;

// Ordered (key, value) pairs; duplicates resolve last-write-wins.
using AssignList = std::vector<std::pair<Key, Value>>;

Assigns toAssigns(const AssignList& pairs);

// Human readable rendering for logs and the demo.
std::string toString(const Value& v);

} // namespace livestore
