#pragma once

#include <stdexcept>
#include <string>

namespace livestore {

// Base for everything the store API throws.
class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// The actor is gone (stopped, crashed in an update, or its runtime dropped the request).
class StoreTerminated : public StoreError {
public:
  explicit StoreTerminated(const std::string& reason)
    : StoreError("store terminated: " + reason), reason_(reason) {}

  const std::string& reason() const noexcept { return reason_; }

private:
  std::string reason_;
};

// A synchronous call was not answered within the store's call timeout.
class CallTimeout : public StoreError {
public:
  explicit CallTimeout(const std::string& what) : StoreError(what) {}
};

} // namespace livestore
