#pragma once

#include <stdexcept>

namespace sailcpp {

// Backing storage write or read failed. Round-fatal inside the planner loop.
class StorageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The configured external memory backend could not be reached.
class BackendUnavailableError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class SynthesisError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Raised inside a round when its cancellation token fires. Never escapes the
// planner loop.
class RoundCancelled : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace sailcpp
