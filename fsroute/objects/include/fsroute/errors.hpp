#pragma once

#include <stdexcept>

namespace fsroute {

// Startup scan failure: content root missing, not a directory or unreadable.
class IndexBuildError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Thrown by template renderers.
class TemplateError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Thrown by script executors.
class DynamicExecutionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace fsroute
