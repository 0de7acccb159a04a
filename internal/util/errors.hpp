#pragma once

#include <stdexcept>
#include <string>

namespace telemetry::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Selection change that would leave a selected sensor without metrics.
class InvalidSelection : public std::runtime_error {
 public:
  explicit InvalidSelection(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Save requested while no sample has been buffered.
class EmptyRecording : public std::runtime_error {
 public:
  explicit EmptyRecording(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transport refused or failed a subscribe/unsubscribe.
class SubscriptionError : public std::runtime_error {
 public:
  explicit SubscriptionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace telemetry::util
