#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace catalog::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Bundle path does not resolve to a stored bundle.
class BundleImageNotFound : public NotFound {
 public:
  explicit BundleImageNotFound(const std::string& path) : NotFound("bundle image " + path + " not found") {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Alpha-only feature used while alpha features are disabled.
class UnsupportedFeature : public std::runtime_error {
 public:
  explicit UnsupportedFeature(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Structural graph error: missing or ambiguous head, replacement cycle,
  dangling replaces target. Always fatal to the affected channel.
*/
class GraphError : public std::runtime_error {
 public:
  explicit GraphError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DefaultChannelHeadRemoval : public std::runtime_error {
 public:
  DefaultChannelHeadRemoval() : std::runtime_error("Bundle deprecation causing default channel removal") {
  }
  explicit DefaultChannelHeadRemoval(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Stored digest does not match the source catalog. Recoverable by rebuild.
class IntegrityError : public std::runtime_error {
 public:
  explicit IntegrityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Combined error of a batch or multi-channel operation.

  what() renders as "[first, second]"; a single message renders bare.
*/
class AggregateError : public std::runtime_error {
 public:
  explicit AggregateError(std::vector<std::string> messages)
      : std::runtime_error(Render(messages)), messages_(std::move(messages)) {
  }

  const std::vector<std::string>& Messages() const {
    return messages_;
  }

 private:
  static std::string Render(const std::vector<std::string>& messages) {
    if (messages.size() == 1) {
      return messages.front();
    }
    std::string out = "[";
    for (std::size_t i = 0; i < messages.size(); ++i) {
      if (i > 0) out += ", ";
      out += messages[i];
    }
    out += "]";
    return out;
  }

  std::vector<std::string> messages_;
};

// Throws AggregateError if any message was collected.
inline void ThrowIfAny(std::vector<std::string> messages) {
  if (!messages.empty()) {
    throw AggregateError(std::move(messages));
  }
}

} // namespace catalog::util
