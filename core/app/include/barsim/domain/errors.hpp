#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace barsim {

// -----------------------------------------------------------------------------
// Error types
// -----------------------------------------------------------------------------
//
// @brief  Exception hierarchy used across the replay engine.
//
// @details
// Two tiers of failure exist:
//
//   1. Structural validation at the input boundary. Every violated rule is
//      collected and reported together as one ValidationError; the run never
//      starts.
//
//   2. Runtime faults during simulation or merging (InvalidOrderError,
//      MergeError). These are logic faults: the whole run aborts with no
//      partial result and no retry.
//
// ConfigError covers unreadable or malformed configuration and CSV input
// and is raised by the loaders before any validation happens.
// -----------------------------------------------------------------------------

// A zero-size order reached the matcher, or a buy/sell was handed to the
// handler for the other side.
class InvalidOrderError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// -----------------------------------------------------------------------------
// ValidationError
// -----------------------------------------------------------------------------
//
// @brief  Aggregated input-validation failure.
//
// @details
// what() renders every cause on one line so a single log statement shows
// the full picture. causes() exposes the individual messages for callers
// (and tests) that need to count or inspect them.
// -----------------------------------------------------------------------------
class ValidationError : public std::invalid_argument {
 public:
  explicit ValidationError(std::vector<std::string> causes)
      : std::invalid_argument(render(causes)), causes_(std::move(causes)) {}

  const std::vector<std::string>& causes() const { return causes_; }

 private:
  static std::string render(const std::vector<std::string>& causes) {
    std::string out = "Invalid arguments (" + std::to_string(causes.size()) +
                      "):";
    for (const auto& cause : causes) {
      out += " [" + cause + "]";
    }
    return out;
  }

  std::vector<std::string> causes_;
};

// Two ledgers cannot be combined (e.g. logarithmic vs linear curves).
class MergeError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

// Configuration or CSV input could not be read or parsed.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace barsim
