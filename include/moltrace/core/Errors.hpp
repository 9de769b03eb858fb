#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace moltrace {

// Base of all moltrace failures. Every error is fatal for the run.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed or unsupported trajectory content.
// line() is the 1-based line number in the concatenated input (0 = unknown).
class ParseError : public Error {
public:
  explicit ParseError(const std::string& msg, std::size_t line = 0)
      : Error(line ? ("ParseError at line " + std::to_string(line) + ": " + msg)
                   : ("ParseError: " + msg)),
        line_(line) {}

  std::size_t line() const { return line_; }

private:
  std::size_t line_ = 0;
};

// The external bonding oracle failed for one timestep.
class BondInferenceError : public Error {
public:
  BondInferenceError(const std::string& msg, std::size_t step)
      : Error("BondInferenceError at step " + std::to_string(step) + ": " + msg), step_(step) {}

  std::size_t step() const { return step_; }

private:
  std::size_t step_ = 0;
};

// Internal consistency check failed (a bug, never bad input).
class InvariantViolation : public Error {
public:
  explicit InvariantViolation(const std::string& msg)
      : Error("InvariantViolation: " + msg) {}
};

} // namespace moltrace
