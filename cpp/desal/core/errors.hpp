#pragma once
/*
================================================================================
Core: Error Types (Engine-Wide)
FILE: cpp/desal/core/errors.hpp

Purpose:
  - Uniform exception types so validation and runtime failures are:
      * searchable
      * catchable by category
      * reportable by the CLI with a stable exit code

Kinds:
  - ConfigurationError: non-physical parameter. Raised before the climate
    series is generated; carries the dotted parameter path.
  - ValidationError: invalid argument to an engine function (month outside
    1..12, negative day count, a record with an invalid month).
  - NumericalError: a per-day quantity became NaN/Inf. Carries the day index.
  - IOError: file/stream failure in the exporters or the config loader.

Zero solar energy on a day is NOT an error: dependent ratios are defined as 0.
================================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>

namespace desal {

// Base error for the engine.
class DesalError : public std::runtime_error {
 public:
  explicit DesalError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Thrown when an argument to an engine function is out of its domain.
class ValidationError : public DesalError {
 public:
  explicit ValidationError(std::string msg) : DesalError(std::move(msg)) {}
};

// Thrown when a Configuration fails validation.
class ConfigurationError : public DesalError {
 public:
  ConfigurationError(std::string parameter, const std::string& msg)
      : DesalError("ConfigurationError [" + parameter + "]: " + msg),
        parameter_(std::move(parameter)) {}

  // Dotted path of the offending field, e.g. "water.boiling_temp_K".
  const std::string& parameter() const noexcept { return parameter_; }

 private:
  std::string parameter_;
};

// Thrown when a per-day computation becomes numerically invalid.
class NumericalError : public DesalError {
 public:
  NumericalError(int day_index, std::string field, const std::string& msg)
      : DesalError("NumericalError [day " + std::to_string(day_index) + ", " + field + "]: " + msg),
        day_index_(day_index),
        field_(std::move(field)) {}

  int day_index() const noexcept { return day_index_; }
  const std::string& field() const noexcept { return field_; }

 private:
  int day_index_;
  std::string field_;
};

// Thrown for I/O or filesystem related issues.
class IOError : public DesalError {
 public:
  explicit IOError(std::string msg) : DesalError(std::move(msg)) {}
};

} // namespace desal
