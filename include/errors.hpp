#pragma once

#include <stdexcept>
#include <string>
#include <utility>

// Base of every error raised by the conversion core. code() is a stable
// machine-readable identifier, what() the human-readable message.
class ConversionError : public std::runtime_error {
public:
  ConversionError(std::string code, const std::string& message)
    : std::runtime_error(message), code_(std::move(code)) {}

  const std::string& code() const noexcept { return code_; }

private:
  std::string code_;
};

// Rejected upload (wrong type or too large). No session is created.
class ValidationError : public ConversionError {
public:
  explicit ValidationError(const std::string& message)
    : ConversionError("validation_error", message) {}
};

// Unknown session, missing source document or missing artifact.
class NotFoundError : public ConversionError {
public:
  explicit NotFoundError(const std::string& message)
    : ConversionError("not_found", message) {}
};

class InvalidStateTransition : public ConversionError {
public:
  explicit InvalidStateTransition(const std::string& message)
    : ConversionError("invalid_state_transition", message) {}
};

// Unexpected failure while processing a page; ends the job in Error.
class ExtractionFailure : public ConversionError {
public:
  explicit ExtractionFailure(const std::string& message)
    : ConversionError("extraction_failure", message) {}
};

class IoFailure : public ConversionError {
public:
  explicit IoFailure(const std::string& message)
    : ConversionError("io_failure", message) {}
};
