#pragma once
/*
================================================================================
Core: Error Types
FILE: cpp/nest/core/errors.hpp

Purpose:
  - Provide uniform exception types so validation and runtime failures are:
      * searchable
      * catchable by category
      * reportable with file/line/function context

Hardening:
  - Small, dependency-free exceptions.
  - Safe what() storage via std::string.
  - Codes are stable; keep values fixed once public.
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace nest {

enum class ErrorCode : int {
  kInvalidConfig    = 1,
  kInvalidInput     = 2,
  kNumericalFailure = 3,
  kSamplerFailure   = 4,
  kInternal         = 5,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidConfig:    return "InvalidConfig";
    case ErrorCode::kInvalidInput:     return "InvalidInput";
    case ErrorCode::kNumericalFailure: return "NumericalFailure";
    case ErrorCode::kSamplerFailure:   return "SamplerFailure";
    case ErrorCode::kInternal:         return "Internal";
    default:                           return "Unknown";
  }
}

// Base error for the integrator. Includes code + call site for auditability.
class NestError : public std::runtime_error {
 public:
  NestError(ErrorCode code,
            std::string message,
            const char* file = "",
            int line = 0,
            const char* function = "")
      : std::runtime_error(build_what(code, message, file, line, function)),
        code_(code),
        message_(std::move(message)),
        file_(file ? file : ""),
        function_(function ? function : ""),
        line_(line) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const std::string& file() const noexcept { return file_; }
  const std::string& function() const noexcept { return function_; }
  int line() const noexcept { return line_; }

 private:
  static std::string build_what(ErrorCode code,
                                const std::string& msg,
                                const char* file,
                                int line,
                                const char* func) {
    std::ostringstream oss;
    oss << "[nest::Error code=" << to_string(code) << "(" << static_cast<int>(code) << ")] "
        << msg;
    if (file && *file) {
      oss << " @ " << file << ":" << line;
      if (func && *func) oss << " (" << func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  std::string file_;
  std::string function_;
  int line_;
};

// Thrown when user/config input fails validation.
class ValidationError : public NestError {
 public:
  explicit ValidationError(std::string msg,
                           const char* file = "",
                           int line = 0,
                           const char* function = "")
      : NestError(ErrorCode::kInvalidConfig, std::move(msg), file, line, function) {}
};

// Thrown when a computation becomes numerically invalid or a sampler cannot
// produce an acceptable point.
class NumericalError : public NestError {
 public:
  explicit NumericalError(ErrorCode code,
                          std::string msg,
                          const char* file = "",
                          int line = 0,
                          const char* function = "")
      : NestError(code, std::move(msg), file, line, function) {}
};

[[noreturn]] inline void throw_error(ErrorCode code,
                                     std::string message,
                                     const char* file,
                                     int line,
                                     const char* function) {
  if (code == ErrorCode::kInvalidConfig) {
    throw ValidationError(std::move(message), file, line, function);
  }
  if (code == ErrorCode::kNumericalFailure || code == ErrorCode::kSamplerFailure) {
    throw NumericalError(code, std::move(message), file, line, function);
  }
  throw NestError(code, std::move(message), file, line, function);
}

inline void ensure(bool ok,
                   ErrorCode code,
                   std::string message,
                   const char* file,
                   int line,
                   const char* function) {
  if (!ok) {
    throw_error(code, std::move(message), file, line, function);
  }
}

}  // namespace nest

#define NEST_THROW(CODE, MSG) ::nest::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)
#define NEST_REQUIRE(EXPR, CODE, MSG) ::nest::ensure((EXPR), (CODE), (MSG), __FILE__, __LINE__, __func__)
