/**
 * @file error.h
 * @brief Error codes and error type used with Expected<T, Error>
 */

#pragma once

#include <string>
#include <utility>

namespace dnsstatd::utils {

/**
 * @brief Error codes
 *
 * Grouped by subsystem:
 * - 0-99: General
 * - 100-199: Configuration
 * - 200-299: Storage
 * - 400-499: Network
 */
// NOLINTNEXTLINE(performance-enum-size) - Numeric values are part of the log format
enum class ErrorCode : int {
  kOk = 0,
  kInvalidArgument = 2,
  kNotFound = 3,
  kInternalError = 7,

  // Configuration
  kConfigFileNotFound = 100,
  kConfigParseError = 101,
  kConfigYamlError = 102,
  kConfigValidationError = 103,
  kConfigInvalidValue = 104,

  // Storage
  kStoreOpenFailed = 200,
  kStoreClosed = 201,
  kStoreTransactionFailed = 202,
  kStoreReadError = 203,
  kStoreWriteError = 204,
  kRecordCorrupted = 205,
  kRecordVersionUnsupported = 206,

  // Network
  kNetworkBindFailed = 400,
  kNetworkAlreadyRunning = 401,
};

/**
 * @brief Get human-readable name of an error code
 */
inline const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "OK";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kNotFound:
      return "NotFound";
    case ErrorCode::kInternalError:
      return "InternalError";
    case ErrorCode::kConfigFileNotFound:
      return "ConfigFileNotFound";
    case ErrorCode::kConfigParseError:
      return "ConfigParseError";
    case ErrorCode::kConfigYamlError:
      return "ConfigYamlError";
    case ErrorCode::kConfigValidationError:
      return "ConfigValidationError";
    case ErrorCode::kConfigInvalidValue:
      return "ConfigInvalidValue";
    case ErrorCode::kStoreOpenFailed:
      return "StoreOpenFailed";
    case ErrorCode::kStoreClosed:
      return "StoreClosed";
    case ErrorCode::kStoreTransactionFailed:
      return "StoreTransactionFailed";
    case ErrorCode::kStoreReadError:
      return "StoreReadError";
    case ErrorCode::kStoreWriteError:
      return "StoreWriteError";
    case ErrorCode::kRecordCorrupted:
      return "RecordCorrupted";
    case ErrorCode::kRecordVersionUnsupported:
      return "RecordVersionUnsupported";
    case ErrorCode::kNetworkBindFailed:
      return "NetworkBindFailed";
    case ErrorCode::kNetworkAlreadyRunning:
      return "NetworkAlreadyRunning";
  }
  return "Unknown";
}

/**
 * @brief Error with code, message and optional context
 */
class Error {
 public:
  Error() = default;

  Error(ErrorCode code, std::string message, std::string context = "")
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::string& context() const { return context_; }

  /**
   * @brief Format as "[Code] message (context)"
   */
  std::string to_string() const {
    std::string result = "[";
    result += ErrorCodeToString(code_);
    result += "] ";
    result += message_;
    if (!context_.empty()) {
      result += " (" + context_ + ")";
    }
    return result;
  }

 private:
  ErrorCode code_ = ErrorCode::kOk;
  std::string message_;
  std::string context_;
};

/**
 * @brief Create an error
 */
inline Error MakeError(ErrorCode code, std::string message = "", std::string context = "") {
  return Error(code, std::move(message), std::move(context));
}

}  // namespace dnsstatd::utils
