#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
  InvalidAddress,
  InvalidAmount,
  NetworkResolutionError,
  InvalidSigningKey,
  NonceResolutionError,
  FeeEstimationError,
  EncodingError,
  BroadcastError,
  ArgumentParseError
};

const char* ErrorKindName(ErrorKind kind);

// Terminal failure of a bulk transfer run. The message is shown to the user
// as-is, so it names the offending input where there is one.
class BulkTransferError : public std::runtime_error {
public:
  BulkTransferError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}
  ErrorKind Kind() const { return kind_; }
private:
  ErrorKind kind_;
};
