#include "common/errors.hpp"

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidAddress: return "InvalidAddress";
    case ErrorKind::InvalidAmount: return "InvalidAmount";
    case ErrorKind::NetworkResolutionError: return "NetworkResolutionError";
    case ErrorKind::InvalidSigningKey: return "InvalidSigningKey";
    case ErrorKind::NonceResolutionError: return "NonceResolutionError";
    case ErrorKind::FeeEstimationError: return "FeeEstimationError";
    case ErrorKind::EncodingError: return "EncodingError";
    case ErrorKind::BroadcastError: return "BroadcastError";
    case ErrorKind::ArgumentParseError: return "ArgumentParseError";
  }
  return "Unknown";
}
