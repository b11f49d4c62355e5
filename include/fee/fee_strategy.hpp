#pragma once
#include <cstddef>

class StacksApiClient;

struct FeeQuote { unsigned long long rate_per_byte; unsigned long long fee; };

// Prices a transaction at the node's transfer fee rate times its serialized size.
class FeeStrategy {
public:
  explicit FeeStrategy(StacksApiClient& api) : api_(api) {}
  // Throws BulkTransferError (FeeEstimationError) when the node read fails.
  FeeQuote Quote(size_t tx_bytes);
private:
  StacksApiClient& api_;
};
