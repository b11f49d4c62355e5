#pragma once
#include <optional>
#include <string>

class StacksApiClient;

// Hands out account nonces, starting from an explicit value or from the
// node's view of the account on first use.
class NonceManager {
public:
  NonceManager(StacksApiClient& api, const std::string& address);
  // Throws BulkTransferError (NonceResolutionError) when the node read fails.
  unsigned long long Next();
  void Reset(unsigned long long to);
private:
  StacksApiClient& api_;
  std::string address_;
  std::optional<unsigned long long> current_;
  void Initialize();
};
