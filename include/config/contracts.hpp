#pragma once
#include <string>
#include <optional>
#include "config/network.hpp"

// explicit_contract wins verbatim; otherwise the testnet chain gets the
// deployed testnet contract and every other chain the mainnet placeholder.
std::string ResolveContract(const NetworkDescriptor& network, const std::optional<std::string>& explicit_contract = std::nullopt);

struct ContractIdentifier {
  std::string address;
  std::string name;
};

// Splits "<address>.<contract-name>" and checks both halves. Throws
// BulkTransferError (EncodingError) when the identifier cannot be encoded.
ContractIdentifier ParseContractIdentifier(const std::string& identifier);
