#include "config/contracts.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "constants/stacks.hpp"
#include "encoding/c32.hpp"
#include <cctype>

static bool IsValidContractName(const std::string& name) {
  if (name.empty() || name.size() > 40) return false;
  if (!std::isalpha(static_cast<unsigned char>(name[0]))) return false;
  for (char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') return false;
  }
  return true;
}

std::string ResolveContract(const NetworkDescriptor& network, const std::optional<std::string>& explicit_contract) {
  if (explicit_contract) return *explicit_contract;
  if (network.chain_id == ChainId::Testnet) return StacksConstants::DEFAULT_TESTNET_CONTRACT;
  Logger::Warning("no mainnet send-many contract is deployed; pass --contractAddress");
  return StacksConstants::DEFAULT_MAINNET_CONTRACT;
}

ContractIdentifier ParseContractIdentifier(const std::string& identifier) {
  auto dot = identifier.find('.');
  if (dot == std::string::npos) {
    throw BulkTransferError(ErrorKind::EncodingError,
                            "Contract identifier '" + identifier + "' is not of the form <address>.<contract-name>");
  }
  ContractIdentifier id{identifier.substr(0, dot), identifier.substr(dot + 1)};
  if (!C32::IsValidAddress(id.address)) {
    throw BulkTransferError(ErrorKind::EncodingError, "Contract address '" + id.address + "' is not a valid STX address");
  }
  if (!IsValidContractName(id.name)) {
    throw BulkTransferError(ErrorKind::EncodingError, "Contract name '" + id.name + "' is not a valid contract name");
  }
  return id;
}
