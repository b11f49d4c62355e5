#include "wallet/nonce_manager.hpp"
#include "node_connection/stacks_api.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <stdexcept>

NonceManager::NonceManager(StacksApiClient& api, const std::string& address) : api_(api), address_(address) {}

void NonceManager::Initialize() {
  try {
    current_ = api_.GetAccountNonce(address_);
  } catch (const std::runtime_error& e) {
    throw BulkTransferError(ErrorKind::NonceResolutionError,
                            "Unable to fetch nonce for " + address_ + " from " + api_.ApiUrl() + ": " + e.what());
  }
  Logger::Info("fetched nonce " + std::to_string(*current_) + " for " + address_);
}

unsigned long long NonceManager::Next() {
  if (!current_) Initialize();
  return (*current_)++;
}

void NonceManager::Reset(unsigned long long to) { current_ = to; }
