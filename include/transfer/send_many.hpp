#pragma once
#include <optional>
#include <string>
#include <vector>
#include "config/network.hpp"
#include "encoding/clarity.hpp"
#include "transfer/recipient.hpp"
#include "tx/transaction.hpp"

class StacksApiClient;

struct TransactionRequest {
  std::vector<Recipient> recipients;
  NetworkDescriptor network;
  std::string sender_key;
  std::string contract_identifier;
  std::optional<unsigned long long> nonce;
  std::optional<unsigned long long> fee;
};

// (list {to: principal, ustx: uint}) in recipient order.
// Throws BulkTransferError (EncodingError) for amounts beyond 128 bits.
Clarity::Value SendManyArgument(const std::vector<Recipient>& recipients);

// Sum of all amounts as the u64 a STX post-condition carries.
// Throws BulkTransferError (EncodingError) on overflow.
unsigned long long TotalAmount(const std::vector<Recipient>& recipients);

// Builds and signs the send-many contract call. Reads the account nonce and
// the fee rate from api only when the request leaves them unset.
StacksTransaction BuildSendManyTransaction(const TransactionRequest& request, StacksApiClient& api);
