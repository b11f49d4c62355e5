#pragma once
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "constants/stacks.hpp"

class HttpClient;

struct BulkTransferOptions {
  std::vector<std::string> recipient_args;   // "address,amount" tokens
  std::string private_key;
  bool broadcast = false;
  std::string network = "testnet";
  std::optional<std::string> node_url;
  bool verbose = false;
  std::optional<std::string> contract_address;
  std::optional<unsigned long long> nonce;
  std::optional<unsigned long long> fee;
  int http_timeout_ms = StacksConstants::DEFAULT_HTTP_TIMEOUT_MS;
  std::string explorer_url = StacksConstants::EXPLORER_URL;
};

// Validates recipients, resolves network and contract, assembles and signs
// the transaction, then prints or broadcasts it. The first failure propagates
// as a BulkTransferError; nothing is retried. Returns the primary output.
std::string RunBulkTransfer(const BulkTransferOptions& options, HttpClient& http, std::ostream& out);
