#pragma once
#include <ostream>
#include <string>
#include "config/network.hpp"
#include "tx/transaction.hpp"

class StacksApiClient;

struct ReportOptions {
  bool broadcast = false;
  bool verbose = false;
  std::string explorer_url;
};

// <explorer>/txid/0x<txid>?chain=<mainnet|testnet>
std::string ExplorerLink(const std::string& explorer_url, const std::string& txid, const NetworkDescriptor& network);

// Prints the transaction hex, or broadcasts it and prints the node's answer.
// Verbose mode adds labelled lines; otherwise exactly one line is written.
// Returns the primary (unlabelled) value. Throws BulkTransferError
// (BroadcastError) when the node does not accept the transaction.
std::string ReportTransaction(const StacksTransaction& tx,
                              const NetworkDescriptor& network,
                              StacksApiClient& api,
                              const ReportOptions& options,
                              std::ostream& out);
