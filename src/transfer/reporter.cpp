#include "transfer/reporter.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "node_connection/stacks_api.hpp"
#include "telemetry/structured_logger.hpp"
#include "utils/hex.hpp"

std::string ExplorerLink(const std::string& explorer_url, const std::string& txid, const NetworkDescriptor& network) {
  std::string base = explorer_url;
  while (!base.empty() && base.back() == '/') base.pop_back();
  return base + "/txid/" + Ensure0x(txid) + "?chain=" + ExplorerChain(network);
}

std::string ReportTransaction(const StacksTransaction& tx,
                              const NetworkDescriptor& network,
                              StacksApiClient& api,
                              const ReportOptions& options,
                              std::ostream& out) {
  const Bytes raw = tx.Serialize();
  const std::string hex = BytesToHex(raw);
  if (options.verbose) out << "Transaction hex: " << hex << std::endl;

  if (!options.broadcast) {
    if (!options.verbose) out << hex << std::endl;
    return hex;
  }

  Logger::Info("broadcasting " + std::to_string(raw.size()) + " bytes to " + api.ApiUrl());
  BroadcastResult result = api.BroadcastTransaction(raw);
  StructuredLogger::Instance().Event("broadcast", {
    {"accepted", result.accepted}, {"txid", result.txid}, {"error", result.error},
    {"reason", result.reason}, {"api", api.ApiUrl()}});
  if (!result.accepted) {
    std::string message = "Broadcast failed: " + result.error;
    if (!result.reason.empty()) message += " (" + result.reason + ")";
    throw BulkTransferError(ErrorKind::BroadcastError, message);
  }

  if (options.verbose) {
    out << "Transaction ID: " << result.txid << std::endl;
    out << "View in explorer: " << ExplorerLink(options.explorer_url, result.txid, network) << std::endl;
  } else {
    out << result.txid << std::endl;
  }
  return result.txid;
}
