#include "transfer/orchestrator.hpp"
#include "common/logger.hpp"
#include "config/contracts.hpp"
#include "config/network.hpp"
#include "node_connection/stacks_api.hpp"
#include "transfer/recipient.hpp"
#include "transfer/reporter.hpp"
#include "transfer/send_many.hpp"

std::string RunBulkTransfer(const BulkTransferOptions& options, HttpClient& http, std::ostream& out) {
  auto recipients = ParseRecipients(options.recipient_args);
  NetworkDescriptor network = ResolveNetwork(options.network, options.node_url);
  const std::string contract = ResolveContract(network, options.contract_address);
  Logger::Info("contract " + contract + " on " + NetworkName(network.preset));

  StacksApiClient api(http, network.api_url, options.http_timeout_ms);

  TransactionRequest request;
  request.recipients = std::move(recipients);
  request.network = network;
  request.sender_key = options.private_key;
  request.contract_identifier = contract;
  request.nonce = options.nonce;
  request.fee = options.fee;
  StacksTransaction tx = BuildSendManyTransaction(request, api);

  ReportOptions report;
  report.broadcast = options.broadcast;
  report.verbose = options.verbose;
  report.explorer_url = options.explorer_url;
  return ReportTransaction(tx, network, api, report, out);
}
