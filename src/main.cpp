#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "constants/stacks.hpp"
#include "net/http_client.hpp"
#include "telemetry/structured_logger.hpp"
#include "transfer/orchestrator.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <iostream>
#include <memory>

namespace {
// Flushes and stops both log writers on every exit path.
struct LoggingScope {
  LoggingScope() {
    if (auto path = ConfigManager::Get("LOG_FILE")) {
      if (!path->empty()) Logger::Initialize(*path, ParseLogLevel(ConfigManager::GetOr("LOG_LEVEL", "info")));
    }
    if (auto path = ConfigManager::Get("METRICS_FILE")) {
      if (!path->empty()) StructuredLogger::Instance().Initialize(*path);
    }
  }
  ~LoggingScope() {
    StructuredLogger::Instance().Shutdown();
    Logger::Shutdown();
  }
};

const char* kDescription =
  "Execute a bulk STX transfer.\n"
  "The bulk transfer is executed in a single transaction by invoking a contract-call\n"
  "on the \"send-many\" contract.\n\n"
  "Example:\n"
  "  stx-bulk-transfer STADMRP577SC3MCNP7T3PRSTZBJ75FJ59JGABZTW,100 "
  "ST2WPFYAW85A0YK9ACJR8JGWPM19VWYF90J8P5ZTH,50 -k my_private_key -n testnet -b";
}

int main(int argc, char** argv) {
  const char* env_path = std::getenv("STX_BULK_ENV");
  ConfigManager::Initialize(env_path ? env_path : ".env");
  LoggingScope logging;

  BulkTransferOptions opts;
  opts.http_timeout_ms = ConfigManager::GetPositiveIntOr("HTTP_TIMEOUT_MS", StacksConstants::DEFAULT_HTTP_TIMEOUT_MS);
  opts.explorer_url = ConfigManager::GetOr("EXPLORER_URL", StacksConstants::EXPLORER_URL);

  CLI::App app{kDescription, "stx-bulk-transfer"};
  std::string node_url, contract_address;
  unsigned long long nonce = 0, fee = 0;
  app.add_option("recipients", opts.recipient_args,
                 "Recipients in the format \"address,amount_ustx\", e.g. "
                 "STADMRP577SC3MCNP7T3PRSTZBJ75FJ59JGABZTW,100")->required();
  app.add_option("-k,--privateKey", opts.private_key, "Your private key")->required();
  app.add_flag("-b,--broadcast", opts.broadcast, "Whether to broadcast this transaction or not.");
  app.add_option("-n,--network", opts.network, "Which network to broadcast this to")
    ->check(CLI::IsMember({"mocknet", "testnet", "mainnet"}))
    ->capture_default_str();
  auto* node_url_opt = app.add_option("-u,--nodeUrl", node_url, "Override the network's default node API URL");
  app.add_flag("-v,--verbose", opts.verbose, "Print the transaction hex and explorer link");
  auto* contract_opt = app.add_option("-c,--contractAddress", contract_address,
                                      "Manually specify the contract address for send-many. "
                                      "If omitted, default contracts will be used.");
  auto* nonce_opt = app.add_option("--nonce", nonce, "Optionally specify a nonce for this transaction");
  auto* fee_opt = app.add_option("--fee", fee, "Optionally specify the fee in micro-STX instead of estimating it");
  app.footer("Testnet contract: " + StacksConstants::DEFAULT_TESTNET_CONTRACT +
             "\nMainnet contract: " + StacksConstants::DEFAULT_MAINNET_CONTRACT);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    if (e.get_exit_code() != 0) Logger::Error(std::string(ErrorKindName(ErrorKind::ArgumentParseError)) + ": " + e.what());
    return app.exit(e);
  }
  if (node_url_opt->count() > 0) opts.node_url = node_url;
  if (contract_opt->count() > 0) opts.contract_address = contract_address;
  if (nonce_opt->count() > 0) opts.nonce = nonce;
  if (fee_opt->count() > 0) opts.fee = fee;

  try {
    std::unique_ptr<HttpClient> http(CreateCurlHttpClient());
    RunBulkTransfer(opts, *http, std::cout);
    return 0;
  } catch (const BulkTransferError& e) {
    Logger::Error(std::string(ErrorKindName(e.Kind())) + ": " + e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    Logger::Critical(std::string("unexpected failure: ") + e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
