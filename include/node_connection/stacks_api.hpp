#pragma once
#include <string>
#include <unordered_map>
#include "utils/hex.hpp"

class HttpClient;

struct BroadcastResult {
  bool accepted = false;
  std::string txid;      // as returned by the node, quotes stripped
  std::string error;     // "error" of a rejection, or the transport failure
  std::string reason;    // "reason" of a rejection, when the node gives one
  std::string raw_body;
};

// Client for the Stacks node HTTP API rooted at api_url.
class StacksApiClient {
public:
  StacksApiClient(HttpClient& http, const std::string& api_url, int timeout_ms);
  // GET /v2/accounts/{address}?proof=0 -> "nonce". Throws std::runtime_error.
  unsigned long long GetAccountNonce(const std::string& address);
  // GET /v2/fees/transfer -> micro-STX per byte. Throws std::runtime_error.
  unsigned long long GetTransferFeeRate();
  // POST /v2/transactions with the raw transaction bytes. Never throws for
  // node or transport failures; those come back with accepted == false.
  BroadcastResult BroadcastTransaction(const Bytes& raw_tx);

  const std::string& ApiUrl() const { return api_url_; }
private:
  HttpClient& http_;
  std::string api_url_;
  int timeout_ms_;
  std::unordered_map<std::string, std::string> json_headers_;
  std::string Url(const std::string& path) const;
  std::string GetJson(const std::string& path);
};
