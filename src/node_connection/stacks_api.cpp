#include "node_connection/stacks_api.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <stdexcept>

using json = nlohmann::json;

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

static std::string StripQuotes(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) if (c != '"') out.push_back(c);
  return out;
}

StacksApiClient::StacksApiClient(HttpClient& http, const std::string& api_url, int timeout_ms)
  : http_(http), api_url_(api_url), timeout_ms_(timeout_ms) {
  while (!api_url_.empty() && api_url_.back() == '/') api_url_.pop_back();
  json_headers_["Accept"] = "application/json";
}

std::string StacksApiClient::Url(const std::string& path) const {
  return api_url_ + path;
}

std::string StacksApiClient::GetJson(const std::string& path) {
  auto resp = http_.Get(Url(path), json_headers_, timeout_ms_);
  if (resp.status == 0) {
    throw std::runtime_error("GET " + path + " failed: " + resp.error);
  }
  if (resp.status < 200 || resp.status >= 300) {
    Logger::Error("GET " + path + " failed status=" + std::to_string(resp.status));
    throw std::runtime_error("GET " + path + " returned HTTP " + std::to_string(resp.status));
  }
  return resp.body;
}

unsigned long long StacksApiClient::GetAccountNonce(const std::string& address) {
  auto body = GetJson("/v2/accounts/" + address + "?proof=0");
  try {
    auto j = json::parse(body);
    if (!j.contains("nonce") || !j["nonce"].is_number_unsigned()) {
      throw std::runtime_error("account response has no nonce");
    }
    return j["nonce"].get<unsigned long long>();
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("malformed account response: ") + e.what());
  }
}

unsigned long long StacksApiClient::GetTransferFeeRate() {
  auto body = GetJson("/v2/fees/transfer");
  try {
    auto j = json::parse(body);
    if (!j.is_number_unsigned()) throw std::runtime_error("fee rate is not an unsigned integer: " + Trim(body));
    return j.get<unsigned long long>();
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("malformed fee rate response: ") + e.what());
  }
}

BroadcastResult StacksApiClient::BroadcastTransaction(const Bytes& raw_tx) {
  BroadcastResult result;
  std::unordered_map<std::string, std::string> headers{{"Content-Type", "application/octet-stream"}};
  std::string body(raw_tx.begin(), raw_tx.end());
  auto resp = http_.Post(Url("/v2/transactions"), body, headers, timeout_ms_);
  result.raw_body = resp.body;
  if (resp.status == 0) {
    result.error = "broadcast request failed";
    result.reason = resp.error;
    return result;
  }
  if (resp.status >= 200 && resp.status < 300) {
    result.accepted = true;
    result.txid = StripQuotes(Trim(resp.body));
    Logger::Info("broadcast accepted txid=" + result.txid);
    return result;
  }
  try {
    auto j = json::parse(resp.body);
    if (j.is_object()) {
      if (j.contains("error") && j["error"].is_string()) result.error = j["error"].get<std::string>();
      if (j.contains("reason") && j["reason"].is_string()) result.reason = j["reason"].get<std::string>();
      if (j.contains("txid") && j["txid"].is_string()) result.txid = j["txid"].get<std::string>();
    }
  } catch (const json::exception&) {
    result.reason = Trim(resp.body);
  }
  if (result.error.empty()) result.error = "transaction rejected (HTTP " + std::to_string(resp.status) + ")";
  Logger::Error("broadcast rejected: " + result.error + (result.reason.empty() ? "" : " (" + result.reason + ")"));
  return result;
}
