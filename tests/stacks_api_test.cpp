#include "node_connection/stacks_api.hpp"
#include "fake_http_client.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace {
const std::string kApi = "http://localhost:3999";
const std::string kSender = "STAW66WC3G8WA5F28JVNG1NTRJ6H76E7EMHDBMBN";
}

TEST(StacksApiTest, TrailingSlashIsDropped) {
  FakeHttpClient http;
  StacksApiClient api(http, kApi + "//", 500);
  EXPECT_EQ(api.ApiUrl(), kApi);
}

TEST(StacksApiTest, ReadsAccountNonce) {
  FakeHttpClient http;
  http.OnGet(kApi + "/v2/accounts/" + kSender + "?proof=0", 200,
             R"({"balance":"0x00000000000000000000000000989680","locked":"0x0","unlock_height":0,"nonce":12})");
  StacksApiClient api(http, kApi, 500);
  EXPECT_EQ(api.GetAccountNonce(kSender), 12u);
  ASSERT_EQ(http.requests.size(), 1u);
  EXPECT_EQ(http.requests[0].method, "GET");
}

TEST(StacksApiTest, NonceErrors) {
  FakeHttpClient http;
  http.OnGet(kApi + "/v2/accounts/A?proof=0", 404, "not found");
  http.OnGet(kApi + "/v2/accounts/B?proof=0", 200, R"({"balance":"0x0"})");
  http.OnGet(kApi + "/v2/accounts/C?proof=0", 200, "<html>");
  StacksApiClient api(http, kApi, 500);
  EXPECT_THROW(api.GetAccountNonce("A"), std::runtime_error);
  EXPECT_THROW(api.GetAccountNonce("B"), std::runtime_error);
  EXPECT_THROW(api.GetAccountNonce("C"), std::runtime_error);
  // unrouted: transport failure
  EXPECT_THROW(api.GetAccountNonce("D"), std::runtime_error);
}

TEST(StacksApiTest, ReadsTransferFeeRate) {
  FakeHttpClient http;
  http.OnGet(kApi + "/v2/fees/transfer", 200, "180\n");
  StacksApiClient api(http, kApi, 500);
  EXPECT_EQ(api.GetTransferFeeRate(), 180u);
}

TEST(StacksApiTest, FeeRateMustBeUnsignedInteger) {
  FakeHttpClient http;
  http.OnGet(kApi + "/v2/fees/transfer", 200, "-1");
  StacksApiClient api(http, kApi, 500);
  EXPECT_THROW(api.GetTransferFeeRate(), std::runtime_error);
}

TEST(StacksApiTest, BroadcastAcceptedReturnsTxid) {
  FakeHttpClient http;
  http.OnPost(kApi + "/v2/transactions", 200, "\"385d6bfada5726a6b412245f2ec1a7c3628897fd47cc183fbea3713edb51a403\"");
  StacksApiClient api(http, kApi, 500);
  Bytes raw{0x80, 0x80, 0x00};
  auto result = api.BroadcastTransaction(raw);
  EXPECT_TRUE(result.accepted);
  EXPECT_EQ(result.txid, "385d6bfada5726a6b412245f2ec1a7c3628897fd47cc183fbea3713edb51a403");
  ASSERT_EQ(http.requests.size(), 1u);
  EXPECT_EQ(http.requests[0].method, "POST");
  EXPECT_EQ(http.requests[0].body, std::string("\x80\x80\x00", 3));
  EXPECT_EQ(http.requests[0].headers.at("Content-Type"), "application/octet-stream");
}

TEST(StacksApiTest, BroadcastRejectionCarriesReason) {
  FakeHttpClient http;
  http.OnPost(kApi + "/v2/transactions", 400,
              R"({"error":"transaction rejected","reason":"BadNonce","txid":"abcd"})");
  StacksApiClient api(http, kApi, 500);
  auto result = api.BroadcastTransaction(Bytes{0x00});
  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.error, "transaction rejected");
  EXPECT_EQ(result.reason, "BadNonce");
  EXPECT_EQ(result.txid, "abcd");
}

TEST(StacksApiTest, BroadcastNonJsonRejection) {
  FakeHttpClient http;
  http.OnPost(kApi + "/v2/transactions", 502, "Bad Gateway");
  StacksApiClient api(http, kApi, 500);
  auto result = api.BroadcastTransaction(Bytes{0x00});
  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.error, "transaction rejected (HTTP 502)");
  EXPECT_EQ(result.reason, "Bad Gateway");
}

TEST(StacksApiTest, BroadcastTransportFailure) {
  FakeHttpClient http;
  http.FailPost(kApi + "/v2/transactions", "Couldn't connect to server");
  StacksApiClient api(http, kApi, 500);
  auto result = api.BroadcastTransaction(Bytes{0x00});
  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.error, "broadcast request failed");
  EXPECT_EQ(result.reason, "Couldn't connect to server");
}
