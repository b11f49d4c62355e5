#include "config/contracts.hpp"
#include "config/network.hpp"
#include "common/errors.hpp"
#include "constants/stacks.hpp"
#include "encoding/c32.hpp"
#include <gtest/gtest.h>

TEST(NetworkTest, ResolvesPresets) {
  auto mainnet = ResolveNetwork("mainnet");
  EXPECT_EQ(mainnet.chain_id, ChainId::Mainnet);
  EXPECT_EQ(mainnet.version, TransactionVersion::Mainnet);
  EXPECT_EQ(mainnet.api_url, MainnetPreset::kDefaultApiUrl);
  EXPECT_TRUE(std::holds_alternative<MainnetPreset>(mainnet.preset));

  auto testnet = ResolveNetwork("testnet");
  EXPECT_EQ(testnet.chain_id, ChainId::Testnet);
  EXPECT_EQ(testnet.api_url, TestnetPreset::kDefaultApiUrl);

  auto mocknet = ResolveNetwork("mocknet");
  EXPECT_EQ(mocknet.chain_id, ChainId::Testnet);
  EXPECT_EQ(mocknet.version, TransactionVersion::Testnet);
  EXPECT_EQ(mocknet.api_url, "http://localhost:3999");
  EXPECT_EQ(NetworkName(mocknet.preset), "mocknet");
}

TEST(NetworkTest, NodeUrlOverridesEndpointOnly) {
  auto n = ResolveNetwork("mainnet", std::string("http://127.0.0.1:20443"));
  EXPECT_EQ(n.api_url, "http://127.0.0.1:20443");
  EXPECT_EQ(n.chain_id, ChainId::Mainnet);
  EXPECT_EQ(ExplorerChain(n), "mainnet");

  auto t = ResolveNetwork("testnet", std::string("http://127.0.0.1:20443"));
  EXPECT_EQ(t.chain_id, ChainId::Testnet);
  EXPECT_EQ(ExplorerChain(t), "testnet");
}

TEST(NetworkTest, UnknownNameIsResolutionError) {
  try {
    ResolveNetwork("regtest");
    FAIL() << "expected NetworkResolutionError";
  } catch (const BulkTransferError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::NetworkResolutionError);
  }
  EXPECT_FALSE(ParseNetworkName("Mainnet").has_value());
}

TEST(NetworkTest, AddressVersionFollowsTransactionVersion) {
  EXPECT_EQ(P2PKHAddressVersion(ResolveNetwork("mainnet")), C32::kMainnetP2PKH);
  EXPECT_EQ(P2PKHAddressVersion(ResolveNetwork("mocknet")), C32::kTestnetP2PKH);
}

TEST(ContractTest, DefaultsFollowChainId) {
  EXPECT_EQ(ResolveContract(ResolveNetwork("testnet")), "STB44HYPYAT2BB2QE513NSP81HTMYWBJP02HPGK6.send-many");
  EXPECT_EQ(ResolveContract(ResolveNetwork("mocknet")), StacksConstants::DEFAULT_TESTNET_CONTRACT);
  EXPECT_EQ(ResolveContract(ResolveNetwork("mainnet")), "not-deployed");
}

TEST(ContractTest, ExplicitContractWinsVerbatim) {
  const std::string custom = "SP2J6ZY48GV1EZ5V2V5RB9MP66SW86PYKKNRV9EJ7.send-many-v2";
  EXPECT_EQ(ResolveContract(ResolveNetwork("mainnet"), custom), custom);
  EXPECT_EQ(ResolveContract(ResolveNetwork("testnet"), custom), custom);
  EXPECT_EQ(ResolveContract(ResolveNetwork("testnet"), std::string("anything at all")), "anything at all");
  EXPECT_EQ(ResolveContract(ResolveNetwork("testnet"), std::string()), "");
}

TEST(ContractTest, ParsesIdentifier) {
  auto id = ParseContractIdentifier(StacksConstants::DEFAULT_TESTNET_CONTRACT);
  EXPECT_EQ(id.address, "STB44HYPYAT2BB2QE513NSP81HTMYWBJP02HPGK6");
  EXPECT_EQ(id.name, "send-many");
}

TEST(ContractTest, PlaceholderAndMalformedIdentifiersFailToEncode) {
  for (const std::string bad : {"not-deployed", "STB44HYPYAT2BB2QE513NSP81HTMYWBJP02HPGK6.",
                                "STB44HYPYAT2BB2QE513NSP81HTMYWBJP02HPGK6.1abc", "bogus.send-many"}) {
    try {
      ParseContractIdentifier(bad);
      ADD_FAILURE() << bad << " was accepted";
    } catch (const BulkTransferError& e) {
      EXPECT_EQ(e.Kind(), ErrorKind::EncodingError) << bad;
    }
  }
}
