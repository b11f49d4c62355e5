#pragma once
#include <string>
#include <optional>
#include <variant>

enum class ChainId : unsigned long { Mainnet = 0x00000001UL, Testnet = 0x80000000UL };
enum class TransactionVersion : unsigned char { Mainnet = 0x00, Testnet = 0x80 };

struct MainnetPreset {
  static constexpr const char* kName = "mainnet";
  static constexpr ChainId kChainId = ChainId::Mainnet;
  static constexpr TransactionVersion kVersion = TransactionVersion::Mainnet;
  static constexpr const char* kDefaultApiUrl = "https://stacks-node-api.mainnet.stacks.co";
};

struct TestnetPreset {
  static constexpr const char* kName = "testnet";
  static constexpr ChainId kChainId = ChainId::Testnet;
  static constexpr TransactionVersion kVersion = TransactionVersion::Testnet;
  static constexpr const char* kDefaultApiUrl = "https://stacks-node-api.testnet.stacks.co";
};

// Local node speaking the testnet formats.
struct MocknetPreset {
  static constexpr const char* kName = "mocknet";
  static constexpr ChainId kChainId = ChainId::Testnet;
  static constexpr TransactionVersion kVersion = TransactionVersion::Testnet;
  static constexpr const char* kDefaultApiUrl = "http://localhost:3999";
};

using NetworkPreset = std::variant<MocknetPreset, TestnetPreset, MainnetPreset>;

struct NetworkDescriptor {
  NetworkPreset preset;
  ChainId chain_id = ChainId::Testnet;
  TransactionVersion version = TransactionVersion::Testnet;
  std::string api_url;
};

std::optional<NetworkPreset> ParseNetworkName(const std::string& name);
std::string NetworkName(const NetworkPreset& preset);
NetworkDescriptor DescriptorFor(const NetworkPreset& preset);

// Builds the descriptor for one of mocknet/testnet/mainnet. node_url, when
// present, replaces the API endpoint only. Throws BulkTransferError
// (NetworkResolutionError) for any other name.
NetworkDescriptor ResolveNetwork(const std::string& name, const std::optional<std::string>& node_url = std::nullopt);

// Version byte of single-sig (P2PKH) addresses on this network.
unsigned char P2PKHAddressVersion(const NetworkDescriptor& network);
// "mainnet" or "testnet", as the explorer's chain= parameter expects.
std::string ExplorerChain(const NetworkDescriptor& network);
