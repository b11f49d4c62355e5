#include "config/network.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "encoding/c32.hpp"

std::optional<NetworkPreset> ParseNetworkName(const std::string& name) {
  if (name == MocknetPreset::kName) return NetworkPreset{MocknetPreset{}};
  if (name == TestnetPreset::kName) return NetworkPreset{TestnetPreset{}};
  if (name == MainnetPreset::kName) return NetworkPreset{MainnetPreset{}};
  return std::nullopt;
}

std::string NetworkName(const NetworkPreset& preset) {
  return std::visit([](const auto& p) { return std::string(p.kName); }, preset);
}

NetworkDescriptor DescriptorFor(const NetworkPreset& preset) {
  return std::visit([&](const auto& p) {
    NetworkDescriptor d;
    d.preset = preset;
    d.chain_id = p.kChainId;
    d.version = p.kVersion;
    d.api_url = p.kDefaultApiUrl;
    return d;
  }, preset);
}

NetworkDescriptor ResolveNetwork(const std::string& name, const std::optional<std::string>& node_url) {
  auto preset = ParseNetworkName(name);
  if (!preset) {
    throw BulkTransferError(ErrorKind::NetworkResolutionError, "Unable to get network '" + name + "'");
  }
  NetworkDescriptor network = DescriptorFor(*preset);
  if (node_url && !node_url->empty()) network.api_url = *node_url;
  Logger::Info("network " + name + " api=" + network.api_url);
  return network;
}

unsigned char P2PKHAddressVersion(const NetworkDescriptor& network) {
  return network.version == TransactionVersion::Mainnet ? C32::kMainnetP2PKH : C32::kTestnetP2PKH;
}

std::string ExplorerChain(const NetworkDescriptor& network) {
  return network.chain_id == ChainId::Mainnet ? "mainnet" : "testnet";
}
