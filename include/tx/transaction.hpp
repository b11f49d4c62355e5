#pragma once
#include <string>
#include <vector>
#include "config/network.hpp"
#include "encoding/c32.hpp"
#include "encoding/clarity.hpp"
#include "utils/hex.hpp"

enum class AuthType : unsigned char { Standard = 0x04, Sponsored = 0x05 };
enum class AddressHashMode : unsigned char { SerializeP2PKH = 0x00 };
enum class PubKeyEncoding : unsigned char { Compressed = 0x00, Uncompressed = 0x01 };
enum class AnchorMode : unsigned char { OnChainOnly = 0x01, OffChainOnly = 0x02, Any = 0x03 };
enum class PostConditionMode : unsigned char { Allow = 0x01, Deny = 0x02 };
enum class FungibleConditionCode : unsigned char {
  Equal = 0x01, Greater = 0x02, GreaterEqual = 0x03, Less = 0x04, LessEqual = 0x05
};

constexpr size_t kRecoverableSignatureSize = 65;

struct SingleSigSpendingCondition {
  AddressHashMode hash_mode = AddressHashMode::SerializeP2PKH;
  Bytes signer;                  // hash160 of the public key
  unsigned long long nonce = 0;
  unsigned long long fee = 0;    // micro-STX
  PubKeyEncoding key_encoding = PubKeyEncoding::Compressed;
  Bytes signature = Bytes(kRecoverableSignatureSize, 0);
};

// STX sent by a standard principal compared against amount.
struct StxPostCondition {
  C32::Address principal;
  FungibleConditionCode code = FungibleConditionCode::Equal;
  unsigned long long amount = 0;
};

struct ContractCallPayload {
  C32::Address contract_address;
  std::string contract_name;
  std::string function_name;
  std::vector<Clarity::Value> args;
};

class StacksTransaction {
public:
  TransactionVersion version = TransactionVersion::Testnet;
  ChainId chain_id = ChainId::Testnet;
  AuthType auth_type = AuthType::Standard;
  SingleSigSpendingCondition spending_condition;
  AnchorMode anchor_mode = AnchorMode::Any;
  PostConditionMode post_condition_mode = PostConditionMode::Deny;
  std::vector<StxPostCondition> post_conditions;
  ContractCallPayload payload;

  Bytes Serialize() const;
  // Lowercase hex of Serialize(), no prefix.
  std::string SerializeHex() const;
  // SHA-512/256 of the serialized transaction, lowercase hex.
  std::string Txid() const;
  // Txid of a copy whose spending condition has nonce, fee and signature cleared.
  Bytes InitialSigHash() const;
};

// SHA-512/256(sighash || auth type || fee || nonce): the digest a single-sig origin signs.
Bytes PreSignSigHash(const Bytes& sighash, AuthType auth_type, unsigned long long fee, unsigned long long nonce);
