#include "tx/transaction.hpp"
#include "crypto/hash.hpp"
#include "encoding/wire.hpp"
#include <stdexcept>

namespace {
  constexpr unsigned char kPayloadContractCall = 0x02;
  constexpr unsigned char kPostConditionStx = 0x00;
  constexpr unsigned char kPostConditionPrincipalStandard = 0x02;

  void putAddress(Bytes& out, const C32::Address& a) {
    if (a.hash160.size() != 20) throw std::invalid_argument("address hash must be 20 bytes");
    Wire::PutU8(out, a.version);
    Wire::PutBytes(out, a.hash160);
  }

  void putSpendingCondition(Bytes& out, const SingleSigSpendingCondition& c) {
    if (c.signer.size() != 20) throw std::invalid_argument("spending condition signer must be 20 bytes");
    if (c.signature.size() != kRecoverableSignatureSize) throw std::invalid_argument("signature must be 65 bytes");
    Wire::PutU8(out, static_cast<unsigned char>(c.hash_mode));
    Wire::PutBytes(out, c.signer);
    Wire::PutU64(out, c.nonce);
    Wire::PutU64(out, c.fee);
    Wire::PutU8(out, static_cast<unsigned char>(c.key_encoding));
    Wire::PutBytes(out, c.signature);
  }

  void putPostCondition(Bytes& out, const StxPostCondition& pc) {
    Wire::PutU8(out, kPostConditionStx);
    Wire::PutU8(out, kPostConditionPrincipalStandard);
    putAddress(out, pc.principal);
    Wire::PutU8(out, static_cast<unsigned char>(pc.code));
    Wire::PutU64(out, pc.amount);
  }

  void putPayload(Bytes& out, const ContractCallPayload& p) {
    Wire::PutU8(out, kPayloadContractCall);
    putAddress(out, p.contract_address);
    Wire::PutShortString(out, p.contract_name);
    Wire::PutShortString(out, p.function_name);
    Wire::PutU32(out, static_cast<unsigned long>(p.args.size()));
    for (const auto& arg : p.args) Wire::PutBytes(out, Clarity::Serialize(arg));
  }
}

Bytes StacksTransaction::Serialize() const {
  Bytes out;
  Wire::PutU8(out, static_cast<unsigned char>(version));
  Wire::PutU32(out, static_cast<unsigned long>(chain_id));
  Wire::PutU8(out, static_cast<unsigned char>(auth_type));
  putSpendingCondition(out, spending_condition);
  Wire::PutU8(out, static_cast<unsigned char>(anchor_mode));
  Wire::PutU8(out, static_cast<unsigned char>(post_condition_mode));
  Wire::PutU32(out, static_cast<unsigned long>(post_conditions.size()));
  for (const auto& pc : post_conditions) putPostCondition(out, pc);
  putPayload(out, payload);
  return out;
}

std::string StacksTransaction::SerializeHex() const {
  return BytesToHex(Serialize());
}

std::string StacksTransaction::Txid() const {
  return BytesToHex(Crypto::Sha512_256(Serialize()));
}

Bytes StacksTransaction::InitialSigHash() const {
  StacksTransaction cleared = *this;
  cleared.spending_condition.nonce = 0;
  cleared.spending_condition.fee = 0;
  cleared.spending_condition.signature.assign(kRecoverableSignatureSize, 0);
  return Crypto::Sha512_256(cleared.Serialize());
}

Bytes PreSignSigHash(const Bytes& sighash, AuthType auth_type, unsigned long long fee, unsigned long long nonce) {
  Bytes buf(sighash);
  Wire::PutU8(buf, static_cast<unsigned char>(auth_type));
  Wire::PutU64(buf, fee);
  Wire::PutU64(buf, nonce);
  return Crypto::Sha512_256(buf);
}
