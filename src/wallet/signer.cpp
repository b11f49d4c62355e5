#include "wallet/signer.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/hash.hpp"
#include "crypto/secp256k1.hpp"
#include <stdexcept>

Signer::Signer(const std::string& private_key_hex) {
  std::string hex = Strip0x(private_key_hex);
  if (hex.size() != 64 && hex.size() != 66) {
    throw BulkTransferError(ErrorKind::InvalidSigningKey, "Private key must be 64 or 66 hex characters");
  }
  if (!IsHex(hex)) {
    throw BulkTransferError(ErrorKind::InvalidSigningKey, "Private key is not a hex string");
  }
  if (hex.size() == 66) {
    if (ToLowerHex(hex.substr(64)) != "01") {
      throw BulkTransferError(ErrorKind::InvalidSigningKey, "66-character private key must end in 01");
    }
    compressed_ = true;
  }
  priv_ = HexToBytes(hex.substr(0, 64));
  if (!Crypto::IsValidPrivateKey(priv_)) {
    throw BulkTransferError(ErrorKind::InvalidSigningKey, "Private key is outside the secp256k1 range");
  }
  pub_ = Crypto::PublicKeyFromPrivate(priv_, compressed_);
  hash160_ = Crypto::Hash160(pub_);
}

PubKeyEncoding Signer::KeyEncoding() const {
  return compressed_ ? PubKeyEncoding::Compressed : PubKeyEncoding::Uncompressed;
}

C32::Address Signer::Address(unsigned char address_version) const {
  return C32::Address{address_version, hash160_};
}

std::string Signer::AddressString(unsigned char address_version) const {
  return C32::EncodeAddress(Address(address_version));
}

void Signer::Sign(StacksTransaction& tx) const {
  auto& cond = tx.spending_condition;
  cond.hash_mode = AddressHashMode::SerializeP2PKH;
  cond.signer = hash160_;
  cond.key_encoding = KeyEncoding();
  auto sighash = tx.InitialSigHash();
  auto digest = PreSignSigHash(sighash, tx.auth_type, cond.fee, cond.nonce);
  auto sig = Crypto::SignDigest(priv_, digest);
  cond.signature = sig.ToVrs();
  Logger::Debug("signed transaction nonce=" + std::to_string(cond.nonce) + " fee=" + std::to_string(cond.fee));
}
