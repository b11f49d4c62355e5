#pragma once
#include <string>
#include "encoding/c32.hpp"
#include "tx/transaction.hpp"
#include "utils/hex.hpp"

// Holds a Stacks private key: 64 hex chars (uncompressed public key) or 66 hex
// chars ending in "01" (compressed public key).
class Signer {
public:
  // Throws BulkTransferError (InvalidSigningKey). The key text never appears in the message.
  explicit Signer(const std::string& private_key_hex);
  const Bytes& PublicKey() const { return pub_; }
  PubKeyEncoding KeyEncoding() const;
  // hash160 of the public key
  const Bytes& AccountHash() const { return hash160_; }
  C32::Address Address(unsigned char address_version) const;
  std::string AddressString(unsigned char address_version) const;
  // Fills the spending condition's signer and key encoding, then signs
  // over the transaction's current nonce and fee.
  void Sign(StacksTransaction& tx) const;
private:
  Bytes priv_;
  Bytes pub_;
  Bytes hash160_;
  bool compressed_ = false;
};
