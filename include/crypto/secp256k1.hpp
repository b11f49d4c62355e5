#pragma once
#include "utils/hex.hpp"

namespace Crypto {
  struct Signature {
    Bytes r;
    Bytes s;
    unsigned char recovery_id = 0;
    // 65 bytes: recovery id || r || s
    Bytes ToVrs() const;
  };
  bool IsValidPrivateKey(const Bytes& priv32);
  // Sign 32-byte digest with secp256k1 (RFC 6979 nonce, low-S); private key is 32-byte raw
  Signature SignDigest(const Bytes& priv32, const Bytes& digest32);
  // 33-byte compressed (0x02/0x03 || X) or 65-byte uncompressed (0x04 || X || Y) public key
  Bytes PublicKeyFromPrivate(const Bytes& priv32, bool compressed);
  // Inverse of SignDigest: public key that produced a recovery-id || r || s signature
  Bytes RecoverPublicKey(const Bytes& digest32, const Bytes& vrs65, bool compressed);
}
