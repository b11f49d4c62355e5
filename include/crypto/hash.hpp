#pragma once
#include "utils/hex.hpp"

namespace Crypto {
  Bytes Sha256(const Bytes& data);
  // SHA-256 applied twice; c32check checksums use the first 4 bytes
  Bytes DoubleSha256(const Bytes& data);
  // RIPEMD-160(SHA-256(data)), the 20-byte account hash of a public key
  Bytes Hash160(const Bytes& data);
  // SHA-512/256 (FIPS 180-4), used for txids and signature hashes
  Bytes Sha512_256(const Bytes& data);
}
