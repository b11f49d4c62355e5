#include "crypto/hash.hpp"
#include <cryptopp/sha.h>
#include <cryptopp/ripemd.h>
#include <openssl/evp.h>
#include <stdexcept>

namespace Crypto {
  Bytes Sha256(const Bytes& data) {
    CryptoPP::SHA256 hash;
    Bytes digest(CryptoPP::SHA256::DIGESTSIZE);
    hash.CalculateDigest(digest.data(), data.data(), data.size());
    return digest;
  }

  Bytes DoubleSha256(const Bytes& data) {
    return Sha256(Sha256(data));
  }

  Bytes Hash160(const Bytes& data) {
    auto sha = Sha256(data);
    CryptoPP::RIPEMD160 hash;
    Bytes digest(CryptoPP::RIPEMD160::DIGESTSIZE);
    hash.CalculateDigest(digest.data(), sha.data(), sha.size());
    return digest;
  }

  // Crypto++ has no SHA-512/256; OpenSSL's EVP digest provides it.
  Bytes Sha512_256(const Bytes& data) {
    Bytes digest(32);
    unsigned int len = 0;
    if (!EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha512_256(), nullptr) || len != 32)
      throw std::runtime_error("sha512/256 digest failed");
    return digest;
  }
}
