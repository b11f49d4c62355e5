#include "crypto/secp256k1.hpp"
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <stdexcept>

namespace Crypto {
  static secp256k1_context* GetCtx() {
    static secp256k1_context* ctx = []{
      return secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    }();
    return ctx;
  }

  static Bytes SerializePublicKey(const secp256k1_pubkey& pub, bool compressed) {
    unsigned char out[65]; size_t outlen = sizeof(out);
    secp256k1_ec_pubkey_serialize(GetCtx(), out, &outlen, &pub,
                                  compressed ? SECP256K1_EC_COMPRESSED : SECP256K1_EC_UNCOMPRESSED);
    return Bytes(out, out + outlen);
  }

  Bytes Signature::ToVrs() const {
    Bytes out;
    out.reserve(65);
    out.push_back(recovery_id);
    out.insert(out.end(), r.begin(), r.end());
    out.insert(out.end(), s.begin(), s.end());
    return out;
  }

  bool IsValidPrivateKey(const Bytes& priv32) {
    return priv32.size() == 32 && secp256k1_ec_seckey_verify(GetCtx(), priv32.data()) == 1;
  }

  Signature SignDigest(const Bytes& priv32, const Bytes& digest32) {
    if (priv32.size() != 32 || digest32.size() != 32) throw std::invalid_argument("bad key/digest size");
    secp256k1_ecdsa_recoverable_signature sig_raw;
    if (!secp256k1_ecdsa_sign_recoverable(GetCtx(), &sig_raw, digest32.data(), priv32.data(), nullptr, nullptr))
      throw std::runtime_error("sign failed");
    unsigned char out64[64]; int recid = 0;
    secp256k1_ecdsa_recoverable_signature_serialize_compact(GetCtx(), out64, &recid, &sig_raw);
    Signature sig;
    sig.r.assign(out64, out64 + 32);
    sig.s.assign(out64 + 32, out64 + 64);
    sig.recovery_id = static_cast<unsigned char>(recid);
    return sig;
  }

  Bytes PublicKeyFromPrivate(const Bytes& priv32, bool compressed) {
    if (priv32.size() != 32) throw std::invalid_argument("bad key size");
    secp256k1_pubkey pub;
    if (!secp256k1_ec_pubkey_create(GetCtx(), &pub, priv32.data()))
      throw std::runtime_error("pubkey create failed");
    return SerializePublicKey(pub, compressed);
  }

  Bytes RecoverPublicKey(const Bytes& digest32, const Bytes& vrs65, bool compressed) {
    if (digest32.size() != 32 || vrs65.size() != 65) throw std::invalid_argument("bad digest/signature size");
    secp256k1_ecdsa_recoverable_signature sig_raw;
    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(GetCtx(), &sig_raw, &vrs65[1], vrs65[0]))
      throw std::invalid_argument("malformed recoverable signature");
    secp256k1_pubkey pub;
    if (!secp256k1_ecdsa_recover(GetCtx(), &pub, &sig_raw, digest32.data()))
      throw std::runtime_error("public key recovery failed");
    return SerializePublicKey(pub, compressed);
  }
}
