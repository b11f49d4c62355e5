#pragma once
#include <string>
#include <stdexcept>
#include "utils/hex.hpp"

// Big-endian primitives of the Stacks consensus serialization.
namespace Wire {
  inline void PutU8(Bytes& out, unsigned char v) { out.push_back(v); }

  inline void PutU32(Bytes& out, unsigned long v) {
    for (int i = 3; i >= 0; --i) out.push_back(static_cast<unsigned char>((v >> (i * 8)) & 0xFF));
  }

  inline void PutU64(Bytes& out, unsigned long long v) {
    for (int i = 7; i >= 0; --i) out.push_back(static_cast<unsigned char>((v >> (i * 8)) & 0xFF));
  }

  inline void PutBytes(Bytes& out, const Bytes& more) { out.insert(out.end(), more.begin(), more.end()); }

  // One length byte followed by the raw characters (contract, function and tuple key names).
  inline void PutShortString(Bytes& out, const std::string& s) {
    if (s.size() > 255) throw std::length_error("name longer than 255 bytes: " + s);
    out.push_back(static_cast<unsigned char>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
  }
}
