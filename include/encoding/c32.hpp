#pragma once
#include <string>
#include <utility>
#include "utils/hex.hpp"

// Crockford base-32 ("c32") as used by Stacks addresses.
namespace C32 {
  constexpr unsigned char kMainnetP2PKH = 22; // 'P'
  constexpr unsigned char kMainnetP2SH = 20;  // 'M'
  constexpr unsigned char kTestnetP2PKH = 26; // 'T'
  constexpr unsigned char kTestnetP2SH = 21;  // 'N'

  struct Address {
    unsigned char version = 0;
    Bytes hash160; // 20 bytes
  };

  // Each leading zero byte becomes one leading '0'.
  std::string Encode(const Bytes& data);
  // Inverse of Encode; throws std::invalid_argument on characters outside the alphabet.
  Bytes Decode(const std::string& c32);

  // version char || c32(data || first 4 bytes of sha256d(version || data))
  std::string CheckEncode(unsigned char version, const Bytes& data);
  // Accepts lowercase and the O/I/L aliases; throws std::invalid_argument on checksum mismatch.
  std::pair<unsigned char, Bytes> CheckDecode(const std::string& c32check);

  std::string EncodeAddress(const Address& address);
  Address DecodeAddress(const std::string& address);
  bool IsValidAddress(const std::string& address);
}
