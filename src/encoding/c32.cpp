#include "encoding/c32.hpp"
#include "crypto/hash.hpp"
#include <stdexcept>

namespace {
  const std::string kAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

  int digitValue(char c) {
    auto pos = kAlphabet.find(c);
    return pos == std::string::npos ? -1 : static_cast<int>(pos);
  }

  std::string normalize(const std::string& in) {
    std::string out; out.reserve(in.size());
    for (char c : in) {
      char u = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      if (u == 'O') u = '0';
      else if (u == 'L' || u == 'I') u = '1';
      out.push_back(u);
    }
    return out;
  }

  Bytes checksum(unsigned char version, const Bytes& data) {
    Bytes buf; buf.reserve(data.size() + 1);
    buf.push_back(version);
    buf.insert(buf.end(), data.begin(), data.end());
    auto h = Crypto::DoubleSha256(buf);
    return Bytes(h.begin(), h.begin() + 4);
  }
}

namespace C32 {
  std::string Encode(const Bytes& data) {
    size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) ++zeros;
    // long division of the big-endian number by 32
    Bytes num(data.begin() + zeros, data.end());
    std::string digits;
    while (!num.empty()) {
      Bytes quotient; quotient.reserve(num.size());
      unsigned int rem = 0;
      for (unsigned char b : num) {
        unsigned int acc = (rem << 8) | b;
        unsigned char q = static_cast<unsigned char>(acc / 32);
        rem = acc % 32;
        if (!quotient.empty() || q != 0) quotient.push_back(q);
      }
      digits.insert(digits.begin(), kAlphabet[rem]);
      num.swap(quotient);
    }
    return std::string(zeros, kAlphabet[0]) + digits;
  }

  Bytes Decode(const std::string& c32) {
    size_t zeros = 0;
    while (zeros < c32.size() && c32[zeros] == kAlphabet[0]) ++zeros;
    Bytes num; // big-endian, no leading zero bytes
    for (size_t i = zeros; i < c32.size(); ++i) {
      int d = digitValue(c32[i]);
      if (d < 0) throw std::invalid_argument(std::string("invalid c32 character '") + c32[i] + "'");
      unsigned int carry = static_cast<unsigned int>(d);
      for (auto it = num.rbegin(); it != num.rend(); ++it) {
        unsigned int acc = static_cast<unsigned int>(*it) * 32 + carry;
        *it = static_cast<unsigned char>(acc & 0xFF);
        carry = acc >> 8;
      }
      while (carry) { num.insert(num.begin(), static_cast<unsigned char>(carry & 0xFF)); carry >>= 8; }
    }
    Bytes out(zeros, 0);
    out.insert(out.end(), num.begin(), num.end());
    return out;
  }

  std::string CheckEncode(unsigned char version, const Bytes& data) {
    if (version >= 32) throw std::invalid_argument("c32check version must be < 32");
    Bytes payload = data;
    auto sum = checksum(version, data);
    payload.insert(payload.end(), sum.begin(), sum.end());
    return std::string(1, kAlphabet[version]) + Encode(payload);
  }

  std::pair<unsigned char, Bytes> CheckDecode(const std::string& c32check) {
    std::string s = normalize(c32check);
    if (s.empty()) throw std::invalid_argument("empty c32check string");
    int version = digitValue(s[0]);
    if (version < 0) throw std::invalid_argument("invalid c32check version character");
    Bytes payload = Decode(s.substr(1));
    if (payload.size() < 4) throw std::invalid_argument("c32check string too short");
    Bytes data(payload.begin(), payload.end() - 4);
    Bytes sum(payload.end() - 4, payload.end());
    if (sum != checksum(static_cast<unsigned char>(version), data))
      throw std::invalid_argument("c32check checksum mismatch");
    return {static_cast<unsigned char>(version), data};
  }

  std::string EncodeAddress(const Address& address) {
    if (address.hash160.size() != 20) throw std::invalid_argument("address hash must be 20 bytes");
    return "S" + CheckEncode(address.version, address.hash160);
  }

  Address DecodeAddress(const std::string& address) {
    if (address.size() <= 5) throw std::invalid_argument("invalid c32 address: too short");
    if (address[0] != 'S') throw std::invalid_argument("invalid c32 address: must start with 'S'");
    auto decoded = CheckDecode(address.substr(1));
    if (decoded.second.size() != 20) throw std::invalid_argument("invalid c32 address: hash must be 20 bytes");
    return Address{decoded.first, decoded.second};
  }

  bool IsValidAddress(const std::string& address) {
    try {
      DecodeAddress(address);
      return true;
    } catch (const std::invalid_argument&) {
      return false;
    }
  }
}
