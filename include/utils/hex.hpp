#pragma once
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <stdexcept>

using Bytes = std::vector<unsigned char>;

inline std::string Ensure0x(const std::string& in) {
  if (in.size() >= 2 && (in[0] == '0') && (in[1] == 'x' || in[1] == 'X')) return in;
  return std::string("0x") + in;
}

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

// True for an even-length run of hex digits (no 0x prefix).
inline bool IsHex(const std::string& s) {
  if (s.size() % 2 != 0) return false;
  return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isxdigit(c) != 0; });
}

inline Bytes HexToBytes(const std::string& hex) {
  std::string s = Strip0x(hex);
  if (!IsHex(s)) throw std::invalid_argument("not a hex string");
  auto val = [](char c)->int{ if (c>='0'&&c<='9') return c-'0'; if (c>='a'&&c<='f') return 10+c-'a'; return 10+c-'A'; };
  Bytes out; out.reserve(s.size() / 2);
  for (size_t i = 0; i + 1 < s.size(); i += 2) {
    out.push_back(static_cast<unsigned char>((val(s[i]) << 4) | val(s[i+1])));
  }
  return out;
}

// Lowercase, no prefix.
inline std::string BytesToHex(const Bytes& data) {
  static const char* hex = "0123456789abcdef";
  std::string out; out.reserve(2 * data.size());
  for (unsigned char b : data) { out += hex[b >> 4]; out += hex[b & 0xF]; }
  return out;
}
