#include "encoding/clarity.hpp"
#include "encoding/wire.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace {
  constexpr size_t kUInt128Size = 16;

  void serializeInto(Bytes& out, const Clarity::Value& v) {
    using Clarity::Type;
    Wire::PutU8(out, static_cast<unsigned char>(v.type));
    switch (v.type) {
      case Type::UInt:
        if (v.data.size() != kUInt128Size) throw std::invalid_argument("clarity uint must be 16 bytes");
        Wire::PutBytes(out, v.data);
        break;
      case Type::PrincipalStandard:
        Wire::PutU8(out, v.principal.version);
        Wire::PutBytes(out, v.principal.hash160);
        break;
      case Type::List:
        Wire::PutU32(out, static_cast<unsigned long>(v.items.size()));
        for (const auto& item : v.items) serializeInto(out, item);
        break;
      case Type::Tuple: {
        std::vector<size_t> order(v.keys.size());
        std::iota(order.begin(), order.end(), 0);
        std::sort(order.begin(), order.end(), [&](size_t a, size_t b){ return v.keys[a] < v.keys[b]; });
        Wire::PutU32(out, static_cast<unsigned long>(order.size()));
        for (size_t i : order) {
          Wire::PutShortString(out, v.keys[i]);
          serializeInto(out, v.items[i]);
        }
        break;
      }
    }
  }
}

namespace Clarity {
  Value UInt(unsigned long long v) {
    Value out;
    out.type = Type::UInt;
    out.data.assign(kUInt128Size, 0);
    for (size_t i = 0; i < 8; ++i) out.data[kUInt128Size - 1 - i] = static_cast<unsigned char>((v >> (i * 8)) & 0xFF);
    return out;
  }

  Value UIntFromDecimal(const std::string& decimal) {
    if (decimal.empty()) throw std::invalid_argument("empty integer");
    Bytes acc(kUInt128Size, 0);
    for (char c : decimal) {
      if (c < '0' || c > '9') throw std::invalid_argument("not a decimal integer: " + decimal);
      // acc = acc * 10 + digit, big-endian
      unsigned int carry = static_cast<unsigned int>(c - '0');
      for (auto it = acc.rbegin(); it != acc.rend(); ++it) {
        unsigned int x = static_cast<unsigned int>(*it) * 10 + carry;
        *it = static_cast<unsigned char>(x & 0xFF);
        carry = x >> 8;
      }
      if (carry) throw std::out_of_range("integer does not fit in 128 bits: " + decimal);
    }
    Value out;
    out.type = Type::UInt;
    out.data = acc;
    return out;
  }

  Value StandardPrincipal(const std::string& address) {
    Value out;
    out.type = Type::PrincipalStandard;
    out.principal = C32::DecodeAddress(address);
    return out;
  }

  Value List(std::vector<Value> items) {
    Value out;
    out.type = Type::List;
    out.items = std::move(items);
    return out;
  }

  Value Tuple(const std::vector<std::pair<std::string, Value>>& fields) {
    Value out;
    out.type = Type::Tuple;
    for (const auto& f : fields) {
      if (std::find(out.keys.begin(), out.keys.end(), f.first) != out.keys.end())
        throw std::invalid_argument("duplicate tuple key: " + f.first);
      out.keys.push_back(f.first);
      out.items.push_back(f.second);
    }
    return out;
  }

  Bytes Serialize(const Value& v) {
    Bytes out;
    serializeInto(out, v);
    return out;
  }
}
