#pragma once
#include <string>
#include <utility>
#include <vector>
#include "encoding/c32.hpp"

// Clarity values and their consensus serialization (contract-call arguments).
namespace Clarity {
  // Type prefixes of the values a send-many call carries.
  enum class Type : unsigned char {
    UInt = 0x01,
    PrincipalStandard = 0x05,
    List = 0x0b,
    Tuple = 0x0c
  };

  struct Value {
    Type type = Type::UInt;
    Bytes data;                    // uint: 16 bytes big-endian
    C32::Address principal;
    std::vector<Value> items;      // list elements, or tuple values
    std::vector<std::string> keys; // tuple keys, parallel to items
  };

  Value UInt(unsigned long long v);
  // Decimal digits only; throws std::invalid_argument on other characters and
  // std::out_of_range when the value needs more than 128 bits.
  Value UIntFromDecimal(const std::string& decimal);
  Value StandardPrincipal(const std::string& address);
  Value List(std::vector<Value> items);
  // Keys are emitted in lexicographic byte order regardless of input order.
  Value Tuple(const std::vector<std::pair<std::string, Value>>& fields);

  Bytes Serialize(const Value& v);
}
