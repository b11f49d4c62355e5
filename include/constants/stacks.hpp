#pragma once
#include <string>

namespace StacksConstants {
  // send-many contract deployed on testnet
  inline const std::string DEFAULT_TESTNET_CONTRACT = "STB44HYPYAT2BB2QE513NSP81HTMYWBJP02HPGK6.send-many";
  // No mainnet deployment yet; mainnet users pass --contractAddress.
  inline const std::string DEFAULT_MAINNET_CONTRACT = "not-deployed";
  inline const std::string SEND_MANY_FUNCTION = "send-many";
  // Tuple keys of the send-many recipient type {to: principal, ustx: uint}
  inline const std::string RECIPIENT_TO_KEY = "to";
  inline const std::string RECIPIENT_AMOUNT_KEY = "ustx";
  inline const std::string EXPLORER_URL = "https://explorer.stacks.co";
  inline constexpr int DEFAULT_HTTP_TIMEOUT_MS = 10000;
}
