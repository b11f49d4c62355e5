#include "transfer/recipient.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "encoding/c32.hpp"
#include <algorithm>

bool IsNormalInteger(const std::string& s) {
  if (s.empty() || s[0] == '0') return false;
  return std::all_of(s.begin(), s.end(), [](char c){ return c >= '0' && c <= '9'; });
}

Recipient ParseRecipient(const std::string& token) {
  auto comma = token.find(',');
  std::string address = token.substr(0, comma);
  std::string amount = comma == std::string::npos ? std::string() : token.substr(comma + 1);
  if (!C32::IsValidAddress(address)) {
    throw BulkTransferError(ErrorKind::InvalidAddress,
                            "Invalid recipient '" + token + "': " + address + " is not a valid STX address");
  }
  if (!IsNormalInteger(amount)) {
    throw BulkTransferError(ErrorKind::InvalidAmount,
                            "Invalid recipient '" + token + "': '" + amount + "' is not a valid integer");
  }
  return Recipient{address, amount};
}

std::vector<Recipient> ParseRecipients(const std::vector<std::string>& tokens) {
  std::vector<Recipient> recipients;
  recipients.reserve(tokens.size());
  for (const auto& token : tokens) recipients.push_back(ParseRecipient(token));
  Logger::Info("parsed " + std::to_string(recipients.size()) + " recipients");
  return recipients;
}
