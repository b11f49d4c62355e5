#pragma once
#include <string>
#include <vector>

// One transfer line item: a Stacks address and a micro-STX amount in decimal.
struct Recipient {
  std::string address;
  std::string amount;
};

// Digits only, no sign and no leading zero: "100" is normal, "0", "0100", "-5" and "5.0" are not.
bool IsNormalInteger(const std::string& s);

// Parses one "address,amount" token, split on the first comma.
// Throws BulkTransferError (InvalidAddress or InvalidAmount) naming the token.
Recipient ParseRecipient(const std::string& token);

// Same order as the input, duplicates kept; fails on the first bad token.
std::vector<Recipient> ParseRecipients(const std::vector<std::string>& tokens);
