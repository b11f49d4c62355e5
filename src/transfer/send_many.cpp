#include "transfer/send_many.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "config/contracts.hpp"
#include "constants/stacks.hpp"
#include "fee/fee_strategy.hpp"
#include "node_connection/stacks_api.hpp"
#include "telemetry/structured_logger.hpp"
#include "wallet/nonce_manager.hpp"
#include "wallet/signer.hpp"
#include <limits>
#include <stdexcept>

static unsigned long long ParseU64(const std::string& decimal) {
  unsigned long long v = 0;
  for (char c : decimal) {
    if (c < '0' || c > '9') throw std::invalid_argument("not a decimal integer: " + decimal);
    unsigned long long digit = static_cast<unsigned long long>(c - '0');
    if (v > (std::numeric_limits<unsigned long long>::max() - digit) / 10)
      throw std::out_of_range("integer does not fit in 64 bits: " + decimal);
    v = v * 10 + digit;
  }
  return v;
}

Clarity::Value SendManyArgument(const std::vector<Recipient>& recipients) {
  std::vector<Clarity::Value> items;
  items.reserve(recipients.size());
  for (const auto& r : recipients) {
    try {
      items.push_back(Clarity::Tuple({
        {StacksConstants::RECIPIENT_TO_KEY, Clarity::StandardPrincipal(r.address)},
        {StacksConstants::RECIPIENT_AMOUNT_KEY, Clarity::UIntFromDecimal(r.amount)},
      }));
    } catch (const std::logic_error& e) {
      throw BulkTransferError(ErrorKind::EncodingError,
                              "Cannot encode recipient " + r.address + "," + r.amount + ": " + e.what());
    }
  }
  return Clarity::List(std::move(items));
}

unsigned long long TotalAmount(const std::vector<Recipient>& recipients) {
  unsigned long long total = 0;
  for (const auto& r : recipients) {
    unsigned long long amount = 0;
    try {
      amount = ParseU64(r.amount);
    } catch (const std::logic_error& e) {
      throw BulkTransferError(ErrorKind::EncodingError, std::string("Cannot total transfer amounts: ") + e.what());
    }
    if (amount > std::numeric_limits<unsigned long long>::max() - total) {
      throw BulkTransferError(ErrorKind::EncodingError, "Total transfer amount does not fit in 64 bits");
    }
    total += amount;
  }
  return total;
}

StacksTransaction BuildSendManyTransaction(const TransactionRequest& request, StacksApiClient& api) {
  if (request.recipients.empty()) {
    throw BulkTransferError(ErrorKind::EncodingError, "At least one recipient is required");
  }
  Signer signer(request.sender_key);
  const unsigned char address_version = P2PKHAddressVersion(request.network);
  const std::string sender = signer.AddressString(address_version);
  auto contract = ParseContractIdentifier(request.contract_identifier);

  StacksTransaction tx;
  tx.version = request.network.version;
  tx.chain_id = request.network.chain_id;
  tx.auth_type = AuthType::Standard;
  tx.spending_condition.signer = signer.AccountHash();
  tx.spending_condition.key_encoding = signer.KeyEncoding();
  tx.anchor_mode = AnchorMode::Any;
  // The sender must move exactly the listed total and nothing else.
  tx.post_condition_mode = PostConditionMode::Deny;
  const unsigned long long total = TotalAmount(request.recipients);
  tx.post_conditions.push_back(StxPostCondition{signer.Address(address_version), FungibleConditionCode::Equal, total});
  tx.payload.contract_address = C32::DecodeAddress(contract.address);
  tx.payload.contract_name = contract.name;
  tx.payload.function_name = StacksConstants::SEND_MANY_FUNCTION;
  tx.payload.args.push_back(SendManyArgument(request.recipients));

  NonceManager nonces(api, sender);
  if (request.nonce) nonces.Reset(*request.nonce);
  tx.spending_condition.nonce = nonces.Next();

  if (request.fee) {
    tx.spending_condition.fee = *request.fee;
  } else {
    // signature bytes are fixed-size, so the unsigned length is the final length
    FeeStrategy fees(api);
    tx.spending_condition.fee = fees.Quote(tx.Serialize().size()).fee;
  }

  signer.Sign(tx);
  const std::string txid = tx.Txid();
  Logger::Info("assembled send-many tx " + txid + " from " + sender + " to " + request.contract_identifier +
           " recipients=" + std::to_string(request.recipients.size()) + " total=" + std::to_string(total));
  StructuredLogger::Instance().Event("tx_assembled", {
    {"txid", txid}, {"sender", sender}, {"contract", request.contract_identifier},
    {"recipients", request.recipients.size()}, {"total_ustx", total},
    {"nonce", tx.spending_condition.nonce}, {"fee", tx.spending_condition.fee}});
  return tx;
}
