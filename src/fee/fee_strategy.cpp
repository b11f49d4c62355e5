#include "fee/fee_strategy.hpp"
#include "node_connection/stacks_api.hpp"
#include "common/errors.hpp"
#include "telemetry/structured_logger.hpp"
#include <limits>
#include <stdexcept>

FeeQuote FeeStrategy::Quote(size_t tx_bytes) {
  unsigned long long rate = 0;
  try {
    rate = api_.GetTransferFeeRate();
  } catch (const std::runtime_error& e) {
    throw BulkTransferError(ErrorKind::FeeEstimationError,
                            "Unable to estimate fee from " + api_.ApiUrl() + ": " + e.what());
  }
  if (tx_bytes != 0 && rate > std::numeric_limits<unsigned long long>::max() / tx_bytes) {
    throw BulkTransferError(ErrorKind::FeeEstimationError, "Fee rate " + std::to_string(rate) + " overflows");
  }
  FeeQuote quote{rate, rate * tx_bytes};
  StructuredLogger::Instance().Event("fee_quote", {{"rate_per_byte", rate}, {"tx_bytes", tx_bytes}, {"fee", quote.fee}});
  return quote;
}
