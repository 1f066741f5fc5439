#include "ledger/FeeCalculator.h"
#include "common/FixedPoint.h"

#include <algorithm>

namespace stratvault {
namespace ledger {

Amount FeeCalculator::managementFee(Amount principal, int bps_per_year, EpochSeconds elapsed_sec) {
    if (principal <= 0 || bps_per_year <= 0 || elapsed_sec <= 0) {
        return 0;
    }
    const std::int64_t rate_time = static_cast<std::int64_t>(bps_per_year) * elapsed_sec;
    const Amount fee = fixed::mulDiv(principal, rate_time, kBpsDenominator * kSecondsPerYear);
    return std::min(fee, principal);
}

Amount FeeCalculator::performanceFee(Amount profit, int bps) {
    if (profit <= 0 || bps <= 0) {
        return 0;
    }
    return fixed::applyBps(profit, bps);
}

} // namespace ledger
} // namespace stratvault
