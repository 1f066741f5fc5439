#pragma once

#include "common/Types.h"

namespace stratvault {
namespace ledger {

// Fee arithmetic on integer base units; all results round down.
class FeeCalculator {
public:
    static bool isPerformanceFeeValid(int bps) {
        return bps >= 0 && bps <= kMaxPerformanceFeeBps;
    }
    static bool isManagementFeeValid(int bps_per_year) {
        return bps_per_year >= 0 && bps_per_year <= kMaxManagementFeeBpsPerYear;
    }

    // principal * rate * elapsed / year, capped at the principal
    static Amount managementFee(Amount principal, int bps_per_year, EpochSeconds elapsed_sec);

    // share of a positive realized profit; losses carry no fee
    static Amount performanceFee(Amount profit, int bps);
};

} // namespace ledger
} // namespace stratvault
