#pragma once

#include "common/Types.h"

namespace stratvault {
namespace fixed {

// a * b / c with a 128-bit intermediate, rounded toward zero.
// Operands are non-negative ledger quantities; c == 0 yields 0.
inline std::int64_t mulDiv(std::int64_t a, std::int64_t b, std::int64_t c) {
    if (c == 0 || a <= 0 || b <= 0) {
        return 0;
    }
    const unsigned __int128 product =
        static_cast<unsigned __int128>(a) * static_cast<unsigned __int128>(b);
    return static_cast<std::int64_t>(product / static_cast<unsigned __int128>(c));
}

inline Amount applyBps(Amount amount, long long bps) {
    return mulDiv(amount, bps, kBpsDenominator);
}

} // namespace fixed
} // namespace stratvault
