#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace stratvault {
namespace core {

// Read-only oracle. Staleness is the oracle's concern.
class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    virtual std::optional<Price> getPrice(const std::string& asset) const = 0;
    virtual std::optional<Price> getTwap(const std::string& asset, EpochSeconds window_sec) const = 0;
};

} // namespace core
} // namespace stratvault
