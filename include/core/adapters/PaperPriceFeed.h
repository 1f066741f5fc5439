#pragma once

#include <map>
#include <mutex>
#include <utility>

#include "core/contracts/IPriceFeed.h"

namespace stratvault {
namespace core {

// Settable oracle for paper mode. TWAPs are looked up per (asset, window);
// an unset window falls back to the spot price.
class PaperPriceFeed : public IPriceFeed {
public:
    std::optional<Price> getPrice(const std::string& asset) const override;
    std::optional<Price> getTwap(const std::string& asset, EpochSeconds window_sec) const override;

    void setPrice(const std::string& asset, Price price);
    void setTwap(const std::string& asset, EpochSeconds window_sec, Price twap);
    void clear(const std::string& asset);

private:
    mutable std::mutex mutex_;
    std::map<std::string, Price> spot_;
    std::map<std::pair<std::string, EpochSeconds>, Price> twap_;
};

} // namespace core
} // namespace stratvault
