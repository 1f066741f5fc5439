#include "core/adapters/PaperPriceFeed.h"

namespace stratvault {
namespace core {

std::optional<Price> PaperPriceFeed::getPrice(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = spot_.find(asset);
    if (it == spot_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Price> PaperPriceFeed::getTwap(const std::string& asset, EpochSeconds window_sec) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = twap_.find({asset, window_sec});
    if (it != twap_.end()) {
        return it->second;
    }
    auto spot = spot_.find(asset);
    if (spot == spot_.end()) {
        return std::nullopt;
    }
    return spot->second;
}

void PaperPriceFeed::setPrice(const std::string& asset, Price price) {
    std::lock_guard<std::mutex> lock(mutex_);
    spot_[asset] = price;
}

void PaperPriceFeed::setTwap(const std::string& asset, EpochSeconds window_sec, Price twap) {
    std::lock_guard<std::mutex> lock(mutex_);
    twap_[{asset, window_sec}] = twap;
}

void PaperPriceFeed::clear(const std::string& asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    spot_.erase(asset);
    for (auto it = twap_.begin(); it != twap_.end();) {
        if (it->first.first == asset) {
            it = twap_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace core
} // namespace stratvault
