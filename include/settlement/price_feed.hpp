#pragma once

#include <mutex>
#include <optional>
#include "common/types.hpp"

namespace btcfi {

struct PriceQuote {
    Price price{0};
    int64_t timestamp_ms{0};
};

/**
 * Spot price source (oracle aggregate). Pulled on demand at settlement time.
 */
class PriceFeed {
public:
    virtual ~PriceFeed() = default;

    virtual std::optional<PriceQuote> latest() = 0;
};

/**
 * Fixed price, settable at runtime.
 */
class StaticPriceFeed : public PriceFeed {
public:
    explicit StaticPriceFeed(Price price) : price_(price) {}

    std::optional<PriceQuote> latest() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (price_ == 0) {
            return std::nullopt;
        }
        return PriceQuote{price_, now_ms()};
    }

    void set_price(Price price) {
        std::lock_guard<std::mutex> lock(mutex_);
        price_ = price;
    }

private:
    std::mutex mutex_;
    Price price_;
};

} // namespace btcfi
