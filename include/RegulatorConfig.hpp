#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>

#include "Constants.hpp"
#include "Decimal.hpp"

/**
 * @brief Runtime parameters of the regulator.
 * @details Seeded from Config; the ConfigParser overrides individual keys.
 */
struct RegulatorConfig {
    Decimal supplyChangeDivisor       = Decimal::from(Config::SUPPLY_CHANGE_DIVISOR);
    Decimal couponSupplyChangeDivisor = Decimal::from(Config::COUPON_SUPPLY_CHANGE_DIVISOR);
    Decimal supplyChangeLimit         = Decimal::ratio(Config::SUPPLY_CHANGE_LIMIT_PCT, 100);
    Decimal couponSupplyChangeLimit   = Decimal::ratio(Config::COUPON_SUPPLY_CHANGE_LIMIT_PCT, 100);
    Decimal bootstrappingPrice        = Decimal::ratio(Config::BOOTSTRAPPING_PRICE_NUM,
                                                       Config::BOOTSTRAPPING_PRICE_DEN);
    uint64_t bootstrappingPeriod      = Config::BOOTSTRAPPING_PERIOD;

    uint64_t oraclePoolRatio          = Config::ORACLE_POOL_RATIO;
    Decimal advanceIncentive          = Decimal::from(Config::ADVANCE_INCENTIVE);

    Decimal maxCouponYield            = Decimal::from(Config::MAX_COUPON_YIELD);
    uint64_t maxCouponExpiry          = Config::MAX_COUPON_EXPIRY;
    std::size_t maxBidsPerAuction     = Config::MAX_BIDS_PER_AUCTION;

    /**
     * @return A description of the first invalid field, or nullopt.
     */
    std::optional<std::string> validate() const {
        if (supplyChangeDivisor.isZero()) return "supplyChangeDivisor must be non-zero";
        if (couponSupplyChangeDivisor.isZero()) return "couponSupplyChangeDivisor must be non-zero";
        if (supplyChangeLimit > Decimal::one()) return "supplyChangeLimit must not exceed 1";
        if (couponSupplyChangeLimit > Decimal::one()) return "couponSupplyChangeLimit must not exceed 1";
        if (oraclePoolRatio >= 100) return "oraclePoolRatio must be below 100";
        if (maxCouponExpiry == 0) return "maxCouponExpiry must be non-zero";
        if (maxBidsPerAuction == 0) return "maxBidsPerAuction must be non-zero";
        return std::nullopt;
    }
};
