#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

/**
 * @namespace Config
 * @brief Protocol Defaults & Arithmetic Guardrails
 * @details
 * These are the compile-time defaults. Every value the regulator actually
 * reads at runtime lives in RegulatorConfig, which is seeded from here and
 * may be overridden by the ConfigParser.
 */
namespace Config {
    // --- FIXED POINT ---

    /**
     * @note 18 decimals: one whole unit is 10^18 raw units.
     * Matches the token precision of the ledger the regulator drives.
     */
    inline constexpr unsigned DECIMALS = 18;
    inline constexpr std::string_view BASE_STRING = "1000000000000000000";

    // --- SUPPLY REGULATION ---

    // Expressed as whole-unit numerator / denominator pairs so they stay
    // constexpr; RegulatorConfig turns them into Decimals.
    inline constexpr uint64_t SUPPLY_CHANGE_DIVISOR         = 25;
    inline constexpr uint64_t COUPON_SUPPLY_CHANGE_DIVISOR  = 50;

    inline constexpr uint64_t SUPPLY_CHANGE_LIMIT_PCT        = 3;  // 3% of net supply per epoch
    inline constexpr uint64_t COUPON_SUPPLY_CHANGE_LIMIT_PCT = 6;  // 6% while coupons are under-funded

    inline constexpr uint64_t BOOTSTRAPPING_PRICE_NUM = 110;   // 1.10
    inline constexpr uint64_t BOOTSTRAPPING_PRICE_DEN = 100;
    inline constexpr uint64_t BOOTSTRAPPING_PERIOD    = 90;    // epochs

    /**
     * @note Share of every redeemable top-up that is paid to the oracle pool.
     * Must stay below 100 or the padding math in increaseSupply divides by zero.
     */
    inline constexpr uint64_t ORACLE_POOL_RATIO = 20;

    inline constexpr uint64_t ADVANCE_INCENTIVE = 100;

    // --- AUCTION GUARDRAILS ---

    /**
     * @note ARCHITECTURAL DECISION: Bounded bid inputs.
     * Bidders choose yield and expiry freely. Capping both keeps every
     * normalized distance component (and its square) inside 256 bits.
     */
    inline constexpr uint64_t MAX_COUPON_YIELD  = 100;
    inline constexpr uint64_t MAX_COUPON_EXPIRY = 100'000;   // epochs after placement

    /**
     * @note Settlement is O(N log N) in the bid count and runs inside a
     * single step. This caps the work an adversary can push into one advance.
     */
    inline constexpr std::size_t MAX_BIDS_PER_AUCTION = 10'000;

    // --- OUTPUT ---

    /**
     * @note A Decimal renders in at most 79 characters (60 integer digits,
     * the point, 18 fraction digits). The widest event, SupplyIncrease, is a
     * 20-digit epoch and four such Decimals: 361 bytes with its labels.
     */
    inline constexpr std::size_t ENVELOPE_SIZE = 512;
}
