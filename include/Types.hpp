#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Decimal.hpp"

// --- ID Types ---
using AccountId = uint64_t;
using Epoch     = uint64_t;

enum class RegulatorStatusCode {
    OK = 0,
    VALIDATION_FAILURE    = 400,
    INSUFFICIENT_BALANCE  = 402,
    AUCTION_NOT_FOUND     = 404,
    AUCTION_CLOSED        = 405,
    DUPLICATE_BID         = 409,
    INVALID_EPOCH         = 422,
    AUCTION_FULL          = 429,
    DIVISION_BY_ZERO      = 500,
    ARITHMETIC_OVERFLOW   = 501,
    ARITHMETIC_UNDERFLOW  = 502,
    LEDGER_FAILURE        = 503,
    REENTRANT_CALL        = 508
};

// --- 1. Auction Internals ---

/**
 * @brief A single coupon bid (one per bidder per auction).
 * @details distance/selected/rejected are only written during settlement.
 */
struct Bid {
    AccountId bidder = 0;
    Decimal dollarAmount;
    Decimal couponAmount;
    Epoch couponExpiryEpoch = 0;   // offset from the epoch the coupon is granted in
    Decimal distance;
    bool selected = false;
    bool rejected = false;
    bool unfunded = false;         // rejected because the bidder no longer holds dollarAmount

    Decimal yield() const { return couponAmount.div(dollarAmount); }
};

/**
 * @brief Per-auction aggregates written once, at settlement.
 */
struct AuctionStats {
    Decimal avgYieldFilled;
    Decimal avgExpiryFilled;
    Decimal bidToCover;
    uint64_t totalFilled = 0;
    Decimal minExpiryFilled;
    Decimal maxExpiryFilled;
    Decimal minYieldFilled;
    Decimal maxYieldFilled;
};

struct AuctionState {
    Epoch epoch = 0;
    bool isInit = false;
    bool isCanceled = false;
    bool isFinished = false;

    std::vector<Bid> bids;     // submission order
    uint64_t totalBids = 0;    // survives the bid list being cleared

    // Maintained incrementally as bids arrive.
    Decimal minDollarAmount = Decimal::max();
    Decimal maxDollarAmount;
    Decimal minExpiry = Decimal::max();
    Decimal maxExpiry;
    Decimal minYield = Decimal::max();
    Decimal maxYield;

    AuctionStats stats;

    bool isOpen() const { return isInit && !isCanceled && !isFinished; }
};

// --- 2. Settlement ---

/**
 * @brief Running totals of one settlement.
 * @details Lives on the stack of a single settlement call, so nothing carries
 * over between settlements. Min fields start at Decimal::max(), max/sum at zero.
 */
struct FillTally {
    uint64_t totalFilled = 0;
    Decimal sumExpiryFilled;
    Decimal sumYieldFilled;
    Decimal minExpiryFilled = Decimal::max();
    Decimal maxExpiryFilled;
    Decimal minYieldFilled = Decimal::max();
    Decimal maxYieldFilled;
};

struct CouponFill {
    AccountId bidder;
    Decimal dollarAmount;
    Decimal couponAmount;
    Epoch couponEpoch;   // absolute epoch the coupon becomes redeemable
};

struct SettlementReport {
    Epoch auctionEpoch = 0;
    Decimal debtCapacity;
    std::vector<Bid> ranked;   // ascending distance
    std::vector<CouponFill> fills;
    std::optional<AuctionStats> stats;   // empty when nothing filled
};

// --- 3. Events ---

struct SupplyIncrease {
    Epoch epoch;
    Decimal price;
    Decimal newRedeemable;
    Decimal lessDebt;
    Decimal newBonded;
};

struct SupplyDecrease {
    Epoch epoch;
    Decimal price;
    Decimal newDebt;
    std::optional<SettlementReport> settlement;
};

struct SupplyNeutral {
    Epoch epoch;
};

struct BidReceipt {
    Epoch auctionEpoch;
    AccountId bidder;
    Epoch expiryEpoch;
    Decimal dollarAmount;
    Decimal couponAmount;
};

// --- 4. Collaborator Returns ---

struct OracleReading {
    Decimal price;
    bool valid = false;
};

struct SupplyAllocation {
    Decimal newRedeemable;
    Decimal lessDebt;
    Decimal newBonded;
};

// --- 5. API Response ---

struct RegulatorResponse {
    using Payload = std::variant<std::monostate, SupplyIncrease, SupplyDecrease, SupplyNeutral,
                                 SettlementReport, BidReceipt>;

    RegulatorStatusCode code = RegulatorStatusCode::OK;
    std::string message;
    Payload data = std::monostate{};

    static RegulatorResponse Success(std::string msg, Payload payload = std::monostate{}) {
        return { RegulatorStatusCode::OK, std::move(msg), std::move(payload) };
    }
    static RegulatorResponse Error(RegulatorStatusCode c, std::string msg) {
        return { c, std::move(msg), std::monostate{} };
    }

    bool isSuccess() const { return code == RegulatorStatusCode::OK; }
};
