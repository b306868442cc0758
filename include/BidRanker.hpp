#pragma once

#include <functional>
#include <vector>

#include "Types.hpp"

/**
 * @brief Spread of the pending bids on each ranking axis.
 * @details A zero range means every bid agrees on that axis; the axis then
 * contributes nothing to any bid's distance.
 */
struct NormalizationRanges {
    Decimal yield;
    Decimal expiry;
    Decimal dollar;
};

/**
 * @brief Bid Ranking & Settlement
 * @details Pure computation over an AuctionState: nothing here touches the
 * ledger or the AuctionBook. The Regulator applies the resulting fills.
 *
 * Distance of a bid (each term zero when its range is zero):
 *   yieldRel  = (coupon / dollar) / yieldRange
 *   expiryRel = expiry / expiryRange
 *   dollarRel = 2 - dollar / dollarRange          (clamped at zero)
 *   distance  = sqrt(yieldRel^2 + expiryRel^2 + dollarRel^2), or 0 if the sum is 0
 *
 * Bids are ordered by ascending distance with a stable sort: equal distances
 * keep submission order.
 */
class BidRanker {
public:
    static NormalizationRanges rangesOf(const AuctionState& auction);

    static Decimal distanceOf(const Bid& bid, const NormalizationRanges& ranges);

    /** @brief Copies the auction's bids, assigns distances and sorts them. */
    static std::vector<Bid> rank(const AuctionState& auction);

    /** @brief True when the bidder can still pay for the bid. */
    using FundingCheck = std::function<bool(const Bid&)>;

    /**
     * @brief Greedy-stop fill in ranked order.
     * @details A bid fills while debtCapacity >= its dollar amount and
     * isFunded accepts it. The first bid that fails either test is marked
     * rejected (and unfunded, for the second) and ends the scan: later
     * (possibly smaller) bids are never considered.
     * @param grantEpoch Epoch the coupons are issued in; each fill becomes
     *        redeemable at grantEpoch + the bid's expiry offset.
     * @param isFunded Empty means every bid is treated as funded.
     */
    static SettlementReport settle(const AuctionState& auction, const Decimal& debtCapacity, Epoch grantEpoch,
                                   const FundingCheck& isFunded = {});
};
