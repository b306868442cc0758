#include "BidRanker.hpp"

#include <algorithm>
#include <ranges>

NormalizationRanges BidRanker::rangesOf(const AuctionState& auction) {
    // With no bids the min sentinels are still at Decimal::max().
    if (auction.bids.empty()) return {};

    return {
        auction.maxYield.sub(auction.minYield),
        auction.maxExpiry.sub(auction.minExpiry),
        auction.maxDollarAmount.sub(auction.minDollarAmount)
    };
}

Decimal BidRanker::distanceOf(const Bid& bid, const NormalizationRanges& ranges) {
    const Decimal two = Decimal::from(2);

    Decimal yieldRel = ranges.yield.isZero()
        ? Decimal::zero()
        : bid.yield().div(ranges.yield);

    Decimal expiryRel = ranges.expiry.isZero()
        ? Decimal::zero()
        : Decimal::from(bid.couponExpiryEpoch).div(ranges.expiry);

    // Smaller bids sit closer to 2 and so further from the origin; a bid more
    // than twice the range would drive this negative, so it clamps to zero.
    Decimal dollarRel = ranges.dollar.isZero()
        ? Decimal::zero()
        : two.saturatingSub(bid.dollarAmount.div(ranges.dollar));

    Decimal sumOfSquares = yieldRel.pow(2).add(expiryRel.pow(2)).add(dollarRel.pow(2));
    return sumOfSquares.isZero() ? Decimal::zero() : sumOfSquares.sqrt();
}

std::vector<Bid> BidRanker::rank(const AuctionState& auction) {
    NormalizationRanges ranges = rangesOf(auction);

    std::vector<Bid> ranked = auction.bids;
    for (Bid& bid : ranked) {
        bid.distance = distanceOf(bid, ranges);
        bid.selected = false;
        bid.rejected = false;
        bid.unfunded = false;
    }

    std::ranges::stable_sort(ranked, std::ranges::less{}, &Bid::distance);
    return ranked;
}

SettlementReport BidRanker::settle(const AuctionState& auction, const Decimal& debtCapacity, Epoch grantEpoch,
                                   const FundingCheck& isFunded) {
    SettlementReport report;
    report.auctionEpoch = auction.epoch;
    report.debtCapacity = debtCapacity;
    report.ranked = rank(auction);

    FillTally tally;

    for (Bid& bid : report.ranked) {
        if (debtCapacity < bid.dollarAmount) {
            bid.rejected = true;
            break;
        }
        if (isFunded && !isFunded(bid)) {
            bid.rejected = true;
            bid.unfunded = true;
            break;
        }

        bid.selected = true;
        report.fills.push_back({bid.bidder, bid.dollarAmount, bid.couponAmount,
                                grantEpoch + bid.couponExpiryEpoch});

        Decimal expiry = Decimal::from(bid.couponExpiryEpoch);
        Decimal yield = bid.yield();

        tally.totalFilled++;
        tally.sumExpiryFilled = tally.sumExpiryFilled.add(expiry);
        tally.sumYieldFilled = tally.sumYieldFilled.add(yield);
        tally.minExpiryFilled = std::min(tally.minExpiryFilled, expiry);
        tally.maxExpiryFilled = std::max(tally.maxExpiryFilled, expiry);
        tally.minYieldFilled = std::min(tally.minYieldFilled, yield);
        tally.maxYieldFilled = std::max(tally.maxYieldFilled, yield);
    }

    if (tally.totalFilled > 0) {
        Decimal filled = Decimal::from(tally.totalFilled);
        AuctionStats stats;
        stats.totalFilled = tally.totalFilled;
        stats.avgYieldFilled = tally.sumYieldFilled.div(filled);
        stats.avgExpiryFilled = tally.sumExpiryFilled.div(filled);
        // Scaled by 100 so a fully covered auction reads 100, not 1.
        stats.bidToCover = Decimal::from(report.ranked.size()).div(filled).mul(Decimal::from(100));
        stats.minExpiryFilled = tally.minExpiryFilled;
        stats.maxExpiryFilled = tally.maxExpiryFilled;
        stats.minYieldFilled = tally.minYieldFilled;
        stats.maxYieldFilled = tally.maxYieldFilled;
        report.stats = stats;
    }

    return report;
}
