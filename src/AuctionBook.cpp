#include "AuctionBook.hpp"

#include <algorithm>
#include <format>

AuctionBook::AuctionBook(const RegulatorConfig& config)
    : maxCouponYield_(config.maxCouponYield),
      maxCouponExpiry_(config.maxCouponExpiry),
      maxBidsPerAuction_(config.maxBidsPerAuction) {}

// ============================================================================
// LIFECYCLE
// ============================================================================

AuctionState& AuctionBook::initAuction(Epoch epoch) {
    auto [it, inserted] = auctions_.try_emplace(epoch);
    if (inserted) {
        it->second.epoch = epoch;
        it->second.isInit = true;
    }
    return it->second;
}

bool AuctionBook::cancelAuction(Epoch epoch) {
    AuctionState* auction = findMutable(epoch);
    if (!auction || !auction->isOpen()) return false;

    auction->isCanceled = true;
    auction->bids.clear();
    bidders_.erase(epoch);
    return true;
}

bool AuctionBook::finishAuction(Epoch epoch) {
    AuctionState* auction = findMutable(epoch);
    if (!auction || !auction->isOpen()) return false;

    auction->isFinished = true;
    auction->bids.clear();
    bidders_.erase(epoch);
    return true;
}

bool AuctionBook::recordSettlement(Epoch epoch, const SettlementReport& report) {
    if (!finishAuction(epoch)) return false;

    if (report.stats) {
        findMutable(epoch)->stats = *report.stats;
    }
    return true;
}

// ============================================================================
// BIDS
// ============================================================================

RegulatorResponse AuctionBook::placeBid(Epoch epoch, const Bid& bid) {
    AuctionState* auction = findMutable(epoch);

    // 1. Auction existence and state
    if (!auction) {
        return RegulatorResponse::Error(RegulatorStatusCode::AUCTION_NOT_FOUND,
                                        std::format("No auction at epoch {}", epoch));
    }
    if (!auction->isOpen()) {
        return RegulatorResponse::Error(RegulatorStatusCode::AUCTION_CLOSED,
                                        std::format("Auction at epoch {} is not accepting bids", epoch));
    }

    // 2. Bidder uniqueness and capacity
    if (hasBid(epoch, bid.bidder)) {
        return RegulatorResponse::Error(RegulatorStatusCode::DUPLICATE_BID,
                                        std::format("Account {} already bid at epoch {}", bid.bidder, epoch));
    }
    if (auction->bids.size() >= maxBidsPerAuction_) [[unlikely]] {
        return RegulatorResponse::Error(RegulatorStatusCode::AUCTION_FULL, "Auction at maximum bid count");
    }

    // 3. Amount and expiry bounds
    if (bid.dollarAmount.isZero()) {
        return RegulatorResponse::Error(RegulatorStatusCode::VALIDATION_FAILURE, "Must bid non-zero amount");
    }
    if (bid.couponAmount.isZero()) {
        return RegulatorResponse::Error(RegulatorStatusCode::VALIDATION_FAILURE, "Must bid on non-zero coupon amount");
    }
    if (bid.couponExpiryEpoch == 0 || bid.couponExpiryEpoch > maxCouponExpiry_) {
        return RegulatorResponse::Error(RegulatorStatusCode::VALIDATION_FAILURE,
                                        std::format("Expiry must be in (0, {}]", maxCouponExpiry_));
    }

    // 4. Yield ceiling
    Decimal yield = bid.yield();
    if (yield > maxCouponYield_) {
        return RegulatorResponse::Error(RegulatorStatusCode::VALIDATION_FAILURE,
                                        std::format("Yield {} exceeds maximum {}", yield, maxCouponYield_));
    }

    // 5. Record and widen bounds
    Decimal expiry = Decimal::from(bid.couponExpiryEpoch);

    Bid stored = bid;
    stored.distance = Decimal::zero();
    stored.selected = false;
    stored.rejected = false;
    auction->bids.push_back(stored);
    bidders_[epoch].insert(bid.bidder);
    auction->totalBids++;

    auction->minDollarAmount = std::min(auction->minDollarAmount, bid.dollarAmount);
    auction->maxDollarAmount = std::max(auction->maxDollarAmount, bid.dollarAmount);
    auction->minExpiry = std::min(auction->minExpiry, expiry);
    auction->maxExpiry = std::max(auction->maxExpiry, expiry);
    auction->minYield = std::min(auction->minYield, yield);
    auction->maxYield = std::max(auction->maxYield, yield);

    return RegulatorResponse::Success("Bid accepted", BidReceipt{
        epoch, bid.bidder, epoch + bid.couponExpiryEpoch, bid.dollarAmount, bid.couponAmount
    });
}

// ============================================================================
// QUERIES
// ============================================================================

const AuctionState* AuctionBook::find(Epoch epoch) const {
    auto it = auctions_.find(epoch);
    return (it != auctions_.end()) ? &it->second : nullptr;
}

AuctionState* AuctionBook::findMutable(Epoch epoch) {
    auto it = auctions_.find(epoch);
    return (it != auctions_.end()) ? &it->second : nullptr;
}

bool AuctionBook::isOpen(Epoch epoch) const {
    const AuctionState* auction = find(epoch);
    return auction && auction->isOpen();
}

bool AuctionBook::hasBid(Epoch epoch, AccountId bidder) const {
    auto it = bidders_.find(epoch);
    return it != bidders_.end() && it->second.contains(bidder);
}
