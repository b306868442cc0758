#include "Regulator.hpp"

#include <format>

#include "BidRanker.hpp"

namespace {
    RegulatorStatusCode codeFor(MathFault fault) {
        switch (fault) {
            case MathFault::DIVISION_BY_ZERO: return RegulatorStatusCode::DIVISION_BY_ZERO;
            case MathFault::OVERFLOW:         return RegulatorStatusCode::ARITHMETIC_OVERFLOW;
            case MathFault::UNDERFLOW:        return RegulatorStatusCode::ARITHMETIC_UNDERFLOW;
        }
        return RegulatorStatusCode::ARITHMETIC_OVERFLOW;
    }
}

Regulator::Regulator(const RegulatorConfig& config, Oracle& oracle, Ledger& ledger,
                     OutputHandler& output, Epoch startEpoch)
    : config_(config),
      oracle_(oracle),
      ledger_(ledger),
      output_(output),
      auctions_(config),
      epoch_(startEpoch) {}

// ============================================================================
// GUARD: Reentrancy + fault mapping
// ============================================================================

template <typename Fn>
RegulatorResponse Regulator::trapFaults(std::string_view operation, Fn&& body) {
    try {
        return body();
    } catch (const DecimalError& e) {
        output_.logError(std::format("{} aborted: {}", operation, e.what()));
        return RegulatorResponse::Error(codeFor(e.fault()), e.what());
    } catch (const LedgerError& e) {
        output_.logError(std::format("{} aborted: {}", operation, e.what()));
        return RegulatorResponse::Error(RegulatorStatusCode::LEDGER_FAILURE, e.what());
    }
}

template <typename Fn>
RegulatorResponse Regulator::guarded(std::string_view operation, Fn&& body) {
    if (inFlight_) {
        output_.logError(std::format("{}: refused, another regulator call is in flight", operation));
        return RegulatorResponse::Error(RegulatorStatusCode::REENTRANT_CALL,
                                        std::format("{} re-entered", operation));
    }

    struct FlightGuard {
        bool& flag;
        explicit FlightGuard(bool& f) : flag(f) { flag = true; }
        ~FlightGuard() { flag = false; }
    } guard(inFlight_);

    return trapFaults(operation, std::forward<Fn>(body));
}

// ============================================================================
// EPOCH DRIVER
// ============================================================================

RegulatorResponse Regulator::advance(AccountId advancer) {
    return guarded("advance", [&]() -> RegulatorResponse {
        ledger_.mintToAccount(advancer, config_.advanceIncentive);
        ++epoch_;

        RegulatorResponse response = trapFaults("step", [&]() { return runStep(); });
        if (!response.isSuccess()) {
            ledger_.burnFromAccount(advancer, config_.advanceIncentive);
            --epoch_;
        }
        return response;
    });
}

RegulatorResponse Regulator::step() {
    return guarded("step", [&]() { return runStep(); });
}

RegulatorResponse Regulator::runStep() {
    if (epoch_ == 0) {
        return RegulatorResponse::Error(RegulatorStatusCode::INVALID_EPOCH,
                                        "step requires a previous epoch");
    }

    Decimal price = oracleCapture();

    if (price > Decimal::one()) {
        return growSupply(price);
    }
    if (price < Decimal::one()) {
        return shrinkSupply(price);
    }

    SupplyNeutral event{epoch_};
    output_.printSupplyNeutral(event);
    return RegulatorResponse::Success("Supply neutral", event);
}

Decimal Regulator::oracleCapture() {
    // Always capture, even while bootstrapping, so the oracle keeps its own state current.
    OracleReading reading = oracle_.capture();

    if (bootstrappingAt(epoch_ - 1)) {
        return config_.bootstrappingPrice;
    }
    if (!reading.valid) {
        output_.logInfo(std::format("epoch {}: oracle reading invalid, holding at peg", epoch_));
        return Decimal::one();
    }
    return reading.price;
}

// ============================================================================
// SUPPLY MATH
// ============================================================================

bool Regulator::couponsUnderfunded() const {
    return ledger_.totalRedeemable() < ledger_.totalCoupons();
}

Decimal Regulator::supplyDelta(const Decimal& price) const {
    const Decimal one = Decimal::one();
    const bool couponMode = couponsUnderfunded();

    const Decimal& divisor = couponMode ? config_.couponSupplyChangeDivisor : config_.supplyChangeDivisor;
    const Decimal& cap = couponMode ? config_.couponSupplyChangeLimit : config_.supplyChangeLimit;

    Decimal gap = (price > one) ? price.sub(one) : one.sub(price);
    Decimal delta = gap.div(divisor);
    return (delta > cap) ? cap : delta;
}

RegulatorResponse Regulator::growSupply(const Decimal& price) {
    const Decimal clearedDebt = ledger_.totalDebt();
    ledger_.setDebtToZero();

    Decimal newSupply;
    SupplyAllocation allocation;
    try {
        newSupply = supplyDelta(price).mul(ledger_.totalNet());
        allocation = ledger_.increaseSupply(newSupply);
    } catch (const DecimalError&) {
        ledger_.increaseDebt(clearedDebt);
        throw;
    } catch (const LedgerError&) {
        ledger_.increaseDebt(clearedDebt);
        throw;
    }

    if (openAuction_ && auctions_.cancelAuction(*openAuction_)) {
        output_.printAuctionCanceled(*openAuction_);
    }
    openAuction_.reset();

    SupplyIncrease event{epoch_, price, allocation.newRedeemable, allocation.lessDebt, allocation.newBonded};
    output_.printSupplyIncrease(event);
    return RegulatorResponse::Success("Supply increased", event);
}

// All fallible work (distances, stats) happens in planSettlement before the
// first mutation; the burns that follow were checked against balances there.
RegulatorResponse Regulator::shrinkSupply(const Decimal& price) {
    std::optional<SettlementReport> settlement;
    if (openAuction_) {
        settlement = planSettlement(*openAuction_);
    }

    if (settlement) {
        applySettlement(*settlement);
    }

    auctions_.initAuction(epoch_);
    openAuction_ = auctions_.isOpen(epoch_) ? std::optional<Epoch>(epoch_) : std::nullopt;

    Decimal newDebt = supplyDelta(price).mul(ledger_.totalNet());
    ledger_.increaseDebt(newDebt);

    SupplyDecrease event{epoch_, price, newDebt, std::move(settlement)};
    output_.printSupplyDecrease(event);
    return RegulatorResponse::Success("Supply decreased", std::move(event));
}

// ============================================================================
// COUPON AUCTIONS
// ============================================================================

std::optional<SettlementReport> Regulator::planSettlement(Epoch settlementEpoch) const {
    const AuctionState* auction = auctions_.find(settlementEpoch);
    if (!auction || !auction->isOpen()) return std::nullopt;

    // A bidder may have moved its dollars away since bidding; that bid is
    // rejected like one that overshoots capacity instead of failing the step.
    return BidRanker::settle(*auction, ledger_.totalDebt(), epoch_, [this](const Bid& bid) {
        return ledger_.balanceOf(bid.bidder) >= bid.dollarAmount;
    });
}

void Regulator::applySettlement(const SettlementReport& report) {
    if (!auctions_.recordSettlement(report.auctionEpoch, report)) {
        throw LedgerError(std::format("auction {} is no longer open", report.auctionEpoch));
    }
    for (const CouponFill& fill : report.fills) {
        ledger_.burnFromAccount(fill.bidder, fill.dollarAmount);
        ledger_.incrementBalanceOfCoupons(fill.bidder, fill.couponEpoch, fill.couponAmount);
    }
    for (const Bid& bid : report.ranked) {
        if (bid.unfunded) {
            output_.logInfo(std::format("auction {}: bidder {} no longer holds {}, bid rejected",
                                        report.auctionEpoch, bid.bidder, bid.dollarAmount));
        }
    }
    if (openAuction_ == report.auctionEpoch) {
        openAuction_.reset();
    }
    output_.printAuctionSettled(report);
}

RegulatorResponse Regulator::settleCouponAuction(Epoch settlementEpoch) {
    return guarded("settleCouponAuction", [&]() -> RegulatorResponse {
        if (!auctions_.find(settlementEpoch)) {
            return RegulatorResponse::Error(RegulatorStatusCode::AUCTION_NOT_FOUND,
                                            std::format("No auction at epoch {}", settlementEpoch));
        }

        std::optional<SettlementReport> report = planSettlement(settlementEpoch);
        if (!report) {
            return RegulatorResponse::Error(RegulatorStatusCode::AUCTION_CLOSED,
                                            std::format("Auction at epoch {} already finished or canceled",
                                                        settlementEpoch));
        }

        applySettlement(*report);
        return RegulatorResponse::Success("Auction settled", std::move(*report));
    });
}

RegulatorResponse Regulator::placeCouponAuctionBid(AccountId bidder, Epoch couponExpiryOffset,
                                                   const Decimal& dollarAmount, const Decimal& maxCouponAmount) {
    return guarded("placeCouponAuctionBid", [&]() -> RegulatorResponse {
        Decimal balance = ledger_.balanceOf(bidder);
        if (balance < dollarAmount) {
            return RegulatorResponse::Error(RegulatorStatusCode::INSUFFICIENT_BALANCE,
                                            std::format("Account {} holds {}, bid needs {}",
                                                        bidder, balance, dollarAmount));
        }

        Bid bid;
        bid.bidder = bidder;
        bid.dollarAmount = dollarAmount;
        bid.couponAmount = maxCouponAmount;
        bid.couponExpiryEpoch = couponExpiryOffset;

        RegulatorResponse response = auctions_.placeBid(epoch_, bid);
        if (response.isSuccess()) {
            output_.printBidPlaced(std::get<BidReceipt>(response.data));
        }
        return response;
    });
}
