#pragma once

#include <optional>
#include <string_view>

#include "AuctionBook.hpp"
#include "Ledger.hpp"
#include "Oracle.hpp"
#include "OutputHandler.hpp"
#include "RegulatorConfig.hpp"
#include "Types.hpp"

/**
 * @brief The Supply Regulator: one state transition per epoch.
 * @details Each step reads the oracle once and then either expands supply
 * (price above peg), contracts it through debt and a coupon auction (below
 * peg), or does nothing (exactly at peg).
 *
 * Single-threaded and non-reentrant: a call into step/advance/settle/bid
 * while another is in flight (e.g. from inside an adapter callback) is
 * refused with REENTRANT_CALL. The oracle and ledger are borrowed, never owned.
 */
class Regulator {
public:
    Regulator(const RegulatorConfig& config, Oracle& oracle, Ledger& ledger,
              OutputHandler& output, Epoch startEpoch = 0);

    Regulator(const Regulator&) = delete;
    Regulator& operator=(const Regulator&) = delete;

    // --- Epoch Driver (Public API) ---

    /**
     * @brief Moves to the next epoch, pays the advancer, then runs step().
     * @details If step fails both the epoch and the payment are rolled back.
     */
    RegulatorResponse advance(AccountId advancer);

    /**
     * @brief Regulates supply for the current epoch.
     * @details The open auction is normally the one opened at epoch() - 1,
     * because the epoch counter has already moved on by the time a step runs.
     * At most one auction is open at any time.
     *   price > peg:  zero debt, cancel the open auction, grow supply.
     *   price < peg:  settle the open auction, open one for epoch(), add debt.
     *   price == peg: SupplyNeutral only.
     */
    RegulatorResponse step();

    // --- Coupon Auctions (Public API) ---

    RegulatorResponse placeCouponAuctionBid(AccountId bidder, Epoch couponExpiryOffset,
                                            const Decimal& dollarAmount, const Decimal& maxCouponAmount);

    /**
     * @brief Ranks and fills the auction at settlementEpoch, then finishes it.
     * @return AUCTION_CLOSED if it was already finished or canceled.
     */
    RegulatorResponse settleCouponAuction(Epoch settlementEpoch);

    // --- Queries ---
    Epoch epoch() const { return epoch_; }
    std::optional<Epoch> openAuction() const { return openAuction_; }
    bool bootstrappingAt(Epoch epoch) const { return epoch <= config_.bootstrappingPeriod; }
    const AuctionBook& auctions() const { return auctions_; }
    const RegulatorConfig& config() const { return config_; }

private:
    // --- Internal Pipeline ---
    RegulatorResponse runStep();
    Decimal oracleCapture();

    RegulatorResponse growSupply(const Decimal& price);
    RegulatorResponse shrinkSupply(const Decimal& price);

    /** @brief |price - 1| / divisor, clamped to the per-epoch limit. */
    Decimal supplyDelta(const Decimal& price) const;
    bool couponsUnderfunded() const;

    /** @return nullopt when the auction is missing, finished or canceled. */
    std::optional<SettlementReport> planSettlement(Epoch settlementEpoch) const;
    void applySettlement(const SettlementReport& report);

    /** @brief Maps DecimalError/LedgerError thrown by body to an error response. */
    template <typename Fn>
    RegulatorResponse trapFaults(std::string_view operation, Fn&& body);

    template <typename Fn>
    RegulatorResponse guarded(std::string_view operation, Fn&& body);

    // --- Data Members ---
    RegulatorConfig config_;
    Oracle& oracle_;
    Ledger& ledger_;
    OutputHandler& output_;

    AuctionBook auctions_;
    Epoch epoch_;
    std::optional<Epoch> openAuction_;
    bool inFlight_ = false;
};
