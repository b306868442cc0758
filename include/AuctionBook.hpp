#pragma once

#include <map>
#include <unordered_set>
#include <cstddef>

#include "RegulatorConfig.hpp"
#include "Types.hpp"

/**
 * @brief Per-epoch coupon auctions and their bids.
 * @details Owns every AuctionState. It validates the shape of a bid and
 * keeps the min/max bounds settlement normalizes against, but it does not
 * enforce "one open auction at a time"; that is the Regulator's call.
 */
class AuctionBook {
public:
    explicit AuctionBook(const RegulatorConfig& config);

    // --- Lifecycle ---

    /** @brief Creates the auction for epoch, or returns the existing one untouched. */
    AuctionState& initAuction(Epoch epoch);

    /** @return false if there is no open auction at epoch. */
    bool cancelAuction(Epoch epoch);

    /** @brief Closes the auction and drops its bid list. */
    bool finishAuction(Epoch epoch);

    /**
     * @brief Finishes the auction and keeps the settlement aggregates.
     * @return false, writing nothing, if the auction is not open.
     */
    bool recordSettlement(Epoch epoch, const SettlementReport& report);

    // --- Bids ---

    /**
     * @brief Appends a bid and widens the auction's bounds.
     * @details Checks: auction open, one bid per bidder, capacity, non-zero
     * amounts, expiry in (0, maxCouponExpiry], yield <= maxCouponYield.
     * Account balances are not visible here.
     */
    RegulatorResponse placeBid(Epoch epoch, const Bid& bid);

    // --- Queries ---
    [[nodiscard]] const AuctionState* find(Epoch epoch) const;
    [[nodiscard]] bool isOpen(Epoch epoch) const;
    [[nodiscard]] bool hasBid(Epoch epoch, AccountId bidder) const;
    size_t auctionCount() const { return auctions_.size(); }

private:
    AuctionState* findMutable(Epoch epoch);

    std::map<Epoch, AuctionState> auctions_;
    std::map<Epoch, std::unordered_set<AccountId>> bidders_;

    Decimal maxCouponYield_;
    uint64_t maxCouponExpiry_;
    std::size_t maxBidsPerAuction_;
};
