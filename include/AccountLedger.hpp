#pragma once

#include <unordered_map>
#include <map>
#include <cstdint>

#include "Ledger.hpp"
#include "RegulatorConfig.hpp"

/**
 * @brief In-memory Ledger
 * @details Tracks balances, per-epoch coupon claims and the protocol pools
 * (bonded, redeemable, oracle pool). Every mutator validates first and only
 * then writes, so a LedgerError never leaves a half-applied change.
 */
class AccountLedger : public Ledger {
public:
    explicit AccountLedger(uint64_t oraclePoolRatio = Config::ORACLE_POOL_RATIO);

    /** @brief Takes the oracle pool's share of coupon top-ups from the loaded config. */
    explicit AccountLedger(const RegulatorConfig& config) : AccountLedger(config.oraclePoolRatio) {}

    // --- Ledger ---
    Decimal balanceOf(AccountId account) const override;
    void mintToAccount(AccountId account, const Decimal& amount) override;
    void burnFromAccount(AccountId account, const Decimal& amount) override;
    void incrementBalanceOfCoupons(AccountId account, Epoch epoch, const Decimal& amount) override;

    Decimal totalDebt() const override { return totalDebt_; }
    Decimal totalRedeemable() const override { return totalRedeemable_; }
    Decimal totalCoupons() const override { return totalCoupons_; }
    Decimal totalNet() const override;

    SupplyAllocation increaseSupply(const Decimal& newSupply) override;
    void increaseDebt(const Decimal& amount) override;
    void setDebtToZero() override { totalDebt_ = Decimal::zero(); }

    // --- Holder Operations ---

    /** @brief Moves balance into the bonded pool. */
    void bond(AccountId account, const Decimal& amount);

    /**
     * @brief Exchanges coupons that have matured for balance, out of the redeemable pool.
     * @throws LedgerError if couponEpoch > currentEpoch, or coupons/redeemable are short.
     */
    void redeemCoupons(AccountId account, Epoch couponEpoch, const Decimal& amount, Epoch currentEpoch);

    Decimal balanceOfCoupons(AccountId account, Epoch epoch) const;

    // --- Introspection ---
    Decimal totalSupply() const { return totalSupply_; }
    Decimal totalBonded() const { return totalBonded_; }
    Decimal poolBalance() const { return poolBalance_; }

private:
    uint64_t oraclePoolRatio_;

    std::unordered_map<AccountId, Decimal> balances_;
    std::unordered_map<AccountId, std::map<Epoch, Decimal>> coupons_;

    Decimal totalSupply_;
    Decimal totalBonded_;
    Decimal totalRedeemable_;
    Decimal totalCoupons_;
    Decimal totalDebt_;
    Decimal poolBalance_;
};
