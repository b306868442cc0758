#pragma once

#include <stdexcept>
#include <string>

#include "Types.hpp"

class LedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Account & coupon ledger the regulator drives.
 * @details Implementations must make each mutating call all-or-nothing:
 * either the call completes or it throws LedgerError with no state changed.
 */
class Ledger {
public:
    virtual ~Ledger() = default;

    // --- Accounts ---
    virtual Decimal balanceOf(AccountId account) const = 0;
    virtual void mintToAccount(AccountId account, const Decimal& amount) = 0;
    virtual void burnFromAccount(AccountId account, const Decimal& amount) = 0;
    virtual void incrementBalanceOfCoupons(AccountId account, Epoch epoch, const Decimal& amount) = 0;

    // --- Aggregates ---
    virtual Decimal totalDebt() const = 0;
    virtual Decimal totalRedeemable() const = 0;
    virtual Decimal totalCoupons() const = 0;
    virtual Decimal totalNet() const = 0;

    // --- Supply ---
    virtual SupplyAllocation increaseSupply(const Decimal& newSupply) = 0;
    virtual void increaseDebt(const Decimal& amount) = 0;
    virtual void setDebtToZero() = 0;
};
