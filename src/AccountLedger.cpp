#include "AccountLedger.hpp"

#include <format>

AccountLedger::AccountLedger(uint64_t oraclePoolRatio) : oraclePoolRatio_(oraclePoolRatio) {
    if (oraclePoolRatio_ >= 100) {
        throw LedgerError(std::format("oracle pool ratio {} must be below 100", oraclePoolRatio_));
    }
}

// ============================================================================
// ACCOUNTS
// ============================================================================

Decimal AccountLedger::balanceOf(AccountId account) const {
    auto it = balances_.find(account);
    return (it != balances_.end()) ? it->second : Decimal::zero();
}

void AccountLedger::mintToAccount(AccountId account, const Decimal& amount) {
    Decimal newBalance = balanceOf(account).add(amount);
    Decimal newSupply = totalSupply_.add(amount);

    balances_[account] = newBalance;
    totalSupply_ = newSupply;
}

void AccountLedger::burnFromAccount(AccountId account, const Decimal& amount) {
    Decimal balance = balanceOf(account);
    if (balance < amount) {
        throw LedgerError(std::format("burn of {} exceeds balance {} of account {}", amount, balance, account));
    }

    // Debt is deliberately untouched: coupon purchases burn against debt
    // capacity without retiring it.
    balances_[account] = balance.sub(amount);
    totalSupply_ = totalSupply_.sub(amount);
}

void AccountLedger::incrementBalanceOfCoupons(AccountId account, Epoch epoch, const Decimal& amount) {
    Decimal newCoupons = balanceOfCoupons(account, epoch).add(amount);
    Decimal newTotal = totalCoupons_.add(amount);

    coupons_[account][epoch] = newCoupons;
    totalCoupons_ = newTotal;
}

Decimal AccountLedger::balanceOfCoupons(AccountId account, Epoch epoch) const {
    auto acct = coupons_.find(account);
    if (acct == coupons_.end()) return Decimal::zero();
    auto it = acct->second.find(epoch);
    return (it != acct->second.end()) ? it->second : Decimal::zero();
}

Decimal AccountLedger::totalNet() const {
    return totalSupply_.saturatingSub(totalDebt_);
}

// ============================================================================
// SUPPLY
// ============================================================================

// 1. Top up redeemable toward outstanding coupons (oracle pool takes its cut)
// 2. Retire debt with what is left
// 3. Pay the remainder to bonded holders
SupplyAllocation AccountLedger::increaseSupply(const Decimal& newSupply) {
    const Decimal hundred = Decimal::from(100);
    const Decimal ratio = Decimal::from(oraclePoolRatio_);

    Decimal remaining = newSupply;
    Decimal poolReward;
    Decimal newRedeemable;
    Decimal lessDebt;

    if (totalRedeemable_ < totalCoupons_) {
        Decimal shortfall = totalCoupons_.sub(totalRedeemable_);
        Decimal padded = shortfall.mul(hundred).div(hundred.sub(ratio));
        if (padded > remaining) padded = remaining;

        poolReward = padded.mul(ratio).div(hundred);
        newRedeemable = padded.sub(poolReward);
        remaining = remaining.sub(padded);
    }

    if (!remaining.isZero() && !totalDebt_.isZero()) {
        lessDebt = (totalDebt_ < remaining) ? totalDebt_ : remaining;
        remaining = remaining.sub(lessDebt);
    }

    Decimal newBonded = totalBonded_.isZero() ? Decimal::zero() : remaining;

    // Compute every new total before committing any of them.
    Decimal nextSupply = totalSupply_.add(poolReward).add(newRedeemable).add(newBonded);
    Decimal nextPool = poolBalance_.add(poolReward);
    Decimal nextRedeemable = totalRedeemable_.add(newRedeemable);
    Decimal nextBonded = totalBonded_.add(newBonded);
    Decimal nextDebt = totalDebt_.sub(lessDebt);

    totalSupply_ = nextSupply;
    poolBalance_ = nextPool;
    totalRedeemable_ = nextRedeemable;
    totalBonded_ = nextBonded;
    totalDebt_ = nextDebt;

    return {newRedeemable, lessDebt, newBonded};
}

void AccountLedger::increaseDebt(const Decimal& amount) {
    totalDebt_ = totalDebt_.add(amount);
}

// ============================================================================
// HOLDER OPERATIONS
// ============================================================================

void AccountLedger::bond(AccountId account, const Decimal& amount) {
    Decimal balance = balanceOf(account);
    if (balance < amount) {
        throw LedgerError(std::format("bond of {} exceeds balance {} of account {}", amount, balance, account));
    }
    Decimal nextBonded = totalBonded_.add(amount);

    balances_[account] = balance.sub(amount);
    totalBonded_ = nextBonded;
}

void AccountLedger::redeemCoupons(AccountId account, Epoch couponEpoch, const Decimal& amount, Epoch currentEpoch) {
    if (couponEpoch > currentEpoch) {
        throw LedgerError(std::format("coupons of epoch {} are not redeemable at epoch {}", couponEpoch, currentEpoch));
    }

    Decimal held = balanceOfCoupons(account, couponEpoch);
    if (held < amount) {
        throw LedgerError(std::format("account {} holds {} coupons at epoch {}, cannot redeem {}",
                                      account, held, couponEpoch, amount));
    }
    if (totalRedeemable_ < amount) {
        throw LedgerError(std::format("redeemable pool {} cannot cover {}", totalRedeemable_, amount));
    }

    Decimal nextBalance = balanceOf(account).add(amount);

    coupons_[account][couponEpoch] = held.sub(amount);
    totalCoupons_ = totalCoupons_.sub(amount);
    totalRedeemable_ = totalRedeemable_.sub(amount);
    balances_[account] = nextBalance;
}
