#include "domain/Account.hpp"

namespace bank::domain {

Result<Account> Account::open(const AccountNumber& number, const std::string& currency) {
    auto zero = Money::zero(currency);
    if (!zero) {
        return Result<Account>::failure(zero.error());
    }
    return Result<Account>::success(Account(AccountId::generate(), number, zero.value(), 0));
}

Account Account::restore(const AccountId& id,
                         const AccountNumber& number,
                         const Money& balance,
                         int64_t version) {
    return Account(id, number, balance, version);
}

Status Account::deposit(const Money& amount) {
    if (amount.isZero()) {
        return Status::failure(ErrorKind::INVALID_AMOUNT, "Deposit amount must be greater than zero");
    }

    auto updated = balance_.add(amount);
    if (!updated) {
        return Status::failure(updated.error());
    }

    balance_ = std::move(updated).value();
    return Status::success();
}

Status Account::withdraw(const Money& amount) {
    if (amount.isZero()) {
        return Status::failure(ErrorKind::INVALID_AMOUNT, "Withdrawal amount must be greater than zero");
    }

    auto exceeds = amount.greaterThan(balance_);
    if (!exceeds) {
        return Status::failure(exceeds.error());
    }
    if (exceeds.value()) {
        return Status::failure(ErrorKind::INSUFFICIENT_FUNDS,
            "Insufficient funds in account " + accountNumber_.value()
            + ": balance " + balance_.toString() + ", requested " + amount.toString());
    }

    auto updated = balance_.subtract(amount);
    if (!updated) {
        return Status::failure(updated.error());
    }

    balance_ = std::move(updated).value();
    return Status::success();
}

} // namespace bank::domain
