/**
 * @file AccountTest.cpp
 * @brief Unit-тесты для Account и LedgerEntry
 */

#include <gtest/gtest.h>
#include "domain/Account.hpp"
#include "domain/LedgerEntry.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace bank::domain;

class AccountTest : public ::testing::Test {
protected:
    Account openAccount(int64_t balanceCents = 0) {
        auto account = Account::open(AccountNumber::parse("123456").value(), "BRL").value();
        if (balanceCents > 0) {
            account.deposit(brl(balanceCents));
        }
        return account;
    }

    Money brl(int64_t cents) {
        return Money::of(cents, "BRL").value();
    }
};

// ============================================================================
// OPEN / RESTORE
// ============================================================================

TEST_F(AccountTest, Open_ZeroBalanceVersionZero) {
    auto account = openAccount();

    EXPECT_TRUE(account.balance().isZero());
    EXPECT_EQ(account.balance().currency(), "BRL");
    EXPECT_EQ(account.version(), 0);
    EXPECT_TRUE(account.isNew());
    EXPECT_FALSE(account.accountId().value().empty());
}

TEST_F(AccountTest, Open_InvalidCurrency_Fails) {
    auto account = Account::open(AccountNumber::parse("123456").value(), "XX");

    EXPECT_TRUE(account.is(ErrorKind::INVALID_CURRENCY));
}

TEST_F(AccountTest, Restore_KeepsFields) {
    auto id = AccountId::generate();
    auto account = Account::restore(id, AccountNumber::parse("654321").value(), brl(700), 5);

    EXPECT_EQ(account.accountId(), id);
    EXPECT_EQ(account.accountNumber().value(), "654321");
    EXPECT_EQ(account.balance().amountCents(), 700);
    EXPECT_EQ(account.version(), 5);
    EXPECT_FALSE(account.isNew());
}

// ============================================================================
// DEPOSIT / WITHDRAW
// ============================================================================

TEST_F(AccountTest, Deposit_IncreasesBalance) {
    auto account = openAccount();

    ASSERT_TRUE(account.deposit(brl(10000)).ok());
    EXPECT_EQ(account.balance().amountCents(), 10000);
    // Версия меняется только хранилищем
    EXPECT_EQ(account.version(), 0);
}

TEST_F(AccountTest, Deposit_Zero_InvalidAmount) {
    auto account = openAccount(100);

    EXPECT_TRUE(account.deposit(brl(0)).is(ErrorKind::INVALID_AMOUNT));
    EXPECT_EQ(account.balance().amountCents(), 100);
}

TEST_F(AccountTest, Deposit_OtherCurrency_Mismatch) {
    auto account = openAccount(100);

    EXPECT_TRUE(account.deposit(Money::of(50, "USD").value()).is(ErrorKind::CURRENCY_MISMATCH));
    EXPECT_EQ(account.balance().amountCents(), 100);
}

TEST_F(AccountTest, Withdraw_DecreasesBalance) {
    auto account = openAccount(10000);

    ASSERT_TRUE(account.withdraw(brl(2000)).ok());
    EXPECT_EQ(account.balance().amountCents(), 8000);
}

TEST_F(AccountTest, Withdraw_EntireBalance_Allowed) {
    auto account = openAccount(500);

    ASSERT_TRUE(account.withdraw(brl(500)).ok());
    EXPECT_TRUE(account.balance().isZero());
}

TEST_F(AccountTest, Withdraw_MoreThanBalance_InsufficientFunds) {
    auto account = openAccount(500);

    auto result = account.withdraw(brl(501));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::INSUFFICIENT_FUNDS);
    EXPECT_NE(result.error().message.find("123456"), std::string::npos);
    EXPECT_EQ(account.balance().amountCents(), 500);
}

TEST_F(AccountTest, Withdraw_Zero_InvalidAmount) {
    auto account = openAccount(500);

    EXPECT_TRUE(account.withdraw(brl(0)).is(ErrorKind::INVALID_AMOUNT));
}

TEST_F(AccountTest, WithVersion_ReturnsCopy) {
    auto account = openAccount(100);

    auto persisted = account.withVersion(1);

    EXPECT_EQ(persisted.version(), 1);
    EXPECT_EQ(account.version(), 0);
    EXPECT_EQ(persisted.balance(), account.balance());
}

// ============================================================================
// LEDGER ENTRY
// ============================================================================

TEST_F(AccountTest, LedgerEntry_Deposit_NoCounterparty) {
    auto account = openAccount();

    auto entry = LedgerEntry::create(account.accountId(), LedgerEntryType::DEPOSIT, brl(300));

    ASSERT_TRUE(entry.ok());
    EXPECT_EQ(entry.value().accountId(), account.accountId());
    EXPECT_EQ(entry.value().type(), LedgerEntryType::DEPOSIT);
    EXPECT_EQ(entry.value().amount().amountCents(), 300);
    EXPECT_FALSE(entry.value().correlationId().has_value());
    EXPECT_FALSE(entry.value().counterpartyAccountNumber().has_value());
    EXPECT_EQ(entry.value().entryId().size(), 36u);
}

TEST_F(AccountTest, LedgerEntry_Transfer_CarriesCorrelationAndCounterparty) {
    auto account = openAccount();
    auto counterparty = AccountNumber::parse("999999").value();

    auto entry = LedgerEntry::create(account.accountId(), LedgerEntryType::TRANSFER_OUT, brl(300),
                                     std::string("corr-1"), counterparty);

    ASSERT_TRUE(entry.ok());
    EXPECT_EQ(entry.value().correlationId().value(), "corr-1");
    EXPECT_EQ(entry.value().counterpartyAccountNumber().value(), counterparty);
}

TEST_F(AccountTest, LedgerEntry_ZeroAmount_Rejected) {
    auto account = openAccount();

    auto entry = LedgerEntry::create(account.accountId(), LedgerEntryType::DEPOSIT, brl(0));

    EXPECT_TRUE(entry.is(ErrorKind::INVALID_AMOUNT));
}

TEST_F(AccountTest, LedgerEntryType_StringRoundTrip) {
    EXPECT_EQ(toString(LedgerEntryType::TRANSFER_IN), "TRANSFER_IN");
    EXPECT_EQ(parseLedgerEntryType("WITHDRAWAL"), LedgerEntryType::WITHDRAWAL);
    EXPECT_FALSE(parseLedgerEntryType("REFUND").has_value());
}

TEST_F(AccountTest, Timestamp_IsoWithMillis) {
    auto ts = Timestamp::fromMicros(1700000000123456);

    EXPECT_EQ(ts.toString(), "2023-11-14T22:13:20.123Z");
    EXPECT_EQ(ts.toMicros(), 1700000000123456);
}

TEST_F(AccountTest, Timestamp_MillisTruncatedNotRounded) {
    auto ts = Timestamp::fromMicros(1700000000999999);

    EXPECT_EQ(ts.toString(), "2023-11-14T22:13:20.999Z");
}

TEST_F(AccountTest, Timestamp_ToStringFromManyThreads) {
    const Timestamp first = Timestamp::fromMicros(1700000000123456);
    const Timestamp second = Timestamp::fromMicros(946684799000000);  // 1999-12-31T23:59:59

    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        const Timestamp& ts = (t % 2 == 0) ? first : second;
        const std::string expected = (t % 2 == 0) ? "2023-11-14T22:13:20.123Z" : "1999-12-31T23:59:59.000Z";
        workers.emplace_back([&ts, expected, &mismatches] {
            for (int i = 0; i < 500; ++i) {
                if (ts.toString() != expected) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
}
