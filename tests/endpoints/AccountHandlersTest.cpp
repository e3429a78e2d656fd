/**
 * @file AccountHandlersTest.cpp
 * @brief Unit-тесты для HTTP handlers счетов
 *
 * POST /api/v1/accounts
 * GET  /api/v1/accounts/{number}/balance
 * POST /api/v1/accounts/{number}/deposit
 * POST /api/v1/accounts/{number}/withdraw
 * GET  /api/v1/accounts/{number}/transactions
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/CreateAccountHandler.hpp"
#include "adapters/primary/GetBalanceHandler.hpp"
#include "adapters/primary/DepositHandler.hpp"
#include "adapters/primary/WithdrawHandler.hpp"
#include "adapters/primary/GetTransactionsHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/secondary/InMemoryUnitOfWork.hpp"
#include "../mocks/MockServices.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace bank;
using namespace bank::adapters::primary;
using namespace bank::tests;
using ::testing::_;
using ::testing::Field;
using ::testing::AllOf;
using ::testing::Return;
using ::testing::Throw;

// ============================================================================
// Test Fixture
// ============================================================================

class AccountHandlersTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockAccountService_ = std::make_shared<MockAccountService>();
    }

    SimpleRequest createRequest(const std::string &method,
                                const std::string &path,
                                const std::string &body = "")
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        req.setBody(body);
        return req;
    }

    nlohmann::json parseJson(const std::string &body)
    {
        return nlohmann::json::parse(body);
    }

    static domain::Result<ports::input::TransactionResult> transactionResult(int64_t balance)
    {
        return domain::Result<ports::input::TransactionResult>::success({"123456", balance, "BRL"});
    }

    std::shared_ptr<MockAccountService> mockAccountService_;
};

// ============================================================================
// ТЕСТЫ: POST /api/v1/accounts
// ============================================================================

TEST_F(AccountHandlersTest, CreateAccount_Valid_Returns201)
{
    CreateAccountHandler handler(mockAccountService_);

    EXPECT_CALL(*mockAccountService_, createAccount(AllOf(
            Field(&ports::input::CreateAccountCommand::accountNumber, "123456"),
            Field(&ports::input::CreateAccountCommand::initialBalanceCents, 10000),
            Field(&ports::input::CreateAccountCommand::currency, "BRL"))))
        .WillOnce(Return(domain::Result<ports::input::AccountCreatedResult>::success(
            {"acc-uuid", "123456", 10000, "BRL"})));

    auto req = createRequest("POST", "/api/v1/accounts",
                             R"({"account_number": "123456", "initial_balance_cents": 10000})");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["account_id"], "acc-uuid");
    EXPECT_EQ(json["account_number"], "123456");
    EXPECT_EQ(json["balance_cents"], 10000);
    EXPECT_EQ(json["currency"], "BRL");
}

TEST_F(AccountHandlersTest, CreateAccount_Duplicate_Returns409)
{
    CreateAccountHandler handler(mockAccountService_);

    EXPECT_CALL(*mockAccountService_, createAccount(_))
        .WillOnce(Return(domain::Result<ports::input::AccountCreatedResult>::failure(
            domain::ErrorKind::ACCOUNT_ALREADY_EXISTS, "Account 123456 already exists")));

    auto req = createRequest("POST", "/api/v1/accounts", R"({"account_number": "123456"})");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 409);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["code"], "ACCOUNT_ALREADY_EXISTS");
    EXPECT_EQ(json["error"], "Account 123456 already exists");
}

TEST_F(AccountHandlersTest, CreateAccount_InvalidJson_Returns400)
{
    CreateAccountHandler handler(mockAccountService_);

    EXPECT_CALL(*mockAccountService_, createAccount(_)).Times(0);

    auto req = createRequest("POST", "/api/v1/accounts", "{not json");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(AccountHandlersTest, CreateAccount_WrongMethod_Returns405)
{
    CreateAccountHandler handler(mockAccountService_);

    auto req = createRequest("GET", "/api/v1/accounts");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}

// ============================================================================
// ТЕСТЫ: GET /api/v1/accounts/{number}/balance
// ============================================================================

TEST_F(AccountHandlersTest, GetBalance_Found_Returns200)
{
    GetBalanceHandler handler(mockAccountService_);

    EXPECT_CALL(*mockAccountService_, getBalance("123456"))
        .WillOnce(Return(domain::Result<ports::input::BalanceResult>::success({"123456", 7500, "BRL"})));

    auto req = createRequest("GET", "/api/v1/accounts/123456/balance");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["account_number"], "123456");
    EXPECT_EQ(json["balance_cents"], 7500);
}

TEST_F(AccountHandlersTest, GetBalance_NotFound_Returns404)
{
    GetBalanceHandler handler(mockAccountService_);

    EXPECT_CALL(*mockAccountService_, getBalance("999999"))
        .WillOnce(Return(domain::Result<ports::input::BalanceResult>::failure(
            domain::ErrorKind::ACCOUNT_NOT_FOUND, "Account 999999 not found")));

    auto req = createRequest("GET", "/api/v1/accounts/999999/balance");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
    EXPECT_EQ(parseJson(res.getBody())["code"], "ACCOUNT_NOT_FOUND");
}

TEST_F(AccountHandlersTest, GetBalance_StorageFailure_Returns500)
{
    GetBalanceHandler handler(mockAccountService_);

    EXPECT_CALL(*mockAccountService_, getBalance(_))
        .WillOnce(Throw(std::runtime_error("connection refused")));

    auto req = createRequest("GET", "/api/v1/accounts/123456/balance");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
}

// ============================================================================
// ТЕСТЫ: deposit / withdraw
// ============================================================================

TEST_F(AccountHandlersTest, Deposit_Valid_Returns200)
{
    DepositHandler handler(mockAccountService_);

    EXPECT_CALL(*mockAccountService_, deposit(AllOf(
            Field(&ports::input::DepositCommand::accountNumber, "123456"),
            Field(&ports::input::DepositCommand::amountCents, 5000))))
        .WillOnce(Return(transactionResult(15000)));

    auto req = createRequest("POST", "/api/v1/accounts/123456/deposit", R"({"amount_cents": 5000})");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(parseJson(res.getBody())["balance_cents"], 15000);
}

TEST_F(AccountHandlersTest, Deposit_InvalidAmount_Returns400)
{
    DepositHandler handler(mockAccountService_);

    EXPECT_CALL(*mockAccountService_, deposit(_))
        .WillOnce(Return(domain::Result<ports::input::TransactionResult>::failure(
            domain::ErrorKind::INVALID_AMOUNT, "Amount must be greater than zero")));

    auto req = createRequest("POST", "/api/v1/accounts/123456/deposit", R"({"amount_cents": 0})");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["code"], "INVALID_AMOUNT");
}

TEST_F(AccountHandlersTest, Deposit_NonIntegerAmount_Returns400InvalidAmount)
{
    DepositHandler handler(mockAccountService_);

    EXPECT_CALL(*mockAccountService_, deposit(_)).Times(0);

    const std::vector<std::string> bodies = {
        R"({"amount_cents": "lots"})",
        R"({"amount_cents": 12.9})",
        R"({"amount_cents": true})",
        R"({"amount_cents": 1e30})",
        R"({"amount_cents": 18446744073709551615})",
    };

    for (const auto &body : bodies)
    {
        auto req = createRequest("POST", "/api/v1/accounts/123456/deposit", body);
        SimpleResponse res;

        handler.handle(req, res);

        EXPECT_EQ(res.getStatus(), 400) << body;
        EXPECT_EQ(parseJson(res.getBody())["code"], "INVALID_AMOUNT") << body;
    }
}

TEST_F(AccountHandlersTest, Withdraw_FractionalAmount_NotTruncated)
{
    WithdrawHandler handler(mockAccountService_);

    EXPECT_CALL(*mockAccountService_, withdraw(_)).Times(0);

    auto req = createRequest("POST", "/api/v1/accounts/123456/withdraw", R"({"amount_cents": 12.9})");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["code"], "INVALID_AMOUNT");
}

TEST_F(AccountHandlersTest, CreateAccount_BooleanInitialBalance_Returns400)
{
    CreateAccountHandler handler(mockAccountService_);

    EXPECT_CALL(*mockAccountService_, createAccount(_)).Times(0);

    auto req = createRequest("POST", "/api/v1/accounts",
                             R"({"account_number": "123456", "initial_balance_cents": true})");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["code"], "INVALID_AMOUNT");
}

TEST_F(AccountHandlersTest, Withdraw_InsufficientFunds_Returns400)
{
    WithdrawHandler handler(mockAccountService_);

    EXPECT_CALL(*mockAccountService_, withdraw(Field(&ports::input::WithdrawCommand::amountCents, 501)))
        .WillOnce(Return(domain::Result<ports::input::TransactionResult>::failure(
            domain::ErrorKind::INSUFFICIENT_FUNDS, "Insufficient funds")));

    auto req = createRequest("POST", "/api/v1/accounts/123456/withdraw", R"({"amount_cents": 501})");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["code"], "INSUFFICIENT_FUNDS");
}

TEST_F(AccountHandlersTest, Withdraw_ConflictAfterRetries_Returns409)
{
    WithdrawHandler handler(mockAccountService_);

    EXPECT_CALL(*mockAccountService_, withdraw(_))
        .WillOnce(Return(domain::Result<ports::input::TransactionResult>::failure(
            domain::ErrorKind::CONCURRENCY_CONFLICT, "withdraw failed after 3 attempts")));

    auto req = createRequest("POST", "/api/v1/accounts/123456/withdraw", R"({"amount_cents": 100})");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 409);
    EXPECT_EQ(parseJson(res.getBody())["code"], "CONCURRENCY_CONFLICT");
}

// ============================================================================
// ТЕСТЫ: GET /api/v1/accounts/{number}/transactions
// ============================================================================

TEST_F(AccountHandlersTest, GetTransactions_ReturnsEntries)
{
    GetTransactionsHandler handler(mockAccountService_);

    ports::input::LedgerEntryView transferIn;
    transferIn.entryId = "e-2";
    transferIn.entryType = domain::LedgerEntryType::TRANSFER_IN;
    transferIn.amountCents = 300;
    transferIn.currency = "BRL";
    transferIn.correlationId = "corr-1";
    transferIn.counterpartyAccountNumber = "654321";
    transferIn.occurredAt = domain::Timestamp::fromMicros(1700000001000000);

    ports::input::LedgerEntryView deposit;
    deposit.entryId = "e-1";
    deposit.entryType = domain::LedgerEntryType::DEPOSIT;
    deposit.amountCents = 1000;
    deposit.currency = "BRL";
    deposit.occurredAt = domain::Timestamp::fromMicros(1700000000000000);

    EXPECT_CALL(*mockAccountService_, getTransactions("123456"))
        .WillOnce(Return(domain::Result<std::vector<ports::input::LedgerEntryView>>::success(
            {transferIn, deposit})));

    auto req = createRequest("GET", "/api/v1/accounts/123456/transactions");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    ASSERT_TRUE(json.is_array());
    ASSERT_EQ(json.size(), 2u);

    EXPECT_EQ(json[0]["entry_type"], "TRANSFER_IN");
    EXPECT_EQ(json[0]["correlation_id"], "corr-1");
    EXPECT_EQ(json[0]["counterparty_account_number"], "654321");
    EXPECT_EQ(json[0]["occurred_at"], "2023-11-14T22:13:21.000Z");

    EXPECT_EQ(json[1]["entry_type"], "DEPOSIT");
    EXPECT_TRUE(json[1]["correlation_id"].is_null());
    EXPECT_TRUE(json[1]["counterparty_account_number"].is_null());
}

TEST_F(AccountHandlersTest, GetTransactions_InvalidNumber_Returns400)
{
    GetTransactionsHandler handler(mockAccountService_);

    EXPECT_CALL(*mockAccountService_, getTransactions("12ab"))
        .WillOnce(Return(domain::Result<std::vector<ports::input::LedgerEntryView>>::failure(
            domain::ErrorKind::INVALID_ACCOUNT_NUMBER, "AccountNumber must contain only digits")));

    auto req = createRequest("GET", "/api/v1/accounts/12ab/transactions");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["code"], "INVALID_ACCOUNT_NUMBER");
}

// ============================================================================
// ТЕСТЫ: GET /health
// ============================================================================

namespace
{

    class UnreachableUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory
    {
    public:
        std::unique_ptr<ports::output::IUnitOfWork> begin() override
        {
            throw std::runtime_error("could not connect to server");
        }
    };

} // namespace

TEST_F(AccountHandlersTest, Health_StorageUp_Returns200)
{
    auto store = std::make_shared<adapters::secondary::InMemoryBankStore>();
    HealthHandler handler(std::make_shared<adapters::secondary::InMemoryUnitOfWorkFactory>(store));

    auto req = createRequest("GET", "/health");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["status"], "healthy");
    EXPECT_EQ(json["storage"], "up");
    EXPECT_EQ(store->heldLockCount(), 0u);
}

TEST_F(AccountHandlersTest, Health_StorageDown_Returns503)
{
    HealthHandler handler(std::make_shared<UnreachableUnitOfWorkFactory>());

    auto req = createRequest("GET", "/health");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 503);
    EXPECT_EQ(parseJson(res.getBody())["status"], "unhealthy");
}
