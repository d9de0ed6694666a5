#include <catch2/catch_test_macros.hpp>
#include "services/savings_service.hpp"
#include "balance_projector.hpp"
#include "test_support.hpp"

using namespace ledgercore;
using namespace ledgercore::testing;

namespace {

SavingsAccountRequest standard_account(const std::string& minimum = "1000", bool withdrawals = true) {
    SavingsAccountRequest request;
    request.customer_id = "CUST-002";
    request.minimum_balance = Money::parse(minimum);
    request.annual_rate = Decimal(6);
    request.withdrawals_allowed = withdrawals;
    return request;
}

SavingsTransactionRequest movement(uint64_t account_id, const std::string& amount,
                                   const std::string& reference = "") {
    return SavingsTransactionRequest{account_id, Money::parse(amount), reference, "teller-1", std::nullopt};
}

} // namespace

TEST_CASE("Savings deposits and withdrawals", "[savings]") {
    LedgerFixture fx;
    SavingsService savings(*fx.ctx, fx.roles);

    auto opened = savings.open_account(standard_account());
    REQUIRE(opened.success());
    REQUIRE(opened.value().account_number == "SA20240115000001");
    REQUIRE(opened.value().status == SavingsStatus::Active);
    const uint64_t id = opened.value().id;

    auto deposit = savings.deposit(movement(id, "10000", "DEP-1"));
    REQUIRE(deposit.success());
    REQUIRE(deposit.value().transaction_number == "ST20240115000001");
    REQUIRE(deposit.value().balance_after.to_string() == "10000.00");
    REQUIRE(fx.balance("2100").to_string() == "10000.00");
    REQUIRE(fx.balance("1100").to_string() == "510000.00");

    SECTION("Withdrawal within the minimum balance") {
        auto withdrawal = savings.withdraw(movement(id, "9000"));
        REQUIRE(withdrawal.success());
        REQUIRE(withdrawal.value().balance_after.to_string() == "1000.00");
        REQUIRE(withdrawal.value().transaction_number == "ST20240115000002");
        REQUIRE(fx.balance("2100").to_string() == "1000.00");
        REQUIRE(savings.get_account(id).value().balance.to_string() == "1000.00");
    }

    SECTION("Withdrawal breaching the minimum balance") {
        auto withdrawal = savings.withdraw(movement(id, "9000.01"));
        REQUIRE(withdrawal.kind() == ErrorKind::INSUFFICIENT_BALANCE);
        REQUIRE(withdrawal.error().detail("available") == "9000.00");
        REQUIRE(withdrawal.error().detail("minimum_balance") == "1000.00");
        REQUIRE(fx.balance("2100").to_string() == "10000.00");
    }

    SECTION("Overdraw") {
        auto withdrawal = savings.withdraw(movement(id, "10000.01"));
        REQUIRE(withdrawal.kind() == ErrorKind::INSUFFICIENT_BALANCE);
        REQUIRE(withdrawal.error().detail("available") == "10000.00");
    }

    SECTION("Amounts must be positive") {
        REQUIRE(savings.deposit(movement(id, "0")).kind() == ErrorKind::INVALID_AMOUNT);
        REQUIRE(savings.withdraw(movement(id, "-5")).kind() == ErrorKind::INVALID_AMOUNT);
    }

    SECTION("Deposit references are single use") {
        REQUIRE(savings.deposit(movement(id, "10000", "DEP-1")).kind() == ErrorKind::DUPLICATE_REFERENCE);
        REQUIRE(savings.get_account(id).value().balance.to_string() == "10000.00");
    }

    SECTION("Unknown account") {
        REQUIRE(savings.deposit(movement(999, "1")).kind() == ErrorKind::NOT_FOUND);
        REQUIRE(savings.get_account(999).kind() == ErrorKind::NOT_FOUND);
    }

    REQUIRE(verify_cached_balances(*fx.ctx).empty());
}

TEST_CASE("Accounts without withdrawals", "[savings]") {
    LedgerFixture fx;
    SavingsService savings(*fx.ctx, fx.roles);
    const uint64_t id = savings.open_account(standard_account("0", false)).value().id;
    REQUIRE(savings.deposit(movement(id, "500")).success());

    REQUIRE(savings.withdraw(movement(id, "100")).kind() == ErrorKind::INVALID_STATE);
}

TEST_CASE("Opening rejects negative terms", "[savings]") {
    LedgerFixture fx;
    SavingsService savings(*fx.ctx, fx.roles);
    REQUIRE(savings.open_account(standard_account("-1")).kind() == ErrorKind::INVALID_AMOUNT);
}

TEST_CASE("Monthly savings interest", "[savings]") {
    LedgerFixture fx(Date(2024, 1, 31));
    SavingsService savings(*fx.ctx, fx.roles);
    const uint64_t id = savings.open_account(standard_account()).value().id;
    REQUIRE(savings.deposit(movement(id, "10000")).success());

    // 10000.00 x 6% / 12
    auto credited = savings.post_interest(id, Date(2024, 1, 31));
    REQUIRE(credited.success());
    REQUIRE(credited.value().to_string() == "50.00");
    REQUIRE(fx.balance("5200").to_string() == "50.00");
    REQUIRE(fx.balance("2100").to_string() == "10050.00");

    auto account = savings.get_account(id).value();
    REQUIRE(account.balance.to_string() == "10050.00");
    REQUIRE(account.last_interest_date == Date(2024, 1, 31));

    SECTION("One credit per month") {
        auto again = savings.post_interest(id, Date(2024, 1, 31));
        REQUIRE(again.kind() == ErrorKind::INVALID_STATE);
        REQUIRE(again.error().detail("period") == "2024-01");
    }

    SECTION("Next month compounds on the credited balance") {
        auto february = savings.post_interest(id, Date(2024, 2, 29));
        REQUIRE(february.value().to_string() == "50.25");
    }

    SECTION("Empty accounts post nothing") {
        const uint64_t empty_id = savings.open_account(standard_account("0")).value().id;
        auto nothing = savings.post_interest(empty_id, Date(2024, 1, 31));
        REQUIRE(nothing.success());
        REQUIRE(nothing.value().is_zero());
        REQUIRE_FALSE(savings.get_account(empty_id).value().last_interest_date.has_value());
    }
}
