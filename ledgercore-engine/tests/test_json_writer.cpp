/**
 * @file test_json_writer.cpp
 * @brief Unit tests for schedule, trial balance and ledger JSON output
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <nlohmann/json.hpp>
#include "io/json_writer.hpp"
#include "posting_engine.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace ledgercore;
using namespace ledgercore::testing;
using json = nlohmann::json;

namespace {

LoanTerms twelve_month_terms() {
    LoanTerms terms;
    terms.principal = Money::parse("120000");
    terms.annual_rate = Decimal(24);
    terms.tenure_months = 12;
    terms.method = AmortizationMethod::ReducingBalance;
    terms.start_date = Date(2024, 1, 15);
    return terms;
}

} // namespace

TEST_CASE("Schedule JSON", "[json_writer]") {
    const LoanTerms terms = twelve_month_terms();
    const AmortizationSchedule schedule = calculate_schedule(terms);

    std::ostringstream compact;
    io::write_schedule_json(compact, terms, schedule, false);

    // Amounts keep exactly two decimals in the text
    REQUIRE(compact.str().find("\"emi\":11347.15") != std::string::npos);
    REQUIRE(compact.str().find("\"total_interest\":16165.83") != std::string::npos);

    json j = json::parse(compact.str());
    REQUIRE(j["terms"]["method"] == "REDUCING_BALANCE");
    REQUIRE(j["terms"]["tenure_months"] == 12);
    REQUIRE(j["terms"]["start_date"] == "2024-01-15");
    REQUIRE(j["installments"].size() == 12);
    REQUIRE(j["installments"][0]["number"] == 1);
    REQUIRE(j["installments"][0]["due_date"] == "2024-02-15");
    REQUIRE(j["installments"][0]["interest"].get<double>() == Catch::Approx(2400.00));
    REQUIRE(j["installments"][11]["closing_balance"].get<double>() == Catch::Approx(0.0));

    SECTION("Pretty output parses to the same document") {
        std::ostringstream pretty;
        io::write_schedule_json(pretty, terms, schedule);
        REQUIRE(pretty.str().find('\n') != std::string::npos);
        REQUIRE(json::parse(pretty.str()) == j);
    }

    SECTION("Unwritable path") {
        REQUIRE_THROWS_AS(io::write_schedule_json("/nonexistent-dir/schedule.json", terms, schedule),
                          std::runtime_error);
    }
}

TEST_CASE("Trial balance JSON", "[json_writer]") {
    LedgerFixture fx;
    REQUIRE(submit(*fx.ctx, fx.simple_entry("1300", "1100", "25000", Date(2024, 1, 15))).success());

    const TrialBalance tb = generate_trial_balance(*fx.ctx, Date(2024, 1, 31));

    const std::filesystem::path path = std::filesystem::temp_directory_path() / "ledgercore_tb_test.json";
    io::write_trial_balance_json(path.string(), tb);

    std::ifstream file(path);
    json j = json::parse(file);
    file.close();
    std::filesystem::remove(path);

    REQUIRE(j["as_of"] == "2024-01-31");
    REQUIRE(j["balanced"] == true);
    REQUIRE(j["total_debit"].get<double>() == Catch::Approx(500000.00));
    REQUIRE(j["total_credit"].get<double>() == Catch::Approx(500000.00));
    REQUIRE(j["rows"].size() == tb.rows.size());

    bool found_loans = false;
    for (const auto& row : j["rows"]) {
        if (row["code"] == "1300") {
            found_loans = true;
            REQUIRE(row["type"] == "asset");
            REQUIRE(row["debit"].get<double>() == Catch::Approx(25000.00));
        }
    }
    REQUIRE(found_loans);
}

TEST_CASE("Account ledger JSON", "[json_writer]") {
    LedgerFixture fx;
    auto request = fx.simple_entry("1300", "1100", "1000", Date(2024, 1, 15));
    request.metadata.description = "Disbursal \"A\"\tbatch";
    REQUIRE(submit(*fx.ctx, request).success());

    auto ledger = get_ledger(*fx.ctx, "1100", Date(2024, 1, 1), Date(2024, 1, 31));
    REQUIRE(ledger.success());

    std::ostringstream out;
    io::write_account_ledger_json(out, ledger.value(), false);

    json j = json::parse(out.str());
    REQUIRE(j["code"] == "1100");
    REQUIRE(j["opening_balance"].get<double>() == Catch::Approx(500000.00));
    REQUIRE(j["closing_balance"].get<double>() == Catch::Approx(499000.00));
    REQUIRE(j["lines"].size() == 1);
    REQUIRE(j["lines"][0]["description"] == "Disbursal \"A\"\tbatch");
    REQUIRE(j["lines"][0]["entry_number"] == "JE20240115000001");
}

TEST_CASE("JSON escaping", "[json_writer]") {
    REQUIRE(io::escape_json("plain") == "plain");
    REQUIRE(io::escape_json("a\"b") == "a\\\"b");
    REQUIRE(io::escape_json("back\\slash") == "back\\\\slash");
    REQUIRE(io::escape_json("line\nbreak") == "line\\nbreak");
    REQUIRE(io::escape_json(std::string(1, '\x01')) == "\\u0001");
}
