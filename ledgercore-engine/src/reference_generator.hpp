#ifndef LEDGERCORE_REFERENCE_GENERATOR_HPP
#define LEDGERCORE_REFERENCE_GENERATOR_HPP

#include "calendar.hpp"
#include <cstdint>
#include <string>

namespace ledgercore {

class Transaction;

// Reference prefixes
namespace prefix {
constexpr const char* JOURNAL_ENTRY = "JE";
constexpr const char* RECEIPT = "RC";
constexpr const char* LOAN = "LN";
constexpr const char* SAVINGS_ACCOUNT = "SA";
constexpr const char* SAVINGS_TRANSACTION = "ST";
constexpr const char* FIXED_DEPOSIT = "FD";
} // namespace prefix

// "<prefix><yyyymmdd><6-digit sequence>", e.g. JE20240315000042
std::string format_reference(const std::string& prefix, const Date& date, uint64_t sequence);

// Issue the next reference for (prefix, date). The counter lives in the store
// and rolls back with the transaction, so numbers are never skipped by a
// failed operation.
std::string next_reference(Transaction& txn, const std::string& prefix, const Date& date);

} // namespace ledgercore

#endif // LEDGERCORE_REFERENCE_GENERATOR_HPP
