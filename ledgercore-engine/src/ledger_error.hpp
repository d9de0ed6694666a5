/**
 * @file ledger_error.hpp
 * @brief Error taxonomy and result values for ledger operations
 *
 * Operational failures (an unbalanced entry, a closed period, an overdrawn
 * account) are returned to the caller as values carrying a tagged ErrorKind
 * and the details needed to correct the input. Exceptions are reserved for
 * configuration mistakes and programming errors.
 */

#ifndef LEDGERCORE_LEDGER_ERROR_HPP
#define LEDGERCORE_LEDGER_ERROR_HPP

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace ledgercore {

/**
 * @brief Tagged failure kinds reported by the ledger and workflow services
 */
enum class ErrorKind {
    NONE,
    UNBALANCED_ENTRY,         ///< sum(debit) != sum(credit); details carry both totals
    ZERO_VALUE_ENTRY,         ///< entry balances at zero
    INVALID_ACCOUNT,          ///< unknown, inactive or header account; details name the codes
    INVALID_LINE,             ///< line without exactly one positive side
    PERIOD_CLOSED,            ///< entry date falls in a HARD_CLOSE period
    PERIOD_HAS_UNPOSTED,      ///< period close blocked by draft/pending entries
    ALREADY_REVERSED,
    NOT_POSTED,
    REVERSAL_NOT_REVERSIBLE,  ///< target entry is itself a reversal
    INSUFFICIENT_BALANCE,
    OVERPAYMENT,              ///< repayment exceeds the total outstanding
    DUPLICATE_REFERENCE,      ///< external reference already used
    APPROVAL_DENIED,          ///< approver is the creator or over their limit
    NOT_FOUND,
    INVALID_STATE,            ///< illegal state-machine transition
    INVALID_AMOUNT,
    TRANSACTION_TIMEOUT,      ///< lock wait or execution time exceeded
    PERSISTENCE_FAILURE,      ///< unexpected failure inside a transaction; rolled back
    CONFIG_ERROR              ///< required account role not provisioned
};

std::string error_kind_to_string(ErrorKind kind);

/**
 * @brief A reported failure: kind, message and key/value specifics
 */
struct LedgerError {
    ErrorKind kind;
    std::string message;
    std::map<std::string, std::string> details;

    LedgerError() : kind(ErrorKind::NONE) {}
    LedgerError(ErrorKind kind_, const std::string& message_,
                std::map<std::string, std::string> details_ = {})
        : kind(kind_), message(message_), details(std::move(details_)) {}

    std::string detail(const std::string& key) const {
        auto it = details.find(key);
        return it == details.end() ? std::string() : it->second;
    }
};

/**
 * @brief Value-or-error returned by ledger operations
 *
 * Callers check success() and either read value() or propagate error().
 * Reading value() of a failed result is a programming error and throws.
 */
template <typename T>
class Result {
public:
    static Result ok(T value) {
        Result result;
        result.value_ = std::move(value);
        return result;
    }

    static Result fail(LedgerError error) {
        Result result;
        result.error_ = std::move(error);
        return result;
    }

    static Result fail(ErrorKind kind, const std::string& message,
                       std::map<std::string, std::string> details = {}) {
        return fail(LedgerError(kind, message, std::move(details)));
    }

    bool success() const { return value_.has_value(); }
    explicit operator bool() const { return success(); }

    const T& value() const {
        if (!value_) {
            throw std::logic_error("Result::value() on failed result: " + error_.message);
        }
        return *value_;
    }

    T& value() {
        if (!value_) {
            throw std::logic_error("Result::value() on failed result: " + error_.message);
        }
        return *value_;
    }

    const LedgerError& error() const { return error_; }
    ErrorKind kind() const { return error_.kind; }

private:
    Result() = default;

    std::optional<T> value_;
    LedgerError error_;
};

// Result for operations that produce nothing but success or failure
class Status {
public:
    static Status ok() { return Status(); }
    static Status fail(LedgerError error) {
        Status status;
        status.error_ = std::move(error);
        return status;
    }
    static Status fail(ErrorKind kind, const std::string& message,
                       std::map<std::string, std::string> details = {}) {
        return fail(LedgerError(kind, message, std::move(details)));
    }

    bool success() const { return error_.kind == ErrorKind::NONE; }
    explicit operator bool() const { return success(); }
    const LedgerError& error() const { return error_; }
    ErrorKind kind() const { return error_.kind; }

private:
    LedgerError error_;
};

/**
 * @brief Base exception for ledger configuration and programming errors
 */
class LedgerCoreError : public std::runtime_error {
public:
    explicit LedgerCoreError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised at startup when the chart of accounts or role bindings are invalid
 */
class ConfigurationError : public LedgerCoreError {
public:
    explicit ConfigurationError(const std::string& message)
        : LedgerCoreError("Configuration error: " + message) {}
};

} // namespace ledgercore

#endif // LEDGERCORE_LEDGER_ERROR_HPP
