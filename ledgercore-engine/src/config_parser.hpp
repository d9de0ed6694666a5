#ifndef LEDGERCORE_CONFIG_PARSER_HPP
#define LEDGERCORE_CONFIG_PARSER_HPP

#include "account_registry.hpp"
#include "ledger_store.hpp"
#include "logger.hpp"
#include "money.hpp"
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace ledgercore {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

struct CompanyInfo {
    std::string name;
    std::string base_currency;

    CompanyInfo() : base_currency("INR") {}
};

/**
 * @brief Everything needed to stand up a ledger
 */
struct LedgerConfig {
    CompanyInfo company;
    std::vector<AccountDefinition> accounts;
    std::map<AccountRole, std::string> account_roles;   ///< role -> account code
    TransactionLimits transactions;
    Decimal premature_penalty_rate;                     ///< percent of principal (default: 2)
    LoggerConfig logging;

    LedgerConfig() : premature_penalty_rate(2) {}
};

/**
 * @brief Parses a ledger configuration from a JSON file
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed configuration
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 * @throws ConfigurationError if the configuration is semantically invalid
 */
LedgerConfig parse_ledger_config_from_file(const std::string& file_path);

/**
 * @brief Parses a ledger configuration from a JSON string
 *
 * @throws ConfigParseError if JSON is invalid or a field has the wrong type
 * @throws ConfigurationError if the configuration is semantically invalid
 */
LedgerConfig parse_ledger_config_from_string(const std::string& json_string);

/**
 * @brief Semantic checks that do not need the registry
 *
 * Builds the chart once to apply its rules (duplicate codes, hierarchy,
 * opening balances), then checks limits and the penalty rate.
 *
 * @throws ConfigurationError
 */
void validate_ledger_config(const LedgerConfig& config);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace ledgercore

#endif // LEDGERCORE_CONFIG_PARSER_HPP
