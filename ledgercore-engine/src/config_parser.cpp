#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ledgercore {

namespace {

std::string string_field(const json& j, const char* key) {
    return expand_environment_variables(j.at(key).get<std::string>());
}

// Amounts are strings ("1500.00") so no value passes through a double
Money money_field(const json& j, const char* key, const std::string& owner) {
    const json& value = j.at(key);
    std::string text = value.is_string() ? expand_environment_variables(value.get<std::string>())
                                         : value.dump();
    try {
        return Money::parse(text);
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError(owner + ": invalid amount for '" + key + "': " + e.what());
    }
}

AccountDefinition parse_account(const json& account_json) {
    AccountDefinition def;

    if (!account_json.contains("code")) {
        throw ConfigParseError("Account missing required field: code");
    }
    def.code = string_field(account_json, "code");

    if (!account_json.contains("name")) {
        throw ConfigParseError("Account '" + def.code + "' missing required field: name");
    }
    def.name = string_field(account_json, "name");

    if (!account_json.contains("type")) {
        throw ConfigParseError("Account '" + def.code + "' missing required field: type");
    }
    try {
        def.type = account_type_from_string(account_json["type"].get<std::string>());
        if (account_json.contains("normal_balance")) {
            def.normal_side = balance_side_from_string(account_json["normal_balance"].get<std::string>());
        }
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError("Account '" + def.code + "': " + e.what());
    }

    if (account_json.contains("header")) {
        def.header = account_json["header"].get<bool>();
    }
    if (account_json.contains("active")) {
        def.active = account_json["active"].get<bool>();
    }
    if (account_json.contains("parent") && !account_json["parent"].is_null()) {
        def.parent_code = string_field(account_json, "parent");
    }
    if (account_json.contains("opening_balance")) {
        def.opening_balance = money_field(account_json, "opening_balance", "Account '" + def.code + "'");
    }

    return def;
}

} // namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++;

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        size_t name_end = pos;

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated "${": leave it as written
                pos = name_end;
                continue;
            }
            pos++;
        }

        if (name_end == name_start) {
            // A lone '$' is not a reference
            pos = start + 1;
            continue;
        }

        std::string var_name = result.substr(name_start, name_end - name_start);
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

void validate_ledger_config(const LedgerConfig& config) {
    if (config.accounts.empty()) {
        throw ConfigurationError("chart of accounts is empty");
    }

    // Chart rules (codes, hierarchy, opening balances) live in the registry
    AccountRegistry chart(config.accounts);

    if (config.transactions.max_wait_ms == 0 || config.transactions.timeout_ms == 0) {
        throw ConfigurationError("transaction limits must be positive");
    }
    if (config.premature_penalty_rate < 0) {
        throw ConfigurationError("premature_penalty_rate must not be negative");
    }
}

LedgerConfig parse_ledger_config_from_string(const std::string& json_string) {
    LedgerConfig config;

    try {
        json j = json::parse(json_string);

        if (j.contains("company")) {
            const json& company = j["company"];
            if (company.contains("name")) {
                config.company.name = string_field(company, "name");
            }
            if (company.contains("base_currency")) {
                config.company.base_currency = string_field(company, "base_currency");
            }
        }

        // Parse accounts (required)
        if (!j.contains("accounts")) {
            throw ConfigParseError("Missing required field: accounts");
        }
        for (const auto& account_json : j["accounts"]) {
            config.accounts.push_back(parse_account(account_json));
        }

        // Parse account_roles (optional map of role name -> account code)
        if (j.contains("account_roles")) {
            std::vector<std::string> unknown;
            for (auto it = j["account_roles"].begin(); it != j["account_roles"].end(); ++it) {
                auto role = account_role_from_string(it.key());
                if (!role) {
                    unknown.push_back(it.key());
                    continue;
                }
                config.account_roles[*role] = expand_environment_variables(it.value().get<std::string>());
            }
            if (!unknown.empty()) {
                std::string names;
                for (const auto& name : unknown) {
                    names += (names.empty() ? "" : ", ") + name;
                }
                throw ConfigurationError("unknown account roles: " + names);
            }
        }

        if (j.contains("transactions")) {
            const json& txn = j["transactions"];
            if (txn.contains("max_wait_ms")) {
                config.transactions.max_wait_ms = txn["max_wait_ms"].get<size_t>();
            }
            if (txn.contains("timeout_ms")) {
                config.transactions.timeout_ms = txn["timeout_ms"].get<size_t>();
            }
        }

        if (j.contains("fixed_deposits") && j["fixed_deposits"].contains("premature_penalty_rate")) {
            const json& rate = j["fixed_deposits"]["premature_penalty_rate"];
            std::string text = rate.is_string() ? rate.get<std::string>() : rate.dump();
            try {
                config.premature_penalty_rate = Decimal(text);
            } catch (const std::runtime_error&) {
                throw ConfigParseError("Invalid premature_penalty_rate: " + text);
            }
        }

        if (j.contains("logging")) {
            const json& logging = j["logging"];
            if (logging.contains("level")) {
                config.logging.min_level = string_to_level(logging["level"].get<std::string>());
            }
            if (logging.contains("json")) {
                config.logging.enable_json = logging["json"].get<bool>();
            }
            if (logging.contains("console")) {
                config.logging.enable_console = logging["console"].get<bool>();
            }
            if (logging.contains("file") && !logging["file"].is_null()) {
                config.logging.enable_file = true;
                config.logging.log_file_path = string_field(logging, "file");
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON missing field: ") + e.what());
    }

    validate_ledger_config(config);

    return config;
}

LedgerConfig parse_ledger_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    LedgerConfig config = parse_ledger_config_from_string(buffer.str());

    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace ledgercore
