#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include "amortization.hpp"
#include "balance_projector.hpp"
#include "config_parser.hpp"
#include "ledger_system.hpp"
#include "logger.hpp"
#include "io/json_writer.hpp"

using namespace ledgercore;

namespace {

struct CLIArgs {
    std::string config_path;
    bool schedule = false;
    std::string principal;
    std::string rate;
    unsigned tenure_months = 0;
    std::string method = "reducing";
    std::string start_date;
    bool trial_balance = false;
    std::string output_path;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "LedgerCore v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Configuration:\n";
    std::cerr << "  --config <path>             JSON ledger configuration (chart, roles, limits)\n\n";
    std::cerr << "Amortization schedule:\n";
    std::cerr << "  --schedule                  Print an installment schedule\n";
    std::cerr << "  --principal <amount>        Loan principal, e.g. 1200000.00\n";
    std::cerr << "  --rate <percent>            Annual interest rate in percent, e.g. 24\n";
    std::cerr << "  --tenure <months>           Number of monthly installments\n";
    std::cerr << "  --method <reducing|flat>    Interest method (default: reducing)\n";
    std::cerr << "  --start <YYYY-MM-DD>        Disbursement date (default: today)\n\n";
    std::cerr << "Reports (require --config):\n";
    std::cerr << "  --trial-balance             Print the opening trial balance\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n";
    std::cerr << "  1. Validate a configuration and print its trial balance:\n";
    std::cerr << "     " << program_name << " --config ledger_config.json --trial-balance\n\n";
    std::cerr << "  2. 12-month reducing-balance schedule:\n";
    std::cerr << "     " << program_name << " --schedule --principal 1200000 --rate 24 \\\n";
    std::cerr << "         --tenure 12 --start 2024-01-15 --output schedule.json\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--schedule") {
            args.schedule = true;
        } else if (arg == "--principal" && i + 1 < argc) {
            args.principal = argv[++i];
        } else if (arg == "--rate" && i + 1 < argc) {
            args.rate = argv[++i];
        } else if (arg == "--tenure" && i + 1 < argc) {
            args.tenure_months = static_cast<unsigned>(std::stoul(argv[++i]));
        } else if (arg == "--method" && i + 1 < argc) {
            args.method = argv[++i];
        } else if (arg == "--start" && i + 1 < argc) {
            args.start_date = argv[++i];
        } else if (arg == "--trial-balance") {
            args.trial_balance = true;
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (!args.schedule && !args.trial_balance && args.config_path.empty()) {
        std::cerr << "Error: Nothing to do; use --config, --schedule or --trial-balance\n";
        valid = false;
    }

    if (args.schedule) {
        if (args.principal.empty()) {
            std::cerr << "Error: --principal is required with --schedule\n";
            valid = false;
        }
        if (args.rate.empty()) {
            std::cerr << "Error: --rate is required with --schedule\n";
            valid = false;
        }
        if (args.tenure_months == 0) {
            std::cerr << "Error: --tenure must be a positive number of months\n";
            valid = false;
        }
    }

    if (args.trial_balance && args.config_path.empty()) {
        std::cerr << "Error: --trial-balance requires --config\n";
        valid = false;
    }

    if (args.schedule && args.trial_balance && !args.output_path.empty()) {
        std::cerr << "Error: --output takes a single report; choose --schedule or --trial-balance\n";
        valid = false;
    }

    return valid;
}

// Every role a product service posts to must resolve at startup
void check_required_roles(const LedgerSystem& system) {
    std::vector<AccountRole> required;
    for (const auto* roles : {&LoanService::required_roles(), &SavingsService::required_roles(),
                              &FixedDepositService::required_roles()}) {
        required.insert(required.end(), roles->begin(), roles->end());
    }
    RoleBindings::resolve(system.context().registry(), system.config().account_roles, required);
}

int run_schedule(const CLIArgs& args) {
    LoanTerms terms;
    terms.principal = Money::parse(args.principal);
    terms.annual_rate = Decimal(args.rate);
    terms.tenure_months = args.tenure_months;
    terms.method = amortization_method_from_string(args.method);
    terms.start_date = args.start_date.empty() ? Date::today() : Date::parse(args.start_date);

    AmortizationSchedule schedule = calculate_schedule(terms);

    std::cerr << "Schedule: " << amortization_method_to_string(terms.method)
              << " EMI " << schedule.emi
              << " total interest " << schedule.total_interest << "\n";

    if (args.output_path.empty()) {
        io::write_schedule_json(std::cout, terms, schedule);
    } else {
        io::write_schedule_json(args.output_path, terms, schedule);
        std::cerr << "Schedule written to: " << args.output_path << "\n";
    }
    return 0;
}

int run_trial_balance(const CLIArgs& args, const LedgerSystem& system) {
    const LedgerContext& ctx = system.context();
    TrialBalance trial_balance = generate_trial_balance(ctx, ctx.today());

    if (args.output_path.empty() || args.schedule) {
        io::write_trial_balance_json(std::cout, trial_balance);
    } else {
        io::write_trial_balance_json(args.output_path, trial_balance);
        std::cerr << "Trial balance written to: " << args.output_path << "\n";
    }
    return trial_balance.balanced() ? 0 : 2;
}

} // namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Error: Invalid numeric argument: " << e.what() << "\n";
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    try {
        std::unique_ptr<LedgerSystem> system;
        if (!args.config_path.empty()) {
            LedgerConfig config = parse_ledger_config_from_file(args.config_path);
            Logger::get_instance().configure(config.logging);

            system = std::make_unique<LedgerSystem>(config);
            check_required_roles(*system);

            std::cerr << "LedgerCore v1.0.0\n";
            std::cerr << "Configuration:\n";
            std::cerr << "  Company:     " << config.company.name << "\n";
            std::cerr << "  Currency:    " << config.company.base_currency << "\n";
            std::cerr << "  Accounts:    " << config.accounts.size() << "\n";
            std::cerr << "  Roles:       " << config.account_roles.size() << "\n";
            std::cerr << "  Max wait:    " << config.transactions.max_wait_ms << " ms\n";
            std::cerr << "  Timeout:     " << config.transactions.timeout_ms << " ms\n";
        }

        int exit_code = 0;
        if (args.schedule) {
            exit_code = run_schedule(args);
        }
        if (args.trial_balance && exit_code == 0) {
            exit_code = run_trial_balance(args, *system);
        }

        Logger::get_instance().flush();
        return exit_code;

    } catch (const ConfigParseError& e) {
        std::cerr << "Error: Failed to load configuration: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
