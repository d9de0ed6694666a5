#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ledgercore {
namespace io {

namespace {

struct Layout {
    std::string indent;
    std::string newline;
    std::string space;

    explicit Layout(bool pretty_print)
        : indent(pretty_print ? "  " : ""),
          newline(pretty_print ? "\n" : ""),
          space(pretty_print ? " " : "") {}

    std::string at(int depth) const {
        std::string result;
        for (int i = 0; i < depth; ++i) {
            result += indent;
        }
        return result;
    }
};

std::ofstream open_output(const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    return file;
}

} // namespace

std::string escape_json(const std::string& value) {
    std::ostringstream escaped;
    for (char c : value) {
        switch (c) {
            case '"': escaped << "\\\""; break;
            case '\\': escaped << "\\\\"; break;
            case '\b': escaped << "\\b"; break;
            case '\f': escaped << "\\f"; break;
            case '\n': escaped << "\\n"; break;
            case '\r': escaped << "\\r"; break;
            case '\t': escaped << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    escaped << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(c) << std::dec << std::setfill(' ');
                } else {
                    escaped << c;
                }
        }
    }
    return escaped.str();
}

void write_schedule_json(std::ostream& os, const LoanTerms& terms,
                         const AmortizationSchedule& schedule, bool pretty_print) {
    const Layout l(pretty_print);

    os << "{" << l.newline;

    // Terms section
    os << l.at(1) << "\"terms\":" << l.space << "{" << l.newline;
    os << l.at(2) << "\"principal\":" << l.space << terms.principal << "," << l.newline;
    os << l.at(2) << "\"annual_rate\":" << l.space << terms.annual_rate.str() << "," << l.newline;
    os << l.at(2) << "\"tenure_months\":" << l.space << terms.tenure_months << "," << l.newline;
    os << l.at(2) << "\"method\":" << l.space << "\"" << amortization_method_to_string(terms.method)
       << "\"," << l.newline;
    os << l.at(2) << "\"start_date\":" << l.space << "\"" << terms.start_date.to_string() << "\""
       << l.newline;
    os << l.at(1) << "}," << l.newline;

    os << l.at(1) << "\"emi\":" << l.space << schedule.emi << "," << l.newline;
    os << l.at(1) << "\"total_interest\":" << l.space << schedule.total_interest << "," << l.newline;
    os << l.at(1) << "\"total_repayment\":" << l.space << schedule.total_repayment << "," << l.newline;

    os << l.at(1) << "\"installments\":" << l.space << "[";
    for (size_t i = 0; i < schedule.installments.size(); ++i) {
        const Installment& inst = schedule.installments[i];
        os << (i > 0 ? "," : "") << l.newline;
        os << l.at(2) << "{"
           << "\"number\":" << l.space << inst.number << "," << l.space
           << "\"due_date\":" << l.space << "\"" << inst.due_date.to_string() << "\"," << l.space
           << "\"principal\":" << l.space << inst.principal_due << "," << l.space
           << "\"interest\":" << l.space << inst.interest_due << "," << l.space
           << "\"total\":" << l.space << inst.total_due << "," << l.space
           << "\"closing_balance\":" << l.space << inst.closing_balance
           << "}";
    }
    if (!schedule.installments.empty()) {
        os << l.newline << l.at(1);
    }
    os << "]" << l.newline;

    os << "}" << l.newline;
}

void write_schedule_json(const std::string& filepath, const LoanTerms& terms,
                         const AmortizationSchedule& schedule, bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_schedule_json(file, terms, schedule, pretty_print);
}

void write_trial_balance_json(std::ostream& os, const TrialBalance& trial_balance,
                              bool pretty_print) {
    const Layout l(pretty_print);

    os << "{" << l.newline;
    os << l.at(1) << "\"as_of\":" << l.space << "\"" << trial_balance.as_of.to_string() << "\","
       << l.newline;

    os << l.at(1) << "\"rows\":" << l.space << "[";
    for (size_t i = 0; i < trial_balance.rows.size(); ++i) {
        const TrialBalanceRow& row = trial_balance.rows[i];
        os << (i > 0 ? "," : "") << l.newline;
        os << l.at(2) << "{"
           << "\"code\":" << l.space << "\"" << escape_json(row.code) << "\"," << l.space
           << "\"name\":" << l.space << "\"" << escape_json(row.name) << "\"," << l.space
           << "\"type\":" << l.space << "\"" << account_type_to_string(row.type) << "\"," << l.space
           << "\"debit\":" << l.space << row.debit << "," << l.space
           << "\"credit\":" << l.space << row.credit
           << "}";
    }
    if (!trial_balance.rows.empty()) {
        os << l.newline << l.at(1);
    }
    os << "]," << l.newline;

    os << l.at(1) << "\"total_debit\":" << l.space << trial_balance.total_debit << "," << l.newline;
    os << l.at(1) << "\"total_credit\":" << l.space << trial_balance.total_credit << "," << l.newline;
    os << l.at(1) << "\"balanced\":" << l.space << (trial_balance.balanced() ? "true" : "false")
       << l.newline;
    os << "}" << l.newline;
}

void write_trial_balance_json(const std::string& filepath, const TrialBalance& trial_balance,
                              bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_trial_balance_json(file, trial_balance, pretty_print);
}

void write_account_ledger_json(std::ostream& os, const AccountLedger& ledger, bool pretty_print) {
    const Layout l(pretty_print);

    os << "{" << l.newline;
    os << l.at(1) << "\"code\":" << l.space << "\"" << escape_json(ledger.code) << "\"," << l.newline;
    os << l.at(1) << "\"name\":" << l.space << "\"" << escape_json(ledger.name) << "\"," << l.newline;
    os << l.at(1) << "\"start\":" << l.space << "\"" << ledger.start.to_string() << "\"," << l.newline;
    os << l.at(1) << "\"end\":" << l.space << "\"" << ledger.end.to_string() << "\"," << l.newline;
    os << l.at(1) << "\"opening_balance\":" << l.space << ledger.opening_balance << "," << l.newline;

    os << l.at(1) << "\"lines\":" << l.space << "[";
    for (size_t i = 0; i < ledger.lines.size(); ++i) {
        const LedgerLine& line = ledger.lines[i];
        os << (i > 0 ? "," : "") << l.newline;
        os << l.at(2) << "{"
           << "\"date\":" << l.space << "\"" << line.entry_date.to_string() << "\"," << l.space
           << "\"entry_number\":" << l.space << "\"" << escape_json(line.entry_number) << "\"," << l.space
           << "\"description\":" << l.space << "\"" << escape_json(line.description) << "\"," << l.space
           << "\"debit\":" << l.space << line.debit << "," << l.space
           << "\"credit\":" << l.space << line.credit << "," << l.space
           << "\"balance\":" << l.space << line.running_balance
           << "}";
    }
    if (!ledger.lines.empty()) {
        os << l.newline << l.at(1);
    }
    os << "]," << l.newline;

    os << l.at(1) << "\"closing_balance\":" << l.space << ledger.closing_balance << l.newline;
    os << "}" << l.newline;
}

} // namespace io
} // namespace ledgercore
