#include "reference_generator.hpp"
#include "ledger_store.hpp"
#include <iomanip>
#include <sstream>

namespace ledgercore {

std::string format_reference(const std::string& prefix, const Date& date, uint64_t sequence) {
    std::ostringstream oss;
    oss << prefix
        << std::setw(4) << std::setfill('0') << date.year()
        << std::setw(2) << std::setfill('0') << date.month()
        << std::setw(2) << std::setfill('0') << date.day()
        << std::setw(6) << std::setfill('0') << sequence;
    return oss.str();
}

std::string next_reference(Transaction& txn, const std::string& prefix, const Date& date) {
    const std::string key = format_reference(prefix, date, 0).substr(0, prefix.size() + 8);
    auto& sequences = txn.store().sequences;

    uint64_t issued;
    auto it = sequences.find(key);
    if (it == sequences.end()) {
        issued = 1;
        txn.insert(sequences, key, issued);
    } else {
        issued = ++txn.modify(it->second);
    }
    return format_reference(prefix, date, issued);
}

} // namespace ledgercore
