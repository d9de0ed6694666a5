#include "period_control.hpp"
#include "logger.hpp"

namespace ledgercore {

bool is_valid_period_transition(PeriodStatus from, PeriodStatus to) {
    switch (from) {
        case PeriodStatus::Open:
            return to == PeriodStatus::SoftClose || to == PeriodStatus::HardClose;
        case PeriodStatus::SoftClose:
            return to == PeriodStatus::HardClose;
        default:
            return false;
    }
}

PeriodStatus period_status(const LedgerStore& store, const PeriodKey& period) {
    auto it = store.periods.find(period);
    return it == store.periods.end() ? PeriodStatus::Open : it->second.status;
}

PeriodStatus get_period_status(const LedgerContext& ctx, const Date& date) {
    return ctx.read([&date](const LedgerStore& store) {
        return period_status(store, date.period());
    });
}

Status check_period_open(const LedgerStore& store, const Date& date) {
    if (period_status(store, date.period()) == PeriodStatus::HardClose) {
        return Status::fail(ErrorKind::PERIOD_CLOSED,
                            "Financial period " + date.period().to_string() + " is closed",
                            {{"period", date.period().to_string()}, {"date", date.to_string()}});
    }
    return Status::ok();
}

size_t count_unposted_entries(const LedgerStore& store, const PeriodKey& period) {
    size_t count = 0;
    for (const auto& [id, entry] : store.entries) {
        if (entry.status != EntryStatus::Posted && entry.entry_date.period() == period) {
            ++count;
        }
    }
    return count;
}

Result<FinancialPeriod> close_period(Transaction& txn, const PeriodCloseRequest& request) {
    if (request.month < 1 || request.month > 12) {
        return Result<FinancialPeriod>::fail(
            ErrorKind::INVALID_STATE, "Month out of range: " + std::to_string(request.month));
    }

    const PeriodKey key{request.year, request.month};
    LedgerStore& store = txn.store();
    const PeriodStatus current = period_status(store, key);

    if (!is_valid_period_transition(current, request.close_type)) {
        return Result<FinancialPeriod>::fail(
            ErrorKind::INVALID_STATE,
            "Cannot move period " + key.to_string() + " from " +
                period_status_to_string(current) + " to " + period_status_to_string(request.close_type),
            {{"period", key.to_string()},
             {"from", period_status_to_string(current)},
             {"to", period_status_to_string(request.close_type)}});
    }

    const size_t unposted = count_unposted_entries(store, key);
    if (unposted > 0) {
        return Result<FinancialPeriod>::fail(
            ErrorKind::PERIOD_HAS_UNPOSTED,
            std::to_string(unposted) + " unposted entries remain in " + key.to_string(),
            {{"period", key.to_string()}, {"count", std::to_string(unposted)}});
    }

    auto it = store.periods.find(key);
    FinancialPeriod* period;
    if (it == store.periods.end()) {
        FinancialPeriod fresh;
        fresh.key = key;
        period = &txn.insert(store.periods, key, fresh);
    } else {
        period = &txn.modify(it->second);
    }

    period->status = request.close_type;
    period->closed_by = request.actor_id;
    period->notes = request.notes;
    period->closed_on = txn.today();

    return Result<FinancialPeriod>::ok(*period);
}

Result<FinancialPeriod> close_period(LedgerContext& ctx, const PeriodCloseRequest& request) {
    LogContext log_ctx("close_period", request.actor_id);
    const PeriodStatus previous = ctx.read([&request](const LedgerStore& store) {
        return period_status(store, PeriodKey{request.year, request.month});
    });

    auto result = with_transaction(ctx, log_ctx, [&request](Transaction& txn) {
        return close_period(txn, request);
    });
    if (!result) {
        Logger::get_instance().log_rejected(log_ctx, result.error());
        return result;
    }

    Logger::get_instance().log_period_closed(
        log_ctx,
        result.value().key.to_string(),
        period_status_to_string(previous),
        period_status_to_string(result.value().status));
    return result;
}

} // namespace ledgercore
