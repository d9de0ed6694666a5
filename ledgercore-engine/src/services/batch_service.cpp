#include "batch_service.hpp"
#include "../logger.hpp"
#include <chrono>

namespace ledgercore {

namespace {

template <typename Select>
std::vector<uint64_t> collect_ids(const LedgerContext& ctx, Select&& select) {
    return ctx.read([&select](const LedgerStore& store) {
        return select(store);
    });
}

/**
 * @brief Run `process` once per id and tally the outcome
 *
 * @param process Callable (uint64_t id, BatchSummary&) -> Status
 */
template <typename Process>
BatchSummary run_job(const std::string& job, const std::vector<uint64_t>& ids, Process&& process) {
    auto start_time = std::chrono::steady_clock::now();

    BatchSummary summary;
    summary.job = job;

    for (uint64_t id : ids) {
        Status status = process(id, summary);
        if (status) {
            ++summary.processed;
        } else {
            ++summary.failed;
            summary.failures.push_back(BatchFailure{id, status.error()});
            Logger::get_instance().log_batch_item_failed(job, std::to_string(id), status.error());
        }
    }

    auto end_time = std::chrono::steady_clock::now();
    summary.elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    Logger::get_instance().log_batch_summary(job, summary.processed, summary.failed, summary.elapsed_ms);
    return summary;
}

} // namespace

BatchService::BatchService(LedgerContext& ctx, LoanService& loans, SavingsService& savings,
                           FixedDepositService& deposits)
    : ctx_(ctx), loans_(loans), savings_(savings), deposits_(deposits) {}

BatchSummary BatchService::mark_overdue(const Date& as_of) {
    auto ids = collect_ids(ctx_, [](const LedgerStore& store) {
        std::vector<uint64_t> result;
        for (const auto& pair : store.loans) {
            if (pair.second.status == LoanStatus::Active || pair.second.status == LoanStatus::Overdue) {
                result.push_back(pair.first);
            }
        }
        return result;
    });

    return run_job("mark_overdue", ids, [&](uint64_t loan_id, BatchSummary& summary) {
        auto marked = loans_.mark_overdue(loan_id, as_of);
        if (!marked) {
            return Status::fail(marked.error());
        }
        summary.affected += marked.value();
        return Status::ok();
    });
}

BatchSummary BatchService::accrue_fixed_deposits(const Date& as_of) {
    auto ids = collect_ids(ctx_, [](const LedgerStore& store) {
        std::vector<uint64_t> result;
        for (const auto& pair : store.fixed_deposits) {
            if (pair.second.status == DepositStatus::Active) {
                result.push_back(pair.first);
            }
        }
        return result;
    });

    return run_job("accrue_fixed_deposits", ids, [&](uint64_t deposit_id, BatchSummary& summary) {
        auto accrued = deposits_.accrue_interest(deposit_id, as_of);
        if (!accrued) {
            return Status::fail(accrued.error());
        }
        if (accrued.value().is_positive()) {
            ++summary.affected;
            summary.total_amount += accrued.value();
        }
        return Status::ok();
    });
}

BatchSummary BatchService::process_matured_deposits(const Date& as_of) {
    auto ids = collect_ids(ctx_, [&as_of](const LedgerStore& store) {
        std::vector<uint64_t> result;
        for (const auto& pair : store.fixed_deposits) {
            if (pair.second.status == DepositStatus::Active && !(as_of < pair.second.maturity_date)) {
                result.push_back(pair.first);
            }
        }
        return result;
    });

    return run_job("process_matured_deposits", ids, [&](uint64_t deposit_id, BatchSummary& summary) {
        auto matured = deposits_.process_maturity(deposit_id, as_of);
        if (!matured) {
            return Status::fail(matured.error());
        }
        ++summary.affected;
        summary.total_amount += matured.value().maturity_amount;
        return Status::ok();
    });
}

BatchSummary BatchService::post_savings_interest(const Date& as_of) {
    auto ids = collect_ids(ctx_, [](const LedgerStore& store) {
        std::vector<uint64_t> result;
        for (const auto& pair : store.savings_accounts) {
            if (pair.second.status == SavingsStatus::Active) {
                result.push_back(pair.first);
            }
        }
        return result;
    });

    return run_job("post_savings_interest", ids, [&](uint64_t account_id, BatchSummary& summary) {
        auto credited = savings_.post_interest(account_id, as_of);
        if (!credited) {
            return Status::fail(credited.error());
        }
        if (credited.value().is_positive()) {
            ++summary.affected;
            summary.total_amount += credited.value();
        }
        return Status::ok();
    });
}

std::vector<BatchSummary> BatchService::run_end_of_day(const Date& as_of) {
    std::vector<BatchSummary> summaries;
    summaries.push_back(mark_overdue(as_of));
    summaries.push_back(accrue_fixed_deposits(as_of));
    summaries.push_back(process_matured_deposits(as_of));
    return summaries;
}

} // namespace ledgercore
